#include <handleguard/window/System.hpp>

#include <handleguard/log/TaggedLogger.hpp>

#include <utility>

namespace HG::UI {

System::System(std::shared_ptr<Native::NativeRuntime> runtime)
    : nativeRuntime(runtime ? std::move(runtime) : Native::CurrentRuntimeShared()) {}

auto System::new_main(MainWindowOptions const& options) const -> Expected<Window> {
    return WindowNode::CreateMain(this->nativeRuntime, options);
}

auto System::event_loop() const -> Expected<int> {
    hg_log("Entering event loop", "System", "INFO");
    Native::NativeMessage message;
    std::size_t           dispatched = 0;
    while (true) {
        switch (this->nativeRuntime->get_message(message)) {
        case Native::PumpResult::Message:
            this->nativeRuntime->dispatch_message(message);
            ++dispatched;
            break;
        case Native::PumpResult::Quit: {
            auto const code = this->nativeRuntime->quit_code();
            hg_log("Leaving event loop after " + std::to_string(dispatched) + " messages, code " + std::to_string(code), "System", "INFO");
            return code;
        }
        case Native::PumpResult::Idle:
            hg_log("Event loop ran out of messages without a quit request", "System", "ERROR");
            return std::unexpected(Error{Error::Code::UnknownError, "event_loop: no messages left and no quit requested"});
        }
    }
}

auto System::exit_loop(int exit_code) const -> void {
    this->nativeRuntime->post_quit(exit_code);
}

} // namespace HG::UI
