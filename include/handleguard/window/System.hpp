#pragma once

#include <handleguard/core/Error.hpp>
#include <handleguard/native/NativeRuntime.hpp>
#include <handleguard/window/WindowNode.hpp>

#include <memory>

namespace HG::UI {

/**
 * Entry point of the window layer. Cheap to copy; copies share one runtime,
 * so callbacks can capture a System by value.
 */
class System {
public:
    // A null runtime selects the current process-wide runtime. When none has
    // been installed that is an in-process HeadlessRuntime, installed on first
    // use with a warning: there is no platform backend to fall back to, so
    // windows made this way are never shown on screen.
    explicit System(std::shared_ptr<Native::NativeRuntime> runtime = nullptr);

    auto new_main(MainWindowOptions const& options = {}) const -> Expected<Window>;

    // Pumps and dispatches messages until exit_loop() is requested and
    // returns its exit code. Fails when the runtime runs out of messages
    // without a quit request, since nothing could wake the loop again.
    auto event_loop() const -> Expected<int>;

    // Asks the running (or next) event loop to return `exit_code`.
    auto exit_loop(int exit_code = 0) const -> void;

    [[nodiscard]] auto runtime() const -> std::shared_ptr<Native::NativeRuntime> const& { return this->nativeRuntime; }

private:
    std::shared_ptr<Native::NativeRuntime> nativeRuntime;
};

} // namespace HG::UI
