#include <handleguard/dispatch/CreatedWindow.hpp>

#include <handleguard/dispatch/DispatchState.hpp>
#include <handleguard/dispatch/Router.hpp>
#include <handleguard/log/TaggedLogger.hpp>

#include <utility>

namespace HG::Dispatch {
namespace {

auto make_request(WindowSpec const& spec, std::string class_name) -> Native::CreateRequest {
    Native::CreateRequest request;
    request.class_name = std::move(class_name);
    request.text       = spec.text;
    request.style      = spec.style;
    request.ex_style   = spec.ex_style;
    request.parent     = spec.parent;
    request.position   = spec.position;
    request.size       = spec.size;
    return request;
}

auto ensure_primary_class(Native::NativeRuntime& runtime) -> Expected<void> {
    if (runtime.class_registered(kPrimaryClassName)) {
        return {};
    }
    return runtime.register_class(Native::WindowClass{std::string{kPrimaryClassName}, &PrimaryEntry});
}

} // namespace

CreatedWindow::CreatedWindow(std::shared_ptr<Native::NativeRuntime> runtime, std::shared_ptr<HandleCell> cell)
    : nativeRuntime(std::move(runtime)), handleCell(std::move(cell)) {}

CreatedWindow::~CreatedWindow() {
    if (!this->handleCell->present()) {
        return;
    }
    if (auto destroyed = this->nativeRuntime->destroy_window(this->handleCell->get()); !destroyed) {
        hg_log("Releasing window failed: " + describeError(destroyed.error()), "Window", "ERROR");
    }
}

auto CreatedWindow::Create(std::shared_ptr<Native::NativeRuntime> runtime, std::unique_ptr<WindowProc> proc, WindowSpec const& spec)
        -> Expected<std::unique_ptr<CreatedWindow>> {
    if (!runtime || !proc) {
        return std::unexpected(Error{Error::Code::InvalidArgument, "CreatedWindow::Create: runtime and procedure are required"});
    }
    auto cell    = std::make_shared<HandleCell>();
    auto created = spec.control_class ? create_control(runtime, cell, std::move(proc), spec)
                                      : create_primary(runtime, cell, std::move(proc), spec);
    if (!created) {
        return std::unexpected(created.error());
    }
    return std::unique_ptr<CreatedWindow>(new CreatedWindow(std::move(runtime), std::move(cell)));
}

auto CreatedWindow::create_primary(std::shared_ptr<Native::NativeRuntime> const& runtime,
                                   std::shared_ptr<HandleCell> const& cell,
                                   std::unique_ptr<WindowProc> proc,
                                   WindowSpec const& spec) -> Expected<void> {
    if (auto registered = ensure_primary_class(*runtime); !registered) {
        return std::unexpected(registered.error());
    }

    // Lives across create_window; an unadopted state is released with it.
    PendingAdoption pending{std::make_unique<DispatchState>(cell, std::move(proc))};
    auto request          = make_request(spec, std::string{kPrimaryClassName});
    request.create_params = &pending;

    auto handle = runtime->create_window(request);
    if (!handle) {
        return std::unexpected(handle.error());
    }
    if (pending.state) {
        // The class procedure never saw the pre-creation message.
        return std::unexpected(Error{Error::Code::UnknownError, "create_window: dispatch state was not adopted"});
    }
    return {};
}

auto CreatedWindow::create_control(std::shared_ptr<Native::NativeRuntime> const& runtime,
                                   std::shared_ptr<HandleCell> const& cell,
                                   std::unique_ptr<WindowProc> proc,
                                   WindowSpec const& spec) -> Expected<void> {
    if (auto controls = runtime->init_common_controls(); !controls) {
        return std::unexpected(controls.error());
    }
    auto handle = runtime->create_window(make_request(spec, *spec.control_class));
    if (!handle) {
        return std::unexpected(handle.error());
    }

    auto state = std::make_unique<DispatchState>(cell, std::move(proc));
    if (!cell->set(*handle)) {
        return std::unexpected(Error{Error::Code::UnknownError, "create_window: handle cell already assigned"});
    }
    auto subclassed = runtime->set_subclass(*handle, &SubclassEntry, kSubclassId, reinterpret_cast<std::uintptr_t>(state.get()));
    if (!subclassed) {
        cell->clear();
        if (auto destroyed = runtime->destroy_window(*handle); !destroyed) {
            hg_log("Destroying unsubclassed control failed: " + describeError(destroyed.error()), "Window", "ERROR");
        }
        return std::unexpected(subclassed.error());
    }
    // Owned by the router from here on.
    state.release();
    return {};
}

auto CreatedWindow::destroy() -> Expected<void> {
    if (!this->handleCell->present()) {
        return {};
    }
    return this->nativeRuntime->destroy_window(this->handleCell->get());
}

} // namespace HG::Dispatch
