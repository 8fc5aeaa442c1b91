#pragma once

#include <handleguard/core/Error.hpp>
#include <handleguard/core/HandleCell.hpp>
#include <handleguard/dispatch/WindowProc.hpp>
#include <handleguard/native/NativeRuntime.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace HG::Dispatch {

// Window class registered on first use for windows whose procedure is ours.
inline constexpr std::string_view kPrimaryClassName = "handleguard_window";

struct WindowSpec {
    // Empty for a window of kPrimaryClassName; otherwise a native control
    // class that is subclassed after creation.
    std::optional<std::string>          control_class;
    std::string                         text;
    std::uint32_t                       style    = 0;
    std::uint32_t                       ex_style = 0;
    Native::NativeHandle                parent   = Native::NativeHandle::none();
    std::optional<Native::Point>        position;
    std::optional<Native::Size>         size;
};

/**
 * Owning side of one native window created with a DispatchState attached.
 *
 * Primary windows receive their DispatchState through the creation
 * parameters and are associated before the first message. Native controls
 * are created first and subclassed afterwards; messages they receive before
 * the subclass is installed take the control's default path.
 *
 * Releasing a CreatedWindow whose native peer is still alive destroys the
 * peer. The HandleCell is shared with the DispatchState, which clears it on
 * the terminal notification.
 */
class CreatedWindow {
public:
    ~CreatedWindow();

    CreatedWindow(CreatedWindow const&)            = delete;
    CreatedWindow& operator=(CreatedWindow const&) = delete;

    static auto Create(std::shared_ptr<Native::NativeRuntime> runtime, std::unique_ptr<WindowProc> proc, WindowSpec const& spec)
            -> Expected<std::unique_ptr<CreatedWindow>>;

    // Requests destruction of a live peer; succeeds without a native call otherwise.
    auto destroy() -> Expected<void>;

    [[nodiscard]] auto handle() const -> Native::NativeHandle { return this->handleCell->get(); }
    [[nodiscard]] auto live() const -> bool { return this->handleCell->present(); }
    [[nodiscard]] auto runtime() const -> Native::NativeRuntime& { return *this->nativeRuntime; }
    [[nodiscard]] auto cell() const -> std::shared_ptr<HandleCell> const& { return this->handleCell; }

private:
    CreatedWindow(std::shared_ptr<Native::NativeRuntime> runtime, std::shared_ptr<HandleCell> cell);

    static auto create_primary(std::shared_ptr<Native::NativeRuntime> const& runtime,
                               std::shared_ptr<HandleCell> const& cell,
                               std::unique_ptr<WindowProc> proc,
                               WindowSpec const& spec) -> Expected<void>;
    static auto create_control(std::shared_ptr<Native::NativeRuntime> const& runtime,
                               std::shared_ptr<HandleCell> const& cell,
                               std::unique_ptr<WindowProc> proc,
                               WindowSpec const& spec) -> Expected<void>;

    std::shared_ptr<Native::NativeRuntime> nativeRuntime;
    std::shared_ptr<HandleCell>            handleCell;
};

} // namespace HG::Dispatch
