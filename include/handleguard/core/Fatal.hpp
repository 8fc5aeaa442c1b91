#pragma once

#include <string_view>

namespace HG {

// Reports an unrecoverable condition on stderr and aborts the process.
// Reserved for states where continuing would risk use-after-free across
// the native call boundary.
[[noreturn]] void FatalError(std::string_view reason) noexcept;

} // namespace HG
