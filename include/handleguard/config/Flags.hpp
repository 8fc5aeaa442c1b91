#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace HG::Config {

// Interprets an environment value: unset is false, empty is true, and
// "0", "false", "off", "no" (any case, surrounding blanks ignored) are false.
[[nodiscard]] auto ParseTruthy(char const* value) -> bool;

[[nodiscard]] auto EnvFlag(std::string_view name) -> bool;

// Comma separated list; entries are trimmed and empty entries dropped.
[[nodiscard]] auto EnvList(std::string_view name) -> std::vector<std::string>;

// HANDLEGUARD_LOG or HANDLEGUARD_LOG_ENABLED.
[[nodiscard]] auto LoggingRequested() -> bool;

// HANDLEGUARD_TRACE_DISPATCH; read once per process.
[[nodiscard]] auto DispatchTraceEnabled() -> bool;

} // namespace HG::Config
