#include <handleguard/config/Flags.hpp>

#include <array>
#include <cctype>
#include <cstdlib>
#include <string>
#include <string_view>

namespace {

constexpr auto kLogFlags = std::to_array({
    "HANDLEGUARD_LOG",
    "HANDLEGUARD_LOG_ENABLED",
});

auto is_blank(char ch) -> bool {
    return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r';
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && is_blank(text.front())) {
        text.remove_prefix(1);
    }
    while (!text.empty() && is_blank(text.back())) {
        text.remove_suffix(1);
    }
    return text;
}

auto read_env(std::string_view name) -> char const* {
    std::string key{name};
    return std::getenv(key.c_str());
}

} // namespace

namespace HG::Config {

auto ParseTruthy(char const* value) -> bool {
    if (value == nullptr) {
        return false;
    }
    auto text = trim(std::string_view{value});
    if (text.empty()) {
        return true;
    }
    std::string normalized;
    normalized.reserve(text.size());
    for (char ch : text) {
        normalized.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    }
    if (normalized == "0" || normalized == "false" || normalized == "off" || normalized == "no") {
        return false;
    }
    return true;
}

auto EnvFlag(std::string_view name) -> bool {
    return ParseTruthy(read_env(name));
}

auto EnvList(std::string_view name) -> std::vector<std::string> {
    std::vector<std::string> entries;
    auto const* raw = read_env(name);
    if (raw == nullptr) {
        return entries;
    }
    std::string_view rest{raw};
    while (!rest.empty()) {
        auto comma = rest.find(',');
        auto token = trim(rest.substr(0, comma));
        if (!token.empty()) {
            entries.emplace_back(token);
        }
        if (comma == std::string_view::npos) {
            break;
        }
        rest.remove_prefix(comma + 1);
    }
    return entries;
}

auto LoggingRequested() -> bool {
    for (auto const* name : kLogFlags) {
        if (EnvFlag(name)) {
            return true;
        }
    }
    return false;
}

auto DispatchTraceEnabled() -> bool {
    static bool enabled = EnvFlag("HANDLEGUARD_TRACE_DISPATCH");
    return enabled;
}

} // namespace HG::Config
