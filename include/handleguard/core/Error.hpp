#pragma once
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace HG {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NativeFailure,
        Destroyed,
        UnsupportedFormat,
        InvalidArgument
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Error(Code c, std::string m, std::uint32_t native)
        : code(c), message(std::move(m)), native_code(native) {}

    Code                       code;
    std::optional<std::string> message;
    // Foreign runtime error code; only meaningful for NativeFailure.
    std::uint32_t              native_code = 0;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NativeFailure:
        return "native_failure";
    case Error::Code::Destroyed:
        return "destroyed";
    case Error::Code::UnsupportedFormat:
        return "unsupported_format";
    case Error::Code::InvalidArgument:
        return "invalid_argument";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    std::string description{label};
    if (error.code == Error::Code::NativeFailure) {
        description.append("(");
        description.append(std::to_string(error.native_code));
        description.append(")");
    }
    if (error.message && !error.message->empty()) {
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
    }
    return description;
}

[[nodiscard]] inline auto destroyedError(std::string_view operation) -> Error {
    return Error{Error::Code::Destroyed, std::string{operation} + ": window has been destroyed"};
}

[[nodiscard]] inline auto nativeError(std::uint32_t native, std::string message) -> Error {
    return Error{Error::Code::NativeFailure, std::move(message), native};
}

} // namespace HG
