#include <handleguard/core/Error.hpp>

#include <doctest/doctest.h>

#include <string>
#include <utility>
#include <vector>

using namespace HG;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::InvalidArgument);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            if (code == Error::Code::NativeFailure) {
                continue;
            }
            // describeError echoes the label when the message is empty.
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::InvalidArgument, "bad"};
        CHECK(describeError(withMsg) == "invalid_argument:bad");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("Native failures carry the foreign code") {
        auto error = nativeError(1400, "destroy_window: invalid window handle");
        CHECK(error.code == Error::Code::NativeFailure);
        CHECK(error.native_code == 1400);
        CHECK(describeError(error) == "native_failure(1400):destroy_window: invalid window handle");
    }

    TEST_CASE("Errors take ownership of their message") {
        std::string text = "pixel buffer rejected";
        Error       error{Error::Code::UnsupportedFormat, std::move(text)};
        REQUIRE(error.message.has_value());
        CHECK(*error.message == "pixel buffer rejected");

        Expected<int> failed = std::unexpected(std::move(error));
        REQUIRE_FALSE(failed.has_value());
        CHECK(describeError(failed.error()) == "unsupported_format:pixel buffer rejected");
    }

    TEST_CASE("Destroyed errors name the operation") {
        auto error = destroyedError("set_text");
        CHECK(error.code == Error::Code::Destroyed);
        REQUIRE(error.message.has_value());
        CHECK(*error.message == "set_text: window has been destroyed");
        CHECK(error.native_code == 0);
    }
}
