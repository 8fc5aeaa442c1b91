#include "ExampleCli.hpp"

#include <handleguard/log/TaggedLogger.hpp>

#include <charconv>
#include <string>

namespace HG::Examples::CLI {

ExampleCli::ExampleCli(std::string_view program_name)
    : program_name_(program_name.empty() ? std::string{"example_cli"} : std::string{program_name}) {}

void ExampleCli::add_flag(std::string_view name, std::function<void()> on_set) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.flag_handler = std::move(on_set);
    register_option(std::move(entry));
}

void ExampleCli::add_int(std::string_view name, std::function<ParseError(int)> on_value) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = [stored = entry.name, handler = std::move(on_value)](std::string_view token) -> ParseError {
        int  value  = 0;
        auto result = std::from_chars(token.data(), token.data() + token.size(), value);
        if (result.ec != std::errc{} || result.ptr != token.data() + token.size()) {
            return stored + " expects an integer value";
        }
        return handler(value);
    };
    register_option(std::move(entry));
}

void ExampleCli::add_string(std::string_view name, std::function<ParseError(std::string_view)> on_value) {
    OptionEntry entry;
    entry.name.assign(name.begin(), name.end());
    entry.expects_value = true;
    entry.value_handler = std::move(on_value);
    register_option(std::move(entry));
}

auto ExampleCli::parse(int argc, char** argv) -> Expected<void> {
    errors_.clear();
    for (int i = 1; i < argc; ++i) {
        std::string_view                raw_token{argv[i]};
        std::string_view                name = raw_token;
        std::optional<std::string_view> attached_value;
        if (auto equals_pos = raw_token.find('='); equals_pos != std::string_view::npos) {
            name           = raw_token.substr(0, equals_pos);
            attached_value = raw_token.substr(equals_pos + 1);
        }

        auto it = option_lookup_.find(std::string{name});
        if (it == option_lookup_.end()) {
            record_error("unknown argument '" + std::string{raw_token} + "'");
            continue;
        }
        auto& entry = options_[it->second];

        if (!entry.expects_value) {
            if (attached_value) {
                record_error(entry.name + " does not accept a value");
                continue;
            }
            entry.flag_handler();
            continue;
        }

        std::string_view value;
        if (attached_value) {
            value = *attached_value;
        } else if (i + 1 < argc) {
            value = argv[++i];
        } else {
            record_error(entry.name + " requires a value");
            continue;
        }
        if (auto error = entry.value_handler(value)) {
            record_error(*error);
        }
    }

    if (errors_.empty()) {
        return {};
    }
    std::string joined;
    for (auto const& error : errors_) {
        if (!joined.empty()) {
            joined.append("; ");
        }
        joined.append(error);
    }
    return std::unexpected(Error{Error::Code::InvalidArgument, std::move(joined)});
}

void ExampleCli::register_option(OptionEntry entry) {
    options_.push_back(std::move(entry));
    option_lookup_.emplace(options_.back().name, options_.size() - 1);
}

void ExampleCli::record_error(std::string message) {
    hg_log(program_name_ + ": " + message, "CLI", "ERROR");
    errors_.push_back(std::move(message));
}

auto ParseDemoOptions(int argc, char** argv) -> Expected<DemoOptions> {
    DemoOptions options;
    ExampleCli  cli{argc > 0 ? std::string_view{argv[0]} : std::string_view{}};

    auto positive = [](std::string_view name, int& target) {
        return [name = std::string{name}, &target](int value) -> ExampleCli::ParseError {
            if (value <= 0) {
                return name + " must be positive";
            }
            target = value;
            return std::nullopt;
        };
    };
    cli.add_int("--width", positive("--width", options.width));
    cli.add_int("--height", positive("--height", options.height));
    cli.add_int("--close-after", positive("--close-after", options.close_after));
    cli.add_string("--title", [&](std::string_view value) -> ExampleCli::ParseError {
        options.title.assign(value.begin(), value.end());
        return std::nullopt;
    });
    cli.add_flag("--snapshot", [&] { options.snapshot = true; });
    cli.add_flag("--offscreen", [&] { options.offscreen = true; });

    if (auto parsed = cli.parse(argc, argv); !parsed) {
        return std::unexpected(parsed.error());
    }
    return options;
}

} // namespace HG::Examples::CLI
