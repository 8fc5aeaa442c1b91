#pragma once

#include <handleguard/core/Error.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace HG::Examples::CLI {

// Accepts `--name value` and `--name=value`. Unknown arguments and bad
// values are collected; parse() reports them all as one InvalidArgument.
class ExampleCli {
public:
    using ParseError = std::optional<std::string>;

    explicit ExampleCli(std::string_view program_name);

    void add_flag(std::string_view name, std::function<void()> on_set);
    void add_int(std::string_view name, std::function<ParseError(int)> on_value);
    void add_string(std::string_view name, std::function<ParseError(std::string_view)> on_value);

    [[nodiscard]] auto parse(int argc, char** argv) -> Expected<void>;
    [[nodiscard]] auto errors() const -> std::vector<std::string> const& { return errors_; }

private:
    struct OptionEntry {
        std::string                                          name;
        bool                                                 expects_value = false;
        std::function<void()>                                flag_handler;
        std::function<ParseError(std::string_view)>          value_handler;
    };

    void register_option(OptionEntry entry);
    void record_error(std::string message);

    std::string                                  program_name_;
    std::vector<OptionEntry>                     options_;
    std::unordered_map<std::string, std::size_t> option_lookup_;
    std::vector<std::string>                     errors_;
};

struct DemoOptions {
    int         width  = 500;
    int         height = 300;
    std::string title  = "Hello, world!";
    // Number of close requests the main window receives before it destroys itself.
    int         close_after = 1;
    bool        snapshot    = false;
    bool        offscreen   = false;
};

[[nodiscard]] auto ParseDemoOptions(int argc, char** argv) -> Expected<DemoOptions>;

} // namespace HG::Examples::CLI
