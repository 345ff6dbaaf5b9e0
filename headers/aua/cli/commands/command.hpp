//
// Created by gregorian-rayne on 10/18/26.
//

#ifndef AUA_COMMAND_HPP
#define AUA_COMMAND_HPP

/**
 * @file command.hpp
 * @brief Subcommand interface of the `aua` tool.
 *
 * Each subcommand (usages, merge, improve) derives from Command and
 * registers itself with CommandRegistry from a static object in its own
 * translation unit. main() looks the command up, parses its options with
 * parse_arguments() and calls execute().
 */

#include "aua/core/config.hpp"
#include "aua/result.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace aua::cli
{
    /**
     * One `--name` / `-n` option of a command.
     */
    struct ArgDef {
        std::string name;
        char short_name = 0;
        std::string description;
        bool required = false;
        bool takes_value = true;
        std::string default_value;
        std::string value_name = "VALUE";
        bool repeatable = false;
    };

    /**
     * Option values, switches and positional operands of one invocation.
     */
    class ParsedArgs {
    public:
        void set(const std::string& name, const std::string& value);
        void append(const std::string& name, const std::string& value);
        void set_flag(const std::string& name);
        void add_positional(const std::string& value);

        [[nodiscard]] bool has(const std::string& name) const;
        [[nodiscard]] std::optional<std::string> get(const std::string& name) const;

        /**
         * Integer value of an option; nullopt when absent or not a whole number.
         */
        [[nodiscard]] std::optional<int> get_int(const std::string& name) const;

        /**
         * Every occurrence of a repeatable option, in command-line order.
         */
        [[nodiscard]] std::vector<std::string> get_all(const std::string& name) const;

        [[nodiscard]] bool get_flag(const std::string& name) const;
        [[nodiscard]] const std::vector<std::string>& positional() const { return operands_; }

    private:
        std::unordered_map<std::string, std::string> values_;
        std::unordered_map<std::string, std::vector<std::string>> repeated_;
        std::unordered_set<std::string> switches_;
        std::vector<std::string> operands_;
    };

    enum class Verbosity {
        Quiet,
        Normal,
        Verbose
    };

    class Command {
    public:
        virtual ~Command() = default;

        [[nodiscard]] virtual std::string_view name() const noexcept = 0;
        [[nodiscard]] virtual std::string_view description() const noexcept = 0;

        /**
         * Synopsis and examples printed by --help.
         */
        [[nodiscard]] virtual std::string usage() const;

        [[nodiscard]] virtual std::vector<ArgDef> arguments() const { return {}; }

        /**
         * Runs the command and returns the process exit code.
         */
        [[nodiscard]] virtual int execute(const ParsedArgs& args) = 0;

        /**
         * Checks the parsed options; returns an error message, empty when
         * the invocation is acceptable. The default checks required options.
         */
        [[nodiscard]] virtual std::string validate(const ParsedArgs& args) const;

        void print_help() const;

    protected:
        /**
         * Applies --verbose/--quiet/--json, loads the configuration (--config
         * or defaults) and installs the logger.
         */
        [[nodiscard]] Result<core::Config, Error> prepare(const ParsedArgs& args);

        void print(std::string_view msg) const;
        static void print_error(std::string_view msg);
        void print_warning(std::string_view msg) const;
        void print_verbose(std::string_view msg) const;

        [[nodiscard]] bool is_quiet() const { return verbosity_ == Verbosity::Quiet; }
        [[nodiscard]] bool is_verbose() const { return verbosity_ == Verbosity::Verbose; }
        [[nodiscard]] bool is_json() const { return json_output_; }

    private:
        Verbosity verbosity_ = Verbosity::Normal;
        bool json_output_ = false;
    };

    class CommandRegistry {
    public:
        static CommandRegistry& instance();

        void register_command(std::unique_ptr<Command> cmd);

        [[nodiscard]] Command* find(std::string_view name) const;

        /**
         * Registered commands sorted by name.
         */
        [[nodiscard]] std::vector<Command*> list() const;

    private:
        CommandRegistry() = default;
        std::vector<std::unique_ptr<Command>> commands_;
    };

    struct ParseResult {
        ParsedArgs args;
        std::string error;
        bool success = true;
    };

    /**
     * Parses the arguments following the command name against `defs`.
     *
     * Accepts `--name value`, `--name=value`, `-n value`, `-nvalue` and
     * clustered short switches. `-h`, `-v`, `-q`, `--help`, `--verbose`,
     * `--quiet` and `--json` are accepted by every command. Everything after
     * `--` is positional.
     */
    [[nodiscard]] ParseResult parse_arguments(
        const std::vector<std::string>& args,
        const std::vector<ArgDef>& defs
    );
}  // namespace aua::cli

#endif //AUA_COMMAND_HPP
