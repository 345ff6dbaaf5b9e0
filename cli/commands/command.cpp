//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/cli/commands/command.hpp"
#include "aua/core/logging.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <iostream>

namespace aua::cli
{
    // ParsedArgs

    void ParsedArgs::set(const std::string& name, const std::string& value) {
        values_[name] = value;
    }

    void ParsedArgs::append(const std::string& name, const std::string& value) {
        repeated_[name].push_back(value);
        values_[name] = value;
    }

    void ParsedArgs::set_flag(const std::string& name) {
        switches_.insert(name);
    }

    void ParsedArgs::add_positional(const std::string& value) {
        operands_.push_back(value);
    }

    bool ParsedArgs::has(const std::string& name) const {
        return values_.contains(name) || switches_.contains(name);
    }

    std::optional<std::string> ParsedArgs::get(const std::string& name) const {
        const auto it = values_.find(name);
        return it == values_.end() ? std::nullopt : std::optional<std::string>(it->second);
    }

    std::optional<int> ParsedArgs::get_int(const std::string& name) const {
        const auto text = get(name);
        if (!text) {
            return std::nullopt;
        }
        int value = 0;
        const char* last = text->data() + text->size();
        if (const auto [ptr, ec] = std::from_chars(text->data(), last, value); ec != std::errc{} || ptr != last) {
            return std::nullopt;
        }
        return value;
    }

    std::vector<std::string> ParsedArgs::get_all(const std::string& name) const {
        const auto it = repeated_.find(name);
        return it == repeated_.end() ? std::vector<std::string>{} : it->second;
    }

    bool ParsedArgs::get_flag(const std::string& name) const {
        return switches_.contains(name);
    }

    // Command

    std::string Command::usage() const {
        std::string line = "Usage: aua " + std::string(name());
        for (const auto& def : arguments()) {
            if (def.required) {
                line += " --" + def.name + " <" + def.value_name + ">";
            }
        }
        return line + " [OPTIONS]";
    }

    std::string Command::validate(const ParsedArgs& args) const {
        const auto defs = arguments();
        const auto missing = std::find_if(defs.begin(), defs.end(), [&args](const ArgDef& def) {
            return def.required && !args.has(def.name);
        });
        return missing == defs.end() ? std::string{} : "Missing required argument: --" + missing->name;
    }

    void Command::print_help() const {
        std::cout << description() << "\n\n" << usage() << "\n";

        const auto option_line = [](const char short_name, const std::string& spelled, const std::string& text) {
            std::cout << "  " << (short_name ? std::string("-") + short_name + ", " : std::string("    "))
                      << std::left << std::setw(24) << spelled << text << "\n";
        };

        if (const auto defs = arguments(); !defs.empty()) {
            std::cout << "\nOptions:\n";
            for (const auto& def : defs) {
                std::string spelled = "--" + def.name;
                if (def.takes_value) {
                    spelled += " <" + def.value_name + ">";
                }
                std::string text = def.description;
                if (!def.default_value.empty()) {
                    text += " (default: " + def.default_value + ")";
                }
                if (def.repeatable) {
                    text += " [repeatable]";
                }
                if (def.required) {
                    text += " [required]";
                }
                option_line(def.short_name, spelled, text);
            }
        }

        std::cout << "\nCommon options:\n";
        option_line('h', "--help", "Show this help message");
        option_line('v', "--verbose", "Verbose output and debug logging");
        option_line('q', "--quiet", "Only report errors");
        option_line(0, "--json", "Print the result as JSON on stdout");
    }

    Result<core::Config, Error> Command::prepare(const ParsedArgs& args) {
        if (args.get_flag("verbose")) {
            verbosity_ = Verbosity::Verbose;
        } else if (args.get_flag("quiet")) {
            verbosity_ = Verbosity::Quiet;
        }
        json_output_ = args.get_flag("json");

        auto config = args.has("config")
            ? core::Config::load_from_file(*args.get("config"))
            : Result<core::Config, Error>::success(core::Config::default_config());
        if (config.is_err()) {
            return config;
        }

        std::optional<spdlog::level::level_enum> level;
        if (verbosity_ == Verbosity::Verbose) {
            level = spdlog::level::debug;
        } else if (verbosity_ == Verbosity::Quiet) {
            level = spdlog::level::err;
        }
        if (auto logging = core::configure_logging(config.value().logging, level); logging.is_err()) {
            return Result<core::Config, Error>::failure(logging.error());
        }
        return config;
    }

    void Command::print(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cout << msg << "\n";
        }
    }

    void Command::print_error(const std::string_view msg) {
        std::cerr << "error: " << msg << "\n";
    }

    void Command::print_warning(const std::string_view msg) const {
        if (!is_quiet()) {
            std::cerr << "warning: " << msg << "\n";
        }
    }

    void Command::print_verbose(const std::string_view msg) const {
        if (is_verbose()) {
            std::cout << msg << "\n";
        }
    }

    // CommandRegistry

    CommandRegistry& CommandRegistry::instance() {
        static CommandRegistry registry;
        return registry;
    }

    void CommandRegistry::register_command(std::unique_ptr<Command> cmd) {
        commands_.push_back(std::move(cmd));
    }

    Command* CommandRegistry::find(const std::string_view name) const {
        const auto it = std::find_if(commands_.begin(), commands_.end(), [name](const auto& cmd) {
            return cmd->name() == name;
        });
        return it == commands_.end() ? nullptr : it->get();
    }

    std::vector<Command*> CommandRegistry::list() const {
        std::vector<Command*> sorted;
        sorted.reserve(commands_.size());
        for (const auto& cmd : commands_) {
            sorted.push_back(cmd.get());
        }
        std::sort(sorted.begin(), sorted.end(), [](const Command* a, const Command* b) {
            return a->name() < b->name();
        });
        return sorted;
    }

    // Argument parsing

    namespace {

        bool is_common_switch(const std::string_view name) {
            return name == "help" || name == "verbose" || name == "quiet" || name == "json";
        }

        std::string common_switch_for(const char c) {
            switch (c) {
                case 'h': return "help";
                case 'v': return "verbose";
                case 'q': return "quiet";
                default:  return {};
            }
        }

        class ArgumentScanner {
        public:
            ArgumentScanner(const std::vector<std::string>& args, const std::vector<ArgDef>& defs)
                : args_(args) {
                for (const auto& def : defs) {
                    by_long_[def.name] = &def;
                    if (def.short_name) {
                        by_short_[def.short_name] = &def;
                    }
                    if (!def.default_value.empty()) {
                        result_.args.set(def.name, def.default_value);
                    }
                }
            }

            ParseResult run() {
                bool operands_only = false;
                for (index_ = 0; index_ < args_.size() && result_.success; ++index_) {
                    const std::string& arg = args_[index_];
                    if (arg.empty()) {
                        continue;
                    }
                    if (operands_only || arg.size() == 1 || arg[0] != '-') {
                        result_.args.add_positional(arg);
                    } else if (arg == "--") {
                        operands_only = true;
                    } else if (arg[1] == '-') {
                        long_option(arg.substr(2));
                    } else {
                        short_cluster(arg);
                    }
                }
                return std::move(result_);
            }

        private:
            void long_option(std::string name) {
                std::optional<std::string> inline_value;
                if (const auto eq = name.find('='); eq != std::string::npos) {
                    inline_value = name.substr(eq + 1);
                    name.resize(eq);
                }

                const auto it = by_long_.find(name);
                if (it == by_long_.end()) {
                    if (is_common_switch(name)) {
                        result_.args.set_flag(name);
                    } else {
                        fail("Unknown option: --" + name);
                    }
                    return;
                }

                const ArgDef& def = *it->second;
                if (!def.takes_value) {
                    result_.args.set_flag(def.name);
                    return;
                }
                std::string value = inline_value ? *inline_value : next_value();
                if (value.empty()) {
                    fail("Option --" + name + " requires a value");
                    return;
                }
                store(def, value);
            }

            void short_cluster(const std::string& arg) {
                for (std::size_t j = 1; j < arg.size(); ++j) {
                    const char c = arg[j];
                    const auto it = by_short_.find(c);
                    if (it == by_short_.end()) {
                        if (const auto common = common_switch_for(c); !common.empty()) {
                            result_.args.set_flag(common);
                        } else {
                            fail(std::string("Unknown option: -") + c);
                            return;
                        }
                        continue;
                    }

                    const ArgDef& def = *it->second;
                    if (!def.takes_value) {
                        result_.args.set_flag(def.name);
                        continue;
                    }
                    // The rest of the cluster, or the next argument, is the value.
                    std::string value = j + 1 < arg.size() ? arg.substr(j + 1) : next_value();
                    if (value.empty()) {
                        fail(std::string("Option -") + c + " requires a value");
                    } else {
                        store(def, value);
                    }
                    return;
                }
            }

            std::string next_value() {
                return index_ + 1 < args_.size() ? args_[++index_] : std::string{};
            }

            void store(const ArgDef& def, const std::string& value) {
                if (def.repeatable) {
                    result_.args.append(def.name, value);
                } else {
                    result_.args.set(def.name, value);
                }
            }

            void fail(std::string message) {
                result_.error = std::move(message);
                result_.success = false;
            }

            const std::vector<std::string>& args_;
            std::unordered_map<std::string, const ArgDef*> by_long_;
            std::unordered_map<char, const ArgDef*> by_short_;
            ParseResult result_;
            std::size_t index_ = 0;
        };

    }  // namespace

    ParseResult parse_arguments(const std::vector<std::string>& args, const std::vector<ArgDef>& defs) {
        return ArgumentScanner(args, defs).run();
    }
}  // namespace aua::cli
