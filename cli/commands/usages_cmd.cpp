//
// Created by gregorian-rayne on 10/18/26.
//

#include "aua/cli/commands/command.hpp"
#include "aua/cli/progress.hpp"
#include "aua/cli/formatter.hpp"

#include "aua/aua.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <filesystem>
#include <iostream>

namespace aua::cli
{
    namespace fs = std::filesystem;

    namespace {
        std::atomic<bool> g_stop_requested{false};

        void handle_sigint(int) {
            g_stop_requested.store(true);
        }

        /**
         * Restores the previous SIGINT disposition on scope exit.
         */
        class SigintScope {
        public:
            SigintScope() : previous_(std::signal(SIGINT, handle_sigint)) {
                g_stop_requested.store(false);
            }
            ~SigintScope() {
                std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
            }

            SigintScope(const SigintScope&) = delete;
            SigintScope& operator=(const SigintScope&) = delete;

        private:
            void (*previous_)(int);
        };
    }

    /**
     * Usages command - extracts API usage from a client corpus.
     */
    class UsagesCommand : public Command {
    public:
        [[nodiscard]] std::string_view name() const noexcept override {
            return "usages";
        }

        [[nodiscard]] std::string_view description() const noexcept override {
            return "Count how client code calls an API and with which argument values";
        }

        [[nodiscard]] std::string usage() const override {
            return "Usage: aua usages --api FILE --src DIR --tmp DIR --out DIR [OPTIONS]\n"
                   "\n"
                   "Examples:\n"
                   "  aua usages --api sklearn.json --src corpus/ --tmp .aua/tmp --out results/\n"
                   "  aua usages --api sklearn.json --src corpus/ --tmp .aua/tmp --out results/ \\\n"
                   "      --exclude-file corpus.exclude --exclude '**/tests/**' --jobs 8\n"
                   "\n"
                   "Re-running with the same --tmp directory resumes an interrupted run.";
        }

        [[nodiscard]] std::vector<ArgDef> arguments() const override {
            return {
                {"api", 'a', "API description (JSON)", true, true, "", "FILE"},
                {"src", 's', "Root directory of the client corpus", true, true, "", "DIR"},
                {"tmp", 't', "Checkpoint directory (reused to resume)", false, true, "", "DIR"},
                {"out", 'o', "Output directory for the usages document", true, true, "", "DIR"},
                {"exclude-file", 0, "File listing excluded paths or globs", false, true, "", "FILE"},
                {"exclude", 'x', "Excluded path or glob (repeatable)", false, true, "", "GLOB", true},
                {"config", 'c', "Configuration file (TOML)", false, true, "", "FILE"},
                {"jobs", 'j', "Number of worker threads (0=auto)", false, true, "", "N"},
                {"fresh", 0, "Discard existing checkpoints first", false, false, "", ""},
                {"no-progress", 0, "Do not show a progress bar", false, false, "", ""},
            };
        }

        [[nodiscard]] std::string validate(const ParsedArgs& args) const override {
            if (auto missing = Command::validate(args); !missing.empty()) {
                return missing;
            }
            if (args.has("jobs")) {
                const auto jobs = args.get_int("jobs");
                if (!jobs || *jobs < 0) {
                    return "--jobs must be a non-negative integer";
                }
            }
            return "";
        }

        [[nodiscard]] int execute(const ParsedArgs& args) override {
            if (args.get_flag("help")) {
                print_help();
                return 0;
            }

            auto prepared = prepare(args);
            if (prepared.is_err()) {
                print_error(prepared.error().to_string());
                return 1;
            }
            core::Config config = std::move(prepared).value();

            if (const auto jobs = args.get_int("jobs")) {
                config.performance.num_threads = *jobs;
            }
            if (const auto exclude_file = args.get("exclude-file")) {
                config.corpus.exclude_file = *exclude_file;
            }
            for (const auto& pattern : args.get_all("exclude")) {
                config.corpus.exclude.push_back(pattern);
            }
            if (const auto tmp = args.get("tmp")) {
                config.checkpoint.directory = *tmp;
            }

            // API description
            auto api_result = api::ApiDescription::load(*args.get("api"));
            if (api_result.is_err()) {
                print_error("Cannot load API description: " + api_result.error().to_string());
                return 1;
            }
            const api::ApiDescription& api = api_result.value();
            print_verbose("Loaded " + std::to_string(api.size()) + " API elements of " +
                          api.distribution() + " " + api.version());

            // Output directory
            const fs::path out_dir = *args.get("out");
            std::error_code ec;
            fs::create_directories(out_dir, ec);
            if (ec || !fs::is_directory(out_dir, ec)) {
                print_error("Cannot create output directory: " + out_dir.string());
                return 1;
            }

            // Corpus
            corpus::WalkOptions walk;
            walk.root = *args.get("src");
            walk.extensions = config.analysis.extensions;
            if (!config.corpus.exclude_file.empty()) {
                auto exclusions = corpus::ExclusionSet::from_file(config.corpus.exclude_file);
                if (exclusions.is_err()) {
                    print_error(exclusions.error().to_string());
                    return 1;
                }
                walk.exclusions = std::move(exclusions).value();
            }
            for (const auto& pattern : config.corpus.exclude) {
                walk.exclusions.add(pattern);
            }

            auto files_result = corpus::walk_corpus(walk);
            if (files_result.is_err()) {
                print_error(files_result.error().to_string());
                return 1;
            }
            const auto& files = files_result.value();
            print_verbose("Found " + std::to_string(files.size()) + " source files");

            // Checkpoints
            storage::CheckpointOptions checkpoint_options;
            checkpoint_options.directory = config.checkpoint.directory;
            checkpoint_options.write_retries = static_cast<std::size_t>(config.checkpoint.write_retries);
            checkpoint_options.retry_delay = std::chrono::milliseconds(config.checkpoint.retry_delay_ms);

            storage::CheckpointStore store(checkpoint_options);
            if (auto opened = store.open(); opened.is_err()) {
                print_error(opened.error().to_string());
                return 1;
            }
            if (args.get_flag("fresh")) {
                if (auto cleared = store.clear(); cleared.is_err()) {
                    print_error(cleared.error().to_string());
                    return 1;
                }
                print_verbose("Discarded existing checkpoints");
            } else if (store.size() > 0) {
                print_verbose("Resuming with " + std::to_string(store.size()) + " checkpointed files");
            }

            // Engine
            engine::EngineOptions options;
            options.num_threads = static_cast<unsigned int>(config.performance.num_threads);
            options.limits.max_file_bytes = static_cast<std::size_t>(config.performance.max_file_bytes);
            options.limits.max_nesting_depth = static_cast<std::size_t>(config.performance.max_nesting_depth);
            options.limits.file_timeout = std::chrono::milliseconds(config.performance.file_timeout_ms);
            options.relevance_filter = config.analysis.relevance_filter;
            options.packages = config.analysis.packages;

            engine::UsageEngine engine(api, &store, options);
            engine.set_cancel_flag(&g_stop_requested);

            std::unique_ptr<ProgressBar> progress;
            if (!is_quiet() && !is_json() && !args.get_flag("no-progress") && is_tty() && !files.empty()) {
                progress = std::make_unique<ProgressBar>(files.size(), "Analyzing");
                engine.set_progress_callback([&progress](const engine::FileProgress& p) {
                    progress->advance(p);
                });
            }

            SigintScope sigint;
            auto run_result = engine.run(files);
            if (run_result.is_err()) {
                if (progress) progress->fail(run_result.error().message());
                print_error(run_result.error().to_string());
                return 1;
            }
            auto& [aggregate, summary] = run_result.value();

            if (progress) {
                if (summary.cancelled) {
                    progress->fail("interrupted");
                } else {
                    progress->finish();
                }
            }

            if (summary.cancelled) {
                print_warning("Interrupted after " + std::to_string(summary.processed()) + " of " +
                              std::to_string(summary.total_files) + " files; rerun with --tmp " +
                              store.directory().string() + " to resume");
                return 130;
            }

            // Output
            export_json::UsagesDocument document;
            document.metadata = {api.distribution(), api.package(), api.version()};
            document.aggregate = std::move(aggregate);
            document.summary = export_json::summary_to_json(summary);

            const fs::path out_file = out_dir / export_json::usages_file_name(document.metadata);
            if (auto written = export_json::write_usages(out_file, document); written.is_err()) {
                print_error(written.error().to_string());
                return 1;
            }
            spdlog::info("Wrote {}", out_file.string());

            if (is_json()) {
                nlohmann::json output = *document.summary;
                output["output"] = out_file.string();
                std::cout << output.dump(2) << "\n";
            } else if (!is_quiet()) {
                SummaryPrinter printer(std::cout);
                printer.print_run_summary(summary);
                printer.print_failures(summary.failures, is_verbose() ? 0 : 10);
                std::cout << "\nUsages written to " << out_file.string() << "\n";
            }

            return 0;
        }
    };

    namespace {
        struct UsagesCommandRegistrar {
            UsagesCommandRegistrar() {
                CommandRegistry::instance().register_command(
                    std::make_unique<UsagesCommand>()
                );
            }
        } usages_registrar;
    }
}  // namespace aua::cli
