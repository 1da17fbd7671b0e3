/**
 * main.cpp
 * web_compile - Web Asset Compiler CLI
 *
 * Usage:
 *   web_compile [options]
 *
 * Options:
 *   -c <file>              Configuration file (default: web-compile.abc)
 *   --test-run             Report what would change, write nothing
 *   --continue-on-error    Run every unit even after failures
 *   --stop-on-error        Halt at the first failed unit (default)
 *   --exit-code <N>        Exit code when files changed (default: 3)
 *   --error-code <N>       Exit code when a unit failed (default: 1)
 *   --git-add/--no-git-add Stage created/removed outputs in git
 *   -j <N>                 Parallel units per stage
 *   -v                     Verbose output
 *   -q                     Quiet mode
 *   --help                 Show this help
 *   --version              Show version
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "config/config_loader.hpp"
#include "core/pipeline_orchestrator.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace web::compile;

// -----------------------------------------------------------------------------
// Version and Help
// -----------------------------------------------------------------------------

void print_version() {
    std::cout << "web_compile 0.1.0\n";
    std::cout << "Web Asset Compiler\n";
    std::cout << "Copyright (c) 2025 Web Compile Project\n";
}

void print_help() {
    std::cout << R"(
web_compile - Web Asset Compiler

Compiles SCSS, minifies JavaScript and renders HTML templates, writing only
outputs whose content changed. Exits with a distinct code when files changed,
so it can run as a pre-commit hook.

USAGE:
    web_compile [OPTIONS]

OPTIONS:
    -c, --config <file>     Configuration file (default: web-compile.abc)
    --test-run              Report what would change without writing anything
    --continue-on-error     Keep compiling after a failed unit
    --stop-on-error         Stop at the first failed unit (default)
    --exit-code <N>         Exit code when files changed (default: 3)
    --error-code <N>        Exit code when compilation failed (default: 1)
    --git-add               Stage created outputs, unstage removed ones (default)
    --no-git-add            Leave the git index alone
    -j, --jobs <N>          Compile up to N units of a stage in parallel
    -v, --verbose           Verbose output
    -q, --quiet             Only report errors

    -h, --help              Show this help message
    --version               Show version information

CONFIGURATION FILE (web-compile.abc):
    {
      styles: {
        paths: [ `src/scss` ],
        translate: [ `src/scss:dist/css` ],
        hash_filenames: true,
        format: compressed,
      },
      scripts: { files: { `src/js/app.js`: `dist/js/app.[hash].min.js` } },
      templates: {
        files: { `src/index.html.j2`: `index.html` },
        variables: { title: `Home` },
      },
    }

TEMPLATES:
    {{ title }}                                    configured variable
    {{ 'src/scss/main.scss' | compiled_name }}     output filename
    {{ 'src/scss/main.scss' | compiled_path }}     output path
    {{ 'src/scss/main.scss' | hash }}              MD5 of the source

)";
}

// -----------------------------------------------------------------------------
// Progress Reporter
// -----------------------------------------------------------------------------

class ConsoleReporter {
public:
    ConsoleReporter(bool verbose, bool quiet, bool test_run, bool git_add)
        : verbose_(verbose), quiet_(quiet), test_run_(test_run), git_add_(git_add) {}

    void operator()(const RunProgress& progress) const {
        if (quiet_) return;

        switch (progress.phase) {
            case RunPhase::RESOLVING:
                if (verbose_) {
                    std::cout << progress.message << "\n";
                }
                break;

            case RunPhase::COMPILING:
                if (progress.outcome) {
                    report_outcome(*progress.outcome);
                } else if (verbose_) {
                    std::cout << progress.message << " (" << progress.total << " units)\n";
                }
                break;

            case RunPhase::COMPLETE:
                // Reported separately
                break;
        }
    }

private:
    bool verbose_;
    bool quiet_;
    bool test_run_;
    bool git_add_;

    void report_outcome(const UnitOutcome& outcome) const {
        const std::string source = outcome.unit.source_path.generic_string();
        const std::string output = outcome.resolved_output.generic_string();

        switch (outcome.status) {
            case UnitStatus::WRITTEN:
                std::cout << "Compiled: " << source << " -> " << output;
                if (verbose_) {
                    std::cout << " (" << outcome.duration.count() << "ms)";
                }
                std::cout << "\n";
                break;
            case UnitStatus::UNCHANGED:
                if (verbose_) {
                    std::cout << "Already exists: " << source << " -> " << output << "\n";
                }
                break;
            case UnitStatus::SKIPPED:
                if (verbose_) {
                    std::cout << "Skipped: " << source << " (" << outcome.skip_reason << ")\n";
                }
                break;
            case UnitStatus::FAILED:
                // Listed in the summary
                break;
        }

        for (const auto& removed : outcome.removed) {
            std::cout << "Removed: " << removed.generic_string() << "\n";
        }

        if (verbose_ && git_add_ && !test_run_) {
            for (const auto& created : outcome.created) {
                std::cout << "Staged: " << created.generic_string() << "\n";
            }
            for (const auto& removed : outcome.removed) {
                std::cout << "Unstaged: " << removed.generic_string() << "\n";
            }
        }

        for (const auto& warning : outcome.warnings) {
            std::cerr << "Warning: " << source << ": " << warning << "\n";
        }
    }
};

// -----------------------------------------------------------------------------
// Argument Parsing
// -----------------------------------------------------------------------------

// Flags override the configuration file
struct Options {
    fs::path config_file = ConfigLoader::DEFAULT_FILENAME;
    std::optional<bool> test_run;
    std::optional<bool> continue_on_error;
    std::optional<bool> git_add;
    std::optional<int> changed_exit_code;
    std::optional<int> error_exit_code;
    std::optional<size_t> jobs;
    bool verbose = false;
    bool quiet = false;
    bool show_help = false;
    bool show_version = false;
};

bool parse_number(const std::string& flag, const char* text, long min, long max, long& out) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (end == text || *end != '\0' || value < min || value > max) {
        std::cerr << "Invalid value for " << flag << ": " << text
                  << " (expected " << min << ".." << max << ")\n";
        return false;
    }
    out = value;
    return true;
}

bool parse_args(int argc, char* argv[], Options& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        // Help and version
        if (arg == "-h" || arg == "--help") {
            opts.show_help = true;
            return true;
        }
        if (arg == "--version") {
            opts.show_version = true;
            return true;
        }

        // Options with arguments
        bool takes_value = arg == "-c" || arg == "--config" || arg == "-j" || arg == "--jobs"
                        || arg == "--exit-code" || arg == "--error-code";
        if (takes_value && i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << "\n";
            return false;
        }

        long number = 0;
        if (arg == "-c" || arg == "--config") {
            opts.config_file = argv[++i];
            continue;
        }
        if (arg == "-j" || arg == "--jobs") {
            if (!parse_number(arg, argv[++i], 1, 1024, number)) return false;
            opts.jobs = static_cast<size_t>(number);
            continue;
        }
        if (arg == "--exit-code") {
            if (!parse_number(arg, argv[++i], 1, 255, number)) return false;
            opts.changed_exit_code = static_cast<int>(number);
            continue;
        }
        if (arg == "--error-code") {
            if (!parse_number(arg, argv[++i], 1, 255, number)) return false;
            opts.error_exit_code = static_cast<int>(number);
            continue;
        }

        // Boolean options
        if (arg == "--test-run") {
            opts.test_run = true;
            continue;
        }
        if (arg == "--continue-on-error") {
            opts.continue_on_error = true;
            continue;
        }
        if (arg == "--stop-on-error") {
            opts.continue_on_error = false;
            continue;
        }
        if (arg == "--git-add") {
            opts.git_add = true;
            continue;
        }
        if (arg == "--no-git-add") {
            opts.git_add = false;
            continue;
        }
        if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
            continue;
        }
        if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
            continue;
        }

        std::cerr << "Unknown option: " << arg << "\n";
        std::cerr << "Try 'web_compile --help' for more information.\n";
        return false;
    }

    return true;
}

void apply_overrides(const Options& opts, RunOptions& run) {
    if (opts.test_run) run.test_run = *opts.test_run;
    if (opts.continue_on_error) run.continue_on_error = *opts.continue_on_error;
    if (opts.git_add) run.git_add = *opts.git_add;
    if (opts.changed_exit_code) run.changed_exit_code = *opts.changed_exit_code;
    if (opts.error_exit_code) run.error_exit_code = *opts.error_exit_code;
    if (opts.jobs) run.jobs = *opts.jobs;
    run.verbose = opts.verbose;
    run.quiet = opts.quiet && !opts.verbose;
}

void print_summary(const RunResult& result, bool quiet) {
    if (result.any_failed()) {
        std::cerr << "Compilations failed:\n";
        for (const UnitOutcome* failed : result.failures()) {
            std::cerr << "  " << failed->unit.source_path.generic_string() << ": "
                      << (failed->error ? failed->error->to_string() : "unknown error") << "\n";
        }
        return;
    }

    if (quiet) return;

    if (result.any_changed()) {
        std::cout << "File(s) changed\n";
    } else {
        std::cout << "Compilation succeeded!\n";
    }
}

// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------

int main(int argc, char* argv[]) {
    Options opts;
    RunOptions defaults;

    if (!parse_args(argc, argv, opts)) {
        return opts.error_exit_code.value_or(defaults.error_exit_code);
    }

    if (opts.show_help) {
        print_help();
        return 0;
    }

    if (opts.show_version) {
        print_version();
        return 0;
    }

    int error_code = opts.error_exit_code.value_or(defaults.error_exit_code);

    try {
        Config config = ConfigLoader::load_file(opts.config_file);
        apply_overrides(opts, config.run);
        ConfigLoader::validate_run_options(config.run);
        error_code = config.run.error_exit_code;

        const RunOptions& run = config.run;
        if (run.test_run && !run.quiet) {
            std::cout << "Test run only!\n";
        }
        if (run.verbose) {
            std::cout << config.describe();
        }

        PipelineOrchestrator orchestrator(config, make_backends(config), make_registrar(config));
        orchestrator.set_progress_callback(
            ConsoleReporter(run.verbose, run.quiet, run.test_run, run.git_add));

        RunResult result = orchestrator.run_all();
        print_summary(result, run.quiet);
        return orchestrator.exit_code(result);
    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << "\n";
        return error_code;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return error_code;
    }
}
