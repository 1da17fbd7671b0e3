/**
 * config.hpp
 * Normalized configuration for web_compile
 *
 * The ConfigLoader turns a web-compile.abc file into these structs and
 * validates every value, so the pipeline never sees raw syntax.
 *
 * Layout mirrors the file:
 *   styles    { files, paths, traversal options, format, precision, ... }
 *   scripts   { files, paths, traversal options, comments, minifier }
 *   templates { files, paths, traversal options, variables }
 *   run-wide  continue_on_error, test_run, git_add, exit codes, jobs
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_CONFIG_HPP
#define WEB_COMPILE_CONFIG_HPP

#include "core/compilation_unit.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace web::compile {

namespace fs = std::filesystem;

// Fatal configuration problem; raised before any unit runs
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

// =============================================================================
// Asset Options
// =============================================================================

enum class OutputStyle {
    NESTED,
    EXPANDED,
    COMPACT,
    COMPRESSED
};

const char* output_style_name(OutputStyle style);
std::optional<OutputStyle> parse_output_style(const std::string& name);

// Explicit "source: output" entry, kept in declaration order
struct FileMapping {
    std::string source;
    std::string output;
};

// Options shared by every asset kind
struct AssetOptions {
    std::vector<FileMapping> files;         // explicit mapping
    std::vector<std::string> paths;         // files or directories to scan
    bool recurse = true;                    // descend into sub-directories
    int partial_depth = 0;                  // ancestor levels searched for a partial
    std::vector<std::string> translate;     // "src/scss:dist/css"
    bool hash_filenames = false;            // insert [hash] into natural names
    std::string encoding = "utf8";

    bool empty() const { return files.empty() && paths.empty(); }
};

struct StyleConfig {
    AssetOptions assets;
    OutputStyle format = OutputStyle::COMPRESSED;
    int precision = 5;
    bool sourcemap = false;
    std::string compiler = "sassc";
};

struct ScriptConfig {
    AssetOptions assets;
    bool comments = false;                  // keep /*! ... */ legal comments
    std::string minifier = "esbuild";
};

struct TemplateConfig {
    AssetOptions assets;
    std::map<std::string, std::string> variables;
};

// =============================================================================
// Run Options
// =============================================================================

struct RunOptions {
    bool continue_on_error = false;  // false = stop on the first failed unit
    bool test_run = false;           // compute outcomes, touch nothing
    bool git_add = true;             // register created/removed outputs in git
    int changed_exit_code = 3;
    int error_exit_code = 1;
    size_t jobs = 1;                 // workers per stage

    bool verbose = false;
    bool quiet = false;
};

struct Config {
    fs::path project_root;
    fs::path config_file;

    StyleConfig styles;
    ScriptConfig scripts;
    TemplateConfig templates;
    RunOptions run;

    const AssetOptions& assets_for(StageKind kind) const;
    UnitOptions unit_options_for(StageKind kind) const;

    // Multi-line, human-readable dump (used by --verbose)
    std::string describe() const;
};

} // namespace web::compile

#endif // WEB_COMPILE_CONFIG_HPP
