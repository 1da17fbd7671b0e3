/**
 * compiler_backend.hpp
 * Abstract compiler seam between the pipeline and the external tools
 *
 * Each stage kind has one backend. A backend is a pure function from
 * (source bytes, paths, options) to output bytes plus an optional source
 * map, or a CompileError. It never writes files: the StageRunner owns all
 * filesystem writes.
 *
 * Backends must be safe to call from several workers at once.
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_COMPILER_BACKEND_HPP
#define WEB_COMPILE_COMPILER_BACKEND_HPP

#include "core/run_result.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace web::compile {

namespace fs = std::filesystem;

class CompiledNameRegistry;
struct Config;

struct CompileRequest {
    // Bytes the runner read to check the source. The template backend renders
    // these; the sassc and esbuild backends hand the tool source_path instead,
    // so imports and source map paths resolve against the file on disk.
    std::string source_text;
    fs::path source_path;            // relative to project_root
    fs::path output_template;        // may still contain [hash]
    fs::path project_root;
    bool source_map = false;

    // Read-only name lookup; set for the template stage only
    const CompiledNameRegistry* registry = nullptr;
};

struct CompileOutput {
    std::string text;
    std::optional<std::string> source_map;
    std::vector<std::string> warnings;
};

struct BackendResult {
    bool success;
    CompileOutput output;
    UnitError error;

    static BackendResult ok(CompileOutput out) {
        return {true, std::move(out), UnitError{}};
    }

    static BackendResult err(UnitError e) {
        return {false, CompileOutput{}, std::move(e)};
    }
};

class CompilerBackend {
public:
    virtual ~CompilerBackend() = default;

    // Tool name for messages ("sassc", "esbuild", "template")
    virtual std::string name() const = 0;

    virtual BackendResult compile(const CompileRequest& request) const = 0;

    // Whether the underlying tool can be invoked at all
    virtual bool is_available() const { return true; }
};

// One backend per stage, owned by the orchestrator for the run
struct BackendSet {
    std::unique_ptr<CompilerBackend> style;
    std::unique_ptr<CompilerBackend> script;
    std::unique_ptr<CompilerBackend> templates;

    const CompilerBackend* for_kind(StageKind kind) const;
};

// Production backends configured from the normalized config
BackendSet make_backends(const Config& config);

// =============================================================================
// Helpers shared by the backends
// =============================================================================

// Strip trailing whitespace and end with exactly one newline
std::string normalize_trailing_newline(std::string text);

// Pull "line N:M" / "file:N:M:" style positions out of tool diagnostics
void parse_diagnostic_position(const std::string& diagnostic, UnitError& error);

} // namespace web::compile

#endif // WEB_COMPILE_COMPILER_BACKEND_HPP
