// stage_runner.cpp - Compiles one unit and performs the idempotent write
// Part of web_compile - Web Asset Compiler

#include "core/stage_runner.hpp"
#include "core/hash_namer.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

namespace web::compile {

bool read_file(const fs::path& path, std::string& contents, std::string& error) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        error = "Cannot open " + path.string() + ": " + std::strerror(errno);
        return false;
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        error = "Cannot read " + path.string();
        return false;
    }

    contents = buffer.str();
    return true;
}

StageRunner::StageRunner(StageContext context)
    : context_(std::move(context)) {}

std::string StageRunner::source_map_name(const fs::path& source) {
    return source.filename().string() + ".map.json";
}

// =============================================================================
// Unit execution
// =============================================================================

UnitOutcome StageRunner::run(const CompilationUnit& unit, const CompilerBackend& backend) const {
    auto start_time = std::chrono::steady_clock::now();

    UnitOutcome outcome;
    outcome.unit = unit;

    auto finish = [&](UnitStatus status) {
        outcome.status = status;
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);
        return outcome;
    };

    auto fail = [&](UnitError error) {
        outcome.error = std::move(error);
        return finish(UnitStatus::FAILED);
    };

    // 1. Source
    std::string source_text;
    std::string read_error;
    if (!read_file(context_.project_root / unit.source_path, source_text, read_error)) {
        return fail(UnitError(ErrorKind::IO, read_error));
    }

    // 2. Compile
    CompileRequest request;
    request.source_text = std::move(source_text);
    request.source_path = unit.source_path;
    request.output_template = unit.output_template;
    request.project_root = context_.project_root;
    request.source_map = unit.options.source_map;
    if (unit.kind == StageKind::TEMPLATE) {
        request.registry = context_.registry;
    }

    BackendResult compiled = backend.compile(request);
    if (!compiled.success) {
        return fail(std::move(compiled.error));
    }
    for (auto& warning : compiled.output.warnings) {
        outcome.warnings.push_back(std::move(warning));
    }

    // 3. Name: the hash covers the output before the map comment
    const std::string& text = compiled.output.text;
    outcome.resolved_output = HashNamer::name_for(unit.output_template, text);

    std::string output_bytes = text;
    fs::path map_path;
    if (unit.options.source_map && compiled.output.source_map) {
        const std::string map_name = source_map_name(unit.source_path);
        map_path = outcome.resolved_output.parent_path() / map_name;
        if (!output_bytes.empty() && output_bytes.back() != '\n') {
            output_bytes += '\n';
        }
        output_bytes += "/*# sourceMappingURL=" + map_name + " */\n";
    }

    // 4. Compare and write
    WriteResult written = write_if_changed(outcome.resolved_output, output_bytes, outcome);
    if (written.status == WriteStatus::FAILED) {
        return fail(UnitError(ErrorKind::IO, written.error));
    }
    bool any_written = written.status == WriteStatus::WRITTEN;

    if (!map_path.empty()) {
        WriteResult map_written = write_if_changed(map_path, *compiled.output.source_map, outcome);
        if (map_written.status == WriteStatus::FAILED) {
            return fail(UnitError(ErrorKind::IO, map_written.error));
        }
        any_written = any_written || map_written.status == WriteStatus::WRITTEN;
    }

    if (!context_.test_run && context_.vcs) {
        for (const auto& created : outcome.created) {
            auto added = context_.vcs->add(created);
            if (!added.success) {
                outcome.warnings.push_back("Could not add " + created.generic_string() +
                                           " to " + context_.vcs->name() + ": " + added.error);
            }
        }
    }

    // 5. Compiled name for later stages
    register_output(outcome);

    // 6. Stale siblings
    prune(outcome);

    return finish(any_written ? UnitStatus::WRITTEN : UnitStatus::UNCHANGED);
}

StageRunner::WriteResult StageRunner::write_if_changed(const fs::path& relative,
                                                       const std::string& bytes,
                                                       UnitOutcome& outcome) const {
    const fs::path path = context_.project_root / relative;

    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (exists) {
        std::string current;
        std::string ignored;
        if (read_file(path, current, ignored) && current == bytes) {
            return {WriteStatus::UNCHANGED, ""};
        }
    }

    outcome.written.push_back(relative);
    if (!exists) {
        outcome.created.push_back(relative);
    }

    if (context_.test_run) {
        return {WriteStatus::WRITTEN, ""};
    }

    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec) {
            return {WriteStatus::FAILED,
                    "Cannot create directory " + parent.string() + ": " + ec.message()};
        }
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return {WriteStatus::FAILED,
                "Cannot open " + path.string() + " for writing: " + std::strerror(errno)};
    }
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.close();
    if (!out) {
        return {WriteStatus::FAILED, "Failed to write " + path.string()};
    }

    return {WriteStatus::WRITTEN, ""};
}

void StageRunner::register_output(const UnitOutcome& outcome) const {
    if (!context_.registry) return;

    const StageKind kind = outcome.unit.kind;
    if (kind == StageKind::STYLE || kind == StageKind::SCRIPT) {
        context_.registry->add(outcome.unit.source_path, outcome.resolved_output);
    }
}

void StageRunner::prune(UnitOutcome& outcome) const {
    const fs::path& output_template = outcome.unit.output_template;
    if (!HashNamer::is_hashed(output_template)) return;

    PruneResult pruned = HashNamer::prune_stale(context_.project_root / output_template,
                                                context_.project_root / outcome.resolved_output,
                                                context_.test_run);

    for (const auto& removed : pruned.removed) {
        fs::path relative = output_template.parent_path() / removed.filename();
        outcome.removed.push_back(relative);

        if (!context_.test_run && context_.vcs) {
            auto result = context_.vcs->remove(relative);
            if (!result.success) {
                outcome.warnings.push_back("Could not remove " + relative.generic_string() +
                                           " from " + context_.vcs->name() + ": " + result.error);
            }
        }
    }

    for (const auto& error : pruned.errors) {
        outcome.warnings.push_back(error);
    }
}

} // namespace web::compile
