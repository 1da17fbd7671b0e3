/**
 * script_backend.cpp
 * JavaScript minification through esbuild (or a compatible minifier)
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "backend/script_backend.hpp"

#include <sstream>
#include <stdexcept>

namespace web::compile {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// "✘ [ERROR] Expected ";" but found "x"" -> "Expected ";" but found "x""
std::string headline(const std::string& diagnostic) {
    std::istringstream lines(diagnostic);
    std::string line;
    while (std::getline(lines, line)) {
        size_t tag = line.find("[ERROR]");
        if (tag != std::string::npos) {
            return trim(line.substr(tag + 7));
        }
    }
    return diagnostic;
}

} // namespace

ScriptBackend::ScriptBackend(ScriptConfig config)
    : config_(std::move(config)), runner_(config_.minifier) {}

std::vector<std::string> ScriptBackend::build_command_args(const CompileRequest& request) const {
    return {
        request.source_path.string(),
        "--minify",
        config_.comments ? "--legal-comments=inline" : "--legal-comments=none",
        "--log-level=warning",
    };
}

BackendResult ScriptBackend::compile(const CompileRequest& request) const {
    try {
        ProcessRunner::Result result = runner_.run(build_command_args(request),
                                                   request.project_root);

        if (!result.success()) {
            std::string diagnostic = trim(result.stderr_output);
            if (diagnostic.empty()) {
                diagnostic = name() + " exited with code " + std::to_string(result.exit_code);
            }

            UnitError error(ErrorKind::COMPILE, headline(diagnostic));
            parse_diagnostic_position(diagnostic, error);
            return BackendResult::err(std::move(error));
        }

        if (result.stdout_truncated) {
            return BackendResult::err(UnitError(
                ErrorKind::COMPILE, name() + " output exceeded 10MB"));
        }

        CompileOutput output;
        output.text = normalize_trailing_newline(std::move(result.stdout_output));

        std::string warnings = trim(result.stderr_output);
        if (!warnings.empty()) {
            output.warnings.push_back(warnings);
        }
        return BackendResult::ok(std::move(output));
    } catch (const std::runtime_error& e) {
        return BackendResult::err(UnitError(ErrorKind::COMPILE, e.what()));
    }
}

} // namespace web::compile
