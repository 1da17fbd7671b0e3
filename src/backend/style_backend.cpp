/**
 * style_backend.cpp
 * SCSS/Sass -> CSS through the sassc executable
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "backend/style_backend.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace web::compile {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::optional<std::string> decode_base64(const std::string& encoded) {
    std::string input;
    input.reserve(encoded.size());
    for (char c : encoded) {
        if (c != '\n' && c != '\r' && c != ' ') input += c;
    }
    if (input.empty() || input.size() % 4 != 0) {
        return std::nullopt;
    }

    std::string decoded(input.size() / 4 * 3, '\0');
    int len = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&decoded[0]),
                              reinterpret_cast<const unsigned char*>(input.data()),
                              static_cast<int>(input.size()));
    if (len < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts the bytes produced by '=' padding
    size_t padding = 0;
    if (input[input.size() - 1] == '=') padding++;
    if (input[input.size() - 2] == '=') padding++;
    decoded.resize(static_cast<size_t>(len) - padding);
    return decoded;
}

} // namespace

StyleBackend::StyleBackend(StyleConfig config)
    : config_(std::move(config)), runner_(config_.compiler) {}

std::vector<std::string> StyleBackend::build_command_args(const CompileRequest& request) const {
    std::vector<std::string> args;

    args.push_back("--style");
    args.push_back(output_style_name(config_.format));

    args.push_back("--precision");
    args.push_back(std::to_string(config_.precision));

    // Imports resolve relative to the source directory first
    fs::path load_path = request.source_path.parent_path();
    args.push_back("--load-path");
    args.push_back(load_path.empty() ? "." : load_path.string());

    if (request.source_map) {
        args.push_back("--sourcemap=inline");
    }

    args.push_back(request.source_path.string());
    return args;
}

std::optional<std::string> StyleBackend::extract_inline_source_map(std::string& css) {
    static const std::string marker = "/*# sourceMappingURL=data:";

    size_t start = css.rfind(marker);
    if (start == std::string::npos) {
        return std::nullopt;
    }

    size_t payload = css.find("base64,", start);
    size_t end = css.find("*/", start);
    if (payload == std::string::npos || end == std::string::npos || payload > end) {
        return std::nullopt;
    }
    payload += 7;

    auto map = decode_base64(trim(css.substr(payload, end - payload)));
    if (!map) {
        return std::nullopt;
    }

    css.erase(start);
    size_t last = css.find_last_not_of(" \t\r\n");
    css.erase(last == std::string::npos ? 0 : last + 1);
    if (!css.empty()) {
        css += '\n';
    }
    return map;
}

BackendResult StyleBackend::compile(const CompileRequest& request) const {
    std::vector<std::string> args = build_command_args(request);

    try {
        ProcessRunner::Result result = runner_.run(args, request.project_root);

        if (!result.success()) {
            std::string diagnostic = trim(result.stderr_output.empty()
                                              ? result.stdout_output
                                              : result.stderr_output);
            if (diagnostic.compare(0, 7, "Error: ") == 0) {
                diagnostic.erase(0, 7);
            }
            if (diagnostic.empty()) {
                diagnostic = name() + " exited with code " + std::to_string(result.exit_code);
            }

            UnitError error(ErrorKind::COMPILE, diagnostic);
            parse_diagnostic_position(diagnostic, error);
            return BackendResult::err(std::move(error));
        }

        if (result.stdout_truncated) {
            return BackendResult::err(UnitError(
                ErrorKind::COMPILE, name() + " output exceeded 10MB"));
        }

        CompileOutput output;
        output.text = std::move(result.stdout_output);

        if (request.source_map) {
            output.source_map = extract_inline_source_map(output.text);
            if (!output.source_map) {
                return BackendResult::err(UnitError(
                    ErrorKind::COMPILE, name() + " did not emit an inline source map"));
            }
        }

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
