/**
 * compiler_backend.cpp
 * Backend factory and shared diagnostic helpers
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "backend/compiler_backend.hpp"
#include "backend/script_backend.hpp"
#include "backend/style_backend.hpp"
#include "backend/template_backend.hpp"
#include "config/config.hpp"

#include <regex>
#include <stdexcept>

namespace web::compile {

const CompilerBackend* BackendSet::for_kind(StageKind kind) const {
    switch (kind) {
        case StageKind::STYLE:    return style.get();
        case StageKind::SCRIPT:   return script.get();
        case StageKind::TEMPLATE: return templates.get();
    }
    return nullptr;
}

BackendSet make_backends(const Config& config) {
    BackendSet set;
    set.style = std::make_unique<StyleBackend>(config.styles);
    set.script = std::make_unique<ScriptBackend>(config.scripts);
    set.templates = std::make_unique<TemplateBackend>(config.templates);
    return set;
}

std::string normalize_trailing_newline(std::string text) {
    size_t end = text.find_last_not_of(" \t\r\n");
    if (end == std::string::npos) {
        return "\n";
    }
    text.erase(end + 1);
    text += '\n';
    return text;
}

namespace {

std::optional<uint32_t> to_position(const std::string& digits) {
    try {
        return static_cast<uint32_t>(std::stoul(digits));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

} // namespace

void parse_diagnostic_position(const std::string& diagnostic, UnitError& error) {
    // sassc: "on line 3:7 of src/a.scss" or "line 3:7"
    static const std::regex sass_position(R"(line (\d+):(\d+))");
    // esbuild: "    src/app.js:3:7: ERROR: ..."
    static const std::regex file_position(R"([^\s:]+:(\d+):(\d+):)");
    static const std::regex line_only(R"(line (\d+))");

    std::smatch match;
    if (std::regex_search(diagnostic, match, sass_position) ||
        std::regex_search(diagnostic, match, file_position)) {
        error.line = to_position(match[1].str());
        error.column = to_position(match[2].str());
    } else if (std::regex_search(diagnostic, match, line_only)) {
        error.line = to_position(match[1].str());
    }
}

} // namespace web::compile
