/**
 * config.cpp
 * Normalized configuration accessors
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "config/config.hpp"

#include <sstream>

namespace web::compile {

const char* output_style_name(OutputStyle style) {
    switch (style) {
        case OutputStyle::NESTED:     return "nested";
        case OutputStyle::EXPANDED:   return "expanded";
        case OutputStyle::COMPACT:    return "compact";
        case OutputStyle::COMPRESSED: return "compressed";
    }
    return "compressed";
}

std::optional<OutputStyle> parse_output_style(const std::string& name) {
    if (name == "nested")     return OutputStyle::NESTED;
    if (name == "expanded")   return OutputStyle::EXPANDED;
    if (name == "compact")    return OutputStyle::COMPACT;
    if (name == "compressed") return OutputStyle::COMPRESSED;
    return std::nullopt;
}

const AssetOptions& Config::assets_for(StageKind kind) const {
    switch (kind) {
        case StageKind::STYLE:    return styles.assets;
        case StageKind::SCRIPT:   return scripts.assets;
        case StageKind::TEMPLATE: return templates.assets;
    }
    return styles.assets;
}

UnitOptions Config::unit_options_for(StageKind kind) const {
    UnitOptions options;
    options.source_map = kind == StageKind::STYLE && styles.sourcemap;
    return options;
}

namespace {

void describe_assets(std::ostringstream& oss, const AssetOptions& assets) {
    for (const auto& mapping : assets.files) {
        oss << "    file: " << mapping.source << " -> " << mapping.output << "\n";
    }
    for (const auto& path : assets.paths) {
        oss << "    path: " << path << "\n";
    }
    for (const auto& pair : assets.translate) {
        oss << "    translate: " << pair << "\n";
    }
    oss << "    recurse: " << (assets.recurse ? "true" : "false")
        << ", partial_depth: " << assets.partial_depth
        << ", hash_filenames: " << (assets.hash_filenames ? "true" : "false") << "\n";
}

} // namespace

std::string Config::describe() const {
    std::ostringstream oss;
    oss << "Config: " << config_file.string() << "\n";
    oss << "Project root: " << project_root.string() << "\n";

    if (!styles.assets.empty()) {
        oss << "  styles (" << styles.compiler << ", " << output_style_name(styles.format)
            << ", precision " << styles.precision
            << (styles.sourcemap ? ", sourcemap" : "") << ")\n";
        describe_assets(oss, styles.assets);
    }
    if (!scripts.assets.empty()) {
        oss << "  scripts (" << scripts.minifier
            << (scripts.comments ? ", keep comments" : "") << ")\n";
        describe_assets(oss, scripts.assets);
    }
    if (!templates.assets.empty()) {
        oss << "  templates (" << templates.variables.size() << " variables)\n";
        describe_assets(oss, templates.assets);
    }

    oss << "  continue_on_error: " << (run.continue_on_error ? "true" : "false")
        << ", test_run: " << (run.test_run ? "true" : "false")
        << ", git_add: " << (run.git_add ? "true" : "false")
        << ", jobs: " << run.jobs << "\n";
    oss << "  exit codes: changed=" << run.changed_exit_code
        << " error=" << run.error_exit_code << "\n";
    return oss.str();
}

} // namespace web::compile
