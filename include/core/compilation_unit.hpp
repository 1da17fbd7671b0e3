#ifndef WEB_COMPILE_COMPILATION_UNIT_HPP
#define WEB_COMPILE_COMPILATION_UNIT_HPP

// compilation_unit.hpp - One (source, output) pair scheduled for a stage
// Part of web_compile - Web Asset Compiler
//
// Units are produced by the PathResolver and never change afterwards.
// All paths are relative to the project root (the config file directory).

#include <filesystem>
#include <string>

namespace web::compile {

namespace fs = std::filesystem;

// Stages run in declaration order: styles, then scripts, then templates
enum class StageKind {
    STYLE,
    SCRIPT,
    TEMPLATE
};

inline const char* stage_kind_name(StageKind kind) {
    switch (kind) {
        case StageKind::STYLE:    return "style";
        case StageKind::SCRIPT:   return "script";
        case StageKind::TEMPLATE: return "template";
    }
    return "unknown";
}

// Options that travel with a unit independent of the backend
struct UnitOptions {
    bool source_map = false;     // write <source name>.map.json beside the output
};

struct CompilationUnit {
    StageKind kind = StageKind::STYLE;
    fs::path source_path;        // e.g. "src/scss/main.scss"
    fs::path output_template;    // e.g. "dist/css/main.[hash].css"
    UnitOptions options;

    bool operator==(const CompilationUnit& other) const {
        return kind == other.kind
            && source_path == other.source_path
            && output_template == other.output_template;
    }
};

} // namespace web::compile

#endif // WEB_COMPILE_COMPILATION_UNIT_HPP
