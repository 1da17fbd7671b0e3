/**
 * style_backend.hpp
 * SCSS/Sass -> CSS through the sassc executable
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_STYLE_BACKEND_HPP
#define WEB_COMPILE_STYLE_BACKEND_HPP

#include "backend/compiler_backend.hpp"
#include "config/config.hpp"
#include "process/process_runner.hpp"

#include <optional>
#include <string>
#include <vector>

namespace web::compile {

/**
 * Runs: sassc --style <format> --precision <n> --load-path <source dir>
 *             [--sourcemap=inline] <source>
 *
 * The working directory is the project root so the source path (and the
 * sources listed in a map) stay relative to it. With source maps on, the
 * inline data-URL comment is decoded and removed from the CSS.
 */
class StyleBackend : public CompilerBackend {
public:
    explicit StyleBackend(StyleConfig config);

    std::string name() const override { return runner_.program(); }
    BackendResult compile(const CompileRequest& request) const override;
    bool is_available() const override { return runner_.is_available(); }

    std::vector<std::string> build_command_args(const CompileRequest& request) const;

    /**
     * Split a trailing "sourceMappingURL=data:...;base64,..." comment off
     * the CSS and return the decoded map. nullopt when no inline map is
     * present; `css` is then left untouched.
     */
    static std::optional<std::string> extract_inline_source_map(std::string& css);

private:
    StyleConfig config_;
    ProcessRunner runner_;
};

} // namespace web::compile

#endif // WEB_COMPILE_STYLE_BACKEND_HPP
