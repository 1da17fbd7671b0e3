/**
 * script_backend.hpp
 * JavaScript minification through esbuild (or a compatible minifier)
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_SCRIPT_BACKEND_HPP
#define WEB_COMPILE_SCRIPT_BACKEND_HPP

#include "backend/compiler_backend.hpp"
#include "config/config.hpp"
#include "process/process_runner.hpp"

#include <string>
#include <vector>

namespace web::compile {

// Runs: esbuild <source> --minify --legal-comments=inline|none --log-level=warning
class ScriptBackend : public CompilerBackend {
public:
    explicit ScriptBackend(ScriptConfig config);

    std::string name() const override { return runner_.program(); }
    BackendResult compile(const CompileRequest& request) const override;
    bool is_available() const override { return runner_.is_available(); }

    std::vector<std::string> build_command_args(const CompileRequest& request) const;

private:
    ScriptConfig config_;
    ProcessRunner runner_;
};

} // namespace web::compile

#endif // WEB_COMPILE_SCRIPT_BACKEND_HPP
