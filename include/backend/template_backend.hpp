/**
 * template_backend.hpp
 * HTML templates rendered against configured variables and compiled names
 *
 * Filters bound to the run's registry:
 *   compiled_name  'src/a.scss' -> "a.3f2a...9c.css"
 *   compiled_path  'src/a.scss' -> "dist/a.3f2a...9c.css"
 *   hash           'src/a.scss' -> MD5 of the source file's bytes
 * Each one fails with DanglingReferenceError for an unregistered source.
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_TEMPLATE_BACKEND_HPP
#define WEB_COMPILE_TEMPLATE_BACKEND_HPP

#include "backend/compiler_backend.hpp"
#include "config/config.hpp"

namespace web::compile {

class TemplateBackend : public CompilerBackend {
public:
    explicit TemplateBackend(TemplateConfig config);

    std::string name() const override { return "template"; }
    BackendResult compile(const CompileRequest& request) const override;

private:
    TemplateConfig config_;
};

} // namespace web::compile

#endif // WEB_COMPILE_TEMPLATE_BACKEND_HPP
