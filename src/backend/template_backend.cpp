/**
 * template_backend.cpp
 * HTML templates rendered against configured variables and compiled names
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "backend/template_backend.hpp"
#include "core/compiled_name_registry.hpp"
#include "core/hash_namer.hpp"
#include "template/template_renderer.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace web::compile {

TemplateBackend::TemplateBackend(TemplateConfig config)
    : config_(std::move(config)) {}

BackendResult TemplateBackend::compile(const CompileRequest& request) const {
    const CompiledNameRegistry* registry = request.registry;
    const fs::path root = request.project_root;

    auto resolve = [registry](const std::string& source) {
        if (!registry) {
            throw DanglingReferenceError(source);
        }
        return registry->lookup(source);
    };

    TemplateRenderer renderer(config_.variables);

    renderer.add_filter("compiled_name", [resolve](const std::string& source) {
        return resolve(source).filename().string();
    });

    renderer.add_filter("compiled_path", [resolve](const std::string& source) {
        return resolve(source).generic_string();
    });

    renderer.add_filter("hash", [resolve, root](const std::string& source) {
        resolve(source);

        std::ifstream file(root / source, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Cannot read " + source);
        }
        std::ostringstream bytes;
        bytes << file.rdbuf();
        return HashNamer::content_hash(bytes.str());
    });

    RenderResult result = renderer.render(request.source_text);
    if (!result.success) {
        UnitError error(result.dangling_reference ? ErrorKind::DANGLING_REFERENCE
                                                  : ErrorKind::COMPILE,
                        result.error);
        error.line = result.line;
        error.column = result.column;
        return BackendResult::err(std::move(error));
    }

    CompileOutput output;
    output.text = normalize_trailing_newline(std::move(result.value));
    return BackendResult::ok(std::move(output));
}

} // namespace web::compile
