/**
 * Template Renderer
 *
 * Minimal expression substitution for HTML templates:
 *
 *   {{ title }}                            configured variable
 *   {{ 'src/scss/main.scss' | compiled_name }}
 *   {{ "src/js/app.js" | compiled_path }}
 *   {{ name | upper | hash }}               filters chain left to right
 *   {# comment #}                          dropped from the output
 *
 * Filters are registered by the caller (the template backend wires the
 * compiled-name lookups to the run's registry). Statement blocks ({% %})
 * are not supported and are reported as errors.
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_TEMPLATE_RENDERER_HPP
#define WEB_COMPILE_TEMPLATE_RENDERER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace web::compile {

/**
 * Render result
 */
struct RenderResult {
    bool success;
    std::string value;
    std::string error;
    bool dangling_reference = false;   // a filter looked up an unregistered source
    std::optional<uint32_t> line;
    std::optional<uint32_t> column;

    static RenderResult ok(std::string val) {
        return {true, std::move(val), "", false, std::nullopt, std::nullopt};
    }

    static RenderResult err(std::string msg, uint32_t line, uint32_t column) {
        return {false, "", std::move(msg), false, line, column};
    }
};

class TemplateRenderer {
public:
    /**
     * A filter maps the piped value to a new value. It reports failure by
     * throwing; DanglingReferenceError is surfaced separately.
     */
    using Filter = std::function<std::string(const std::string& value)>;

    explicit TemplateRenderer(std::map<std::string, std::string> variables = {});

    void set_variable(const std::string& name, const std::string& value);
    bool has_variable(const std::string& name) const;

    void add_filter(const std::string& name, Filter filter);
    bool has_filter(const std::string& name) const;

    /**
     * Render a template
     *
     * @param input Template text
     * @return Rendered text, or the first error with its 1-based position
     */
    RenderResult render(const std::string& input) const;

private:
    std::map<std::string, std::string> variables_;
    std::unordered_map<std::string, Filter> filters_;

    // Evaluate the text between {{ and }}; `offset` locates it for errors
    RenderResult evaluate(const std::string& expression,
                          const std::string& input,
                          size_t offset) const;
};

} // namespace web::compile

#endif // WEB_COMPILE_TEMPLATE_RENDERER_HPP
