/**
 * Template Renderer Implementation
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "template/template_renderer.hpp"
#include "core/compiled_name_registry.hpp"

#include <cctype>
#include <stdexcept>

namespace web::compile {

namespace {

struct Position {
    uint32_t line = 1;
    uint32_t column = 1;
};

// Only computed on the error path
Position position_of(const std::string& text, size_t offset) {
    Position pos;
    for (size_t i = 0; i < offset && i < text.size(); ++i) {
        if (text[i] == '\n') {
            pos.line++;
            pos.column = 1;
        } else {
            pos.column++;
        }
    }
    return pos;
}

bool is_identifier_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_identifier_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

void skip_whitespace(const std::string& s, size_t& i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) {
        ++i;
    }
}

std::string read_identifier(const std::string& s, size_t& i) {
    size_t start = i;
    while (i < s.size() && is_identifier_char(s[i])) {
        ++i;
    }
    return s.substr(start, i - start);
}

} // namespace

// =============================================================================
// Setup
// =============================================================================

TemplateRenderer::TemplateRenderer(std::map<std::string, std::string> variables)
    : variables_(std::move(variables)) {}

void TemplateRenderer::set_variable(const std::string& name, const std::string& value) {
    variables_[name] = value;
}

bool TemplateRenderer::has_variable(const std::string& name) const {
    return variables_.find(name) != variables_.end();
}

void TemplateRenderer::add_filter(const std::string& name, Filter filter) {
    filters_[name] = std::move(filter);
}

bool TemplateRenderer::has_filter(const std::string& name) const {
    return filters_.find(name) != filters_.end();
}

// =============================================================================
// Rendering
// =============================================================================

RenderResult TemplateRenderer::render(const std::string& input) const {
    std::string output;
    output.reserve(input.size());
    size_t pos = 0;

    while (pos < input.size()) {
        // Next "{{", "{#" or "{%"
        size_t open = pos;
        while ((open = input.find('{', open)) != std::string::npos) {
            if (open + 1 < input.size()) {
                char next = input[open + 1];
                if (next == '{' || next == '#' || next == '%') break;
            }
            ++open;
        }

        if (open == std::string::npos) {
            output.append(input, pos, std::string::npos);
            break;
        }

        output.append(input, pos, open - pos);
        const char kind = input[open + 1];

        if (kind == '%') {
            Position at = position_of(input, open);
            return RenderResult::err("Statement blocks are not supported", at.line, at.column);
        }

        const char* close = (kind == '{') ? "}}" : "#}";
        size_t end = input.find(close, open + 2);
        if (end == std::string::npos) {
            Position at = position_of(input, open);
            return RenderResult::err(kind == '{' ? "Unterminated expression"
                                                 : "Unterminated comment",
                                     at.line, at.column);
        }

        if (kind == '{') {
            auto result = evaluate(input.substr(open + 2, end - open - 2), input, open + 2);
            if (!result.success) {
                return result;
            }
            output += result.value;
        }

        pos = end + 2;
    }

    return RenderResult::ok(std::move(output));
}

RenderResult TemplateRenderer::evaluate(const std::string& expression,
                                        const std::string& input,
                                        size_t offset) const {
    auto fail = [&](const std::string& message, size_t at) {
        Position p = position_of(input, offset + at);
        return RenderResult::err(message, p.line, p.column);
    };

    size_t i = 0;
    skip_whitespace(expression, i);
    if (i >= expression.size()) {
        return fail("Empty expression", i);
    }

    std::string value;

    // Primary: string literal or variable
    char c = expression[i];
    if (c == '\'' || c == '"') {
        const char quote = c;
        size_t start = i++;
        bool closed = false;
        while (i < expression.size()) {
            char ch = expression[i++];
            if (ch == '\\' && i < expression.size()) {
                value += expression[i++];
            } else if (ch == quote) {
                closed = true;
                break;
            } else {
                value += ch;
            }
        }
        if (!closed) {
            return fail("Unterminated string literal", start);
        }
    } else if (is_identifier_start(c)) {
        size_t start = i;
        std::string name = read_identifier(expression, i);
        auto it = variables_.find(name);
        if (it == variables_.end()) {
            return fail("Undefined variable: " + name, start);
        }
        value = it->second;
    } else {
        return fail(std::string("Unexpected character '") + c + "' in expression", i);
    }

    // Filter chain
    while (true) {
        skip_whitespace(expression, i);
        if (i >= expression.size()) break;

        if (expression[i] != '|') {
            return fail(std::string("Unexpected character '") + expression[i] +
                        "' in expression", i);
        }
        ++i;
        skip_whitespace(expression, i);

        size_t start = i;
        if (i >= expression.size() || !is_identifier_start(expression[i])) {
            return fail("Expected a filter name after '|'", i);
        }
        std::string name = read_identifier(expression, i);

        auto it = filters_.find(name);
        if (it == filters_.end()) {
            return fail("Unknown filter: " + name, start);
        }

        try {
            value = it->second(value);
        } catch (const DanglingReferenceError& e) {
            RenderResult result = fail(e.what(), start);
            result.dangling_reference = true;
            return result;
        } catch (const std::exception& e) {
            return fail("Filter '" + name + "' failed: " + e.what(), start);
        }
    }

    return RenderResult::ok(std::move(value));
}

} // namespace web::compile
