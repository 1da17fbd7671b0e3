/**
 * config_loader.cpp
 * web-compile.abc -> validated Config
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "config/config_loader.hpp"
#include "config/abc_parser.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>

namespace web::compile {

using abc::ASTNode;
using abc::ArrayNode;
using abc::KeyValuePair;
using abc::ObjectNode;

namespace {

// "continue-on-error" and "continue_on_error" name the same option
std::string option_name(const std::string& key) {
    std::string name = key;
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

/**
 * Typed accessors that report errors at the offending node
 */
class Validator {
public:
    explicit Validator(std::string file) : file_(std::move(file)) {}

    ConfigurationError error(uint32_t line, uint32_t column, const std::string& message) const {
        std::ostringstream oss;
        oss << file_ << ":" << line << ":" << column << ": " << message;
        return ConfigurationError(oss.str());
    }

    ConfigurationError error(const ASTNode* at, const std::string& message) const {
        return error(at->line, at->column, message);
    }

    ConfigurationError wrong_type(const KeyValuePair& m, const char* expected) const {
        return error(m.value, "'" + m.key + "' must be " + expected + ", got " +
                              abc::nodeKindName(m.value->getKind()));
    }

    bool as_bool(const KeyValuePair& m) const {
        if (m.value->getKind() != ASTNode::Kind::Boolean) {
            throw wrong_type(m, "a boolean");
        }
        return static_cast<const abc::BooleanNode*>(m.value)->value;
    }

    int64_t as_int(const KeyValuePair& m, int64_t min, int64_t max) const {
        if (m.value->getKind() != ASTNode::Kind::Integer) {
            throw wrong_type(m, "an integer");
        }
        int64_t value = static_cast<const abc::IntegerNode*>(m.value)->value;
        if (value < min || value > max) {
            std::ostringstream oss;
            oss << "'" << m.key << "' must be between " << min << " and " << max
                << ", got " << value;
            throw error(m.value, oss.str());
        }
        return value;
    }

    std::string as_string(const KeyValuePair& m) const {
        if (m.value->getKind() != ASTNode::Kind::String) {
            throw wrong_type(m, "a string");
        }
        return static_cast<const abc::StringNode*>(m.value)->value;
    }

    std::string as_nonempty_string(const KeyValuePair& m) const {
        std::string value = as_string(m);
        if (value.empty()) {
            throw error(m.value, "'" + m.key + "' must not be empty");
        }
        return value;
    }

    // A single string is accepted where a list is expected
    std::vector<std::string> as_string_list(const KeyValuePair& m) const {
        if (m.value->getKind() == ASTNode::Kind::String) {
            return {as_nonempty_string(m)};
        }
        if (m.value->getKind() != ASTNode::Kind::Array) {
            throw wrong_type(m, "a list of strings");
        }

        std::vector<std::string> values;
        for (const ASTNode* element : static_cast<const ArrayNode*>(m.value)->elements) {
            if (element->getKind() != ASTNode::Kind::String) {
                throw error(element, "'" + m.key + "' entries must be strings");
            }
            const std::string& value = static_cast<const abc::StringNode*>(element)->value;
            if (value.empty()) {
                throw error(element, "'" + m.key + "' entries must not be empty");
            }
            values.push_back(value);
        }
        return values;
    }

    const ObjectNode* as_object(const KeyValuePair& m) const {
        if (m.value->getKind() != ASTNode::Kind::Object) {
            throw wrong_type(m, "an object");
        }
        return static_cast<const ObjectNode*>(m.value);
    }

    ConfigurationError unknown_key(const KeyValuePair& m, const std::string& section) const {
        return error(m.line, m.column, "Unknown key '" + m.key + "' in " + section);
    }

private:
    std::string file_;
};

// =============================================================================
// Sections
// =============================================================================

// Options every asset kind shares; false when `name` is not one of them
bool read_asset_option(const Validator& v, const std::string& name,
                       const KeyValuePair& m, AssetOptions& assets) {
    if (name == "files") {
        for (const auto& entry : v.as_object(m)->members) {
            if (entry.key.empty()) {
                throw v.error(entry.line, entry.column, "Empty source path in 'files'");
            }
            if (entry.value->getKind() != ASTNode::Kind::String) {
                throw v.error(entry.value, "Output for '" + entry.key + "' must be a string");
            }
            std::string output = static_cast<const abc::StringNode*>(entry.value)->value;
            if (output.empty()) {
                throw v.error(entry.value, "Empty output path for '" + entry.key + "'");
            }
            assets.files.push_back({entry.key, output});
        }
    } else if (name == "paths") {
        assets.paths = v.as_string_list(m);
    } else if (name == "recurse") {
        assets.recurse = v.as_bool(m);
    } else if (name == "partial_depth") {
        assets.partial_depth = static_cast<int>(v.as_int(m, 0, 1024));
    } else if (name == "translate") {
        assets.translate = v.as_string_list(m);
    } else if (name == "hash_filenames") {
        assets.hash_filenames = v.as_bool(m);
    } else if (name == "encoding") {
        std::string encoding = v.as_string(m);
        std::string lowered = encoding;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered != "utf8" && lowered != "utf-8" && lowered != "ascii") {
            throw v.error(m.value, "Unsupported encoding '" + encoding +
                                   "' (expected utf8, utf-8 or ascii)");
        }
        assets.encoding = lowered;
    } else {
        return false;
    }
    return true;
}

void read_styles(const Validator& v, const ObjectNode* section, StyleConfig& styles) {
    for (const auto& m : section->members) {
        if (m.value->getKind() == ASTNode::Kind::Null) continue;

        std::string name = option_name(m.key);
        if (read_asset_option(v, name, m, styles.assets)) continue;

        if (name == "format") {
            std::string format = v.as_string(m);
            auto style = parse_output_style(format);
            if (!style) {
                throw v.error(m.value, "Unknown format '" + format +
                                       "' (expected nested, expanded, compact or compressed)");
            }
            styles.format = *style;
        } else if (name == "precision") {
            styles.precision = static_cast<int>(v.as_int(m, 0, 64));
        } else if (name == "sourcemap") {
            styles.sourcemap = v.as_bool(m);
        } else if (name == "compiler") {
            styles.compiler = v.as_nonempty_string(m);
        } else {
            throw v.unknown_key(m, "styles");
        }
    }
}

void read_scripts(const Validator& v, const ObjectNode* section, ScriptConfig& scripts) {
    for (const auto& m : section->members) {
        if (m.value->getKind() == ASTNode::Kind::Null) continue;

        std::string name = option_name(m.key);
        if (read_asset_option(v, name, m, scripts.assets)) continue;

        if (name == "comments") {
            scripts.comments = v.as_bool(m);
        } else if (name == "minifier") {
            scripts.minifier = v.as_nonempty_string(m);
        } else {
            throw v.unknown_key(m, "scripts");
        }
    }
}

void read_templates(const Validator& v, const ObjectNode* section, TemplateConfig& templates) {
    for (const auto& m : section->members) {
        if (m.value->getKind() == ASTNode::Kind::Null) continue;

        std::string name = option_name(m.key);
        if (read_asset_option(v, name, m, templates.assets)) continue;

        if (name != "variables") {
            throw v.unknown_key(m, "templates");
        }

        for (const auto& var : v.as_object(m)->members) {
            switch (var.value->getKind()) {
                case ASTNode::Kind::String:
                    templates.variables[var.key] =
                        static_cast<const abc::StringNode*>(var.value)->value;
                    break;
                case ASTNode::Kind::Integer:
                    templates.variables[var.key] =
                        std::to_string(static_cast<const abc::IntegerNode*>(var.value)->value);
                    break;
                case ASTNode::Kind::Boolean:
                    templates.variables[var.key] =
                        static_cast<const abc::BooleanNode*>(var.value)->value ? "true" : "false";
                    break;
                default:
                    throw v.error(var.value, "Template variable '" + var.key +
                                             "' must be a string, integer or boolean");
            }
        }
    }
}

void read_root(const Validator& v, const ObjectNode* root, Config& config) {
    for (const auto& m : root->members) {
        if (m.value->getKind() == ASTNode::Kind::Null) continue;

        std::string name = option_name(m.key);
        if (name == "styles") {
            read_styles(v, v.as_object(m), config.styles);
        } else if (name == "scripts") {
            read_scripts(v, v.as_object(m), config.scripts);
        } else if (name == "templates") {
            read_templates(v, v.as_object(m), config.templates);
        } else if (name == "continue_on_error") {
            config.run.continue_on_error = v.as_bool(m);
        } else if (name == "test_run") {
            config.run.test_run = v.as_bool(m);
        } else if (name == "git_add") {
            config.run.git_add = v.as_bool(m);
        } else if (name == "exit_code") {
            config.run.changed_exit_code = static_cast<int>(v.as_int(m, 1, 255));
        } else if (name == "error_code") {
            config.run.error_exit_code = static_cast<int>(v.as_int(m, 1, 255));
        } else if (name == "jobs") {
            config.run.jobs = static_cast<size_t>(v.as_int(m, 1, 1024));
        } else {
            throw v.unknown_key(m, "configuration");
        }
    }
}

} // namespace

// =============================================================================
// ConfigLoader
// =============================================================================

void ConfigLoader::validate_run_options(const RunOptions& run) {
    auto in_range = [](int code) { return code >= 1 && code <= 255; };

    if (!in_range(run.changed_exit_code)) {
        throw ConfigurationError("exit_code must be between 1 and 255, got " +
                                 std::to_string(run.changed_exit_code));
    }
    if (!in_range(run.error_exit_code)) {
        throw ConfigurationError("error_code must be between 1 and 255, got " +
                                 std::to_string(run.error_exit_code));
    }
    if (run.changed_exit_code == run.error_exit_code) {
        throw ConfigurationError("exit_code and error_code must differ (both are " +
                                 std::to_string(run.error_exit_code) + ")");
    }
    if (run.jobs < 1) {
        throw ConfigurationError("jobs must be at least 1");
    }
}

Config ConfigLoader::parse(std::string_view source,
                           const fs::path& config_file,
                           const fs::path& project_root) {
    const std::string file = config_file.string();

    abc::ArenaAllocator arena;
    abc::Lexer lexer(source, file);
    abc::Parser parser(lexer, arena);
    abc::ABCDocument doc = parser.parse();

    if (parser.hasErrors() || !doc.valid()) {
        std::ostringstream oss;
        oss << "Invalid configuration";
        for (const auto& err : parser.getErrors()) {
            oss << "\n  " << err;
        }
        throw ConfigurationError(oss.str());
    }

    const ObjectNode* root = doc.root;
    Validator v(file);

    // { "web-compile": { ... } }
    if (root->members.size() == 1 && root->members[0].key == WRAPPER_KEY) {
        root = v.as_object(root->members[0]);
    }

    Config config;
    config.project_root = project_root;
    config.config_file = config_file;
    read_root(v, root, config);

    try {
        validate_run_options(config.run);
    } catch (const ConfigurationError& e) {
        throw ConfigurationError(file + ": " + e.what());
    }

    return config;
}

Config ConfigLoader::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw ConfigurationError("Configuration file not found: " + path.string());
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ConfigurationError("Cannot read configuration file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    std::string source = buffer.str();

    fs::path absolute = fs::absolute(path, ec);
    if (ec) {
        throw ConfigurationError("Cannot resolve " + path.string() + ": " + ec.message());
    }
    fs::path root = absolute.lexically_normal().parent_path();

    return parse(source, path, root);
}

} // namespace web::compile
