/**
 * path_resolver.cpp
 * Implementation of configuration -> compilation unit expansion
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "core/path_resolver.hpp"
#include "core/hash_namer.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <unordered_set>

namespace web::compile {

namespace {

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size()
        && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Component-wise prefix test: "src/scss" prefixes "src/scss/a" but not "src/scss2"
bool has_prefix(const fs::path& path, const fs::path& prefix) {
    if (prefix.empty() || prefix == ".") {
        return true;
    }
    auto p = path.begin();
    for (auto q = prefix.begin(); q != prefix.end(); ++q, ++p) {
        if (p == path.end() || *p != *q) {
            return false;
        }
    }
    return true;
}

size_t depth_of(const fs::path& path) {
    return static_cast<size_t>(std::distance(path.begin(), path.end()));
}

} // namespace

PathResolver::PathResolver(fs::path project_root)
    : project_root_(project_root.lexically_normal()) {
}

// =============================================================================
// Naming rules
// =============================================================================

bool PathResolver::is_partial(const fs::path& path) {
    std::string name = path.filename().string();
    return !name.empty() && name[0] == PARTIAL_MARKER;
}

bool PathResolver::is_source_for(StageKind kind, const fs::path& path) {
    std::string name = lower(path.filename().string());
    std::string ext = lower(path.extension().string());

    switch (kind) {
        case StageKind::STYLE:
            return ext == ".scss" || ext == ".sass";
        case StageKind::SCRIPT:
            return ext == ".js" && !ends_with(name, ".min.js");
        case StageKind::TEMPLATE:
            return ext == ".j2" || ext == ".jinja";
    }
    return false;
}

fs::path PathResolver::natural_output_name(StageKind kind,
                                           const fs::path& source,
                                           bool hash_filenames) {
    std::string stem = source.stem().string();
    std::string name;

    switch (kind) {
        case StageKind::STYLE:
            name = stem + ".css";
            break;
        case StageKind::SCRIPT:
            name = stem + ".min.js";
            break;
        case StageKind::TEMPLATE: {
            std::string ext = lower(source.extension().string());
            if (ext != ".j2" && ext != ".jinja") {
                throw ConfigurationError(
                    "Cannot derive an output name for template '" + source.string() +
                    "' (expected a .j2 or .jinja extension)");
            }
            name = stem;
            break;
        }
    }

    if (name.empty()) {
        throw ConfigurationError("Cannot derive an output name for '" + source.string() + "'");
    }

    if (!hash_filenames) {
        return name;
    }

    fs::path named(name);
    std::string ext = named.extension().string();
    if (ext.empty()) {
        return name + "." + HashNamer::PLACEHOLDER;
    }
    return named.stem().string() + "." + HashNamer::PLACEHOLDER + ext;
}

void PathResolver::validate_output_template(const fs::path& output_template) {
    const std::string filename = output_template.filename().string();
    if (filename.empty()) {
        throw ConfigurationError("Output path has no filename: '" + output_template.string() + "'");
    }

    if (output_template.parent_path().string().find(HashNamer::PLACEHOLDER) != std::string::npos) {
        throw ConfigurationError(
            "The [hash] placeholder is only allowed in the filename: '" +
            output_template.string() + "'");
    }

    size_t first = filename.find(HashNamer::PLACEHOLDER);
    if (first != std::string::npos &&
        filename.find(HashNamer::PLACEHOLDER, first + 1) != std::string::npos) {
        throw ConfigurationError(
            "The [hash] placeholder may appear only once: '" + output_template.string() + "'");
    }
}

// =============================================================================
// Paths
// =============================================================================

fs::path PathResolver::relative_to_root(const fs::path& path) const {
    fs::path normal = path.lexically_normal();

    if (normal.is_absolute()) {
        fs::path rel = normal.lexically_relative(project_root_);
        if (!rel.empty() && *rel.begin() != "..") {
            normal = rel;
        }
    }

    // "src/scss/" normalizes with an empty filename
    if (!normal.empty() && !normal.has_filename() && normal.has_relative_path()) {
        normal = normal.parent_path();
    }
    return normal;
}

fs::path PathResolver::absolute(const fs::path& relative) const {
    if (relative.is_absolute()) {
        return relative;
    }
    return project_root_ / relative;
}

std::vector<TranslatePair> PathResolver::parse_translate(
    const std::vector<std::string>& specs) const {

    std::vector<TranslatePair> pairs;
    for (const auto& spec : specs) {
        size_t colon = spec.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= spec.size()) {
            throw ConfigurationError(
                "Malformed translate option: '" + spec + "' (expected 'source:output')");
        }

        TranslatePair pair;
        pair.source_root = relative_to_root(spec.substr(0, colon));
        pair.output_root = relative_to_root(spec.substr(colon + 1));

        std::error_code ec;
        if (!fs::is_directory(absolute(pair.source_root), ec)) {
            throw ConfigurationError(
                "Translate source root is not a directory: '" + pair.source_root.string() + "'");
        }

        pairs.push_back(std::move(pair));
    }
    return pairs;
}

fs::path PathResolver::output_for(StageKind kind,
                                  const fs::path& source,
                                  bool hash_filenames,
                                  const std::vector<TranslatePair>& translate) const {
    fs::path parent = source.parent_path();
    fs::path out_dir = parent;

    // Shortest matching source root wins; ties go to the earlier pair
    const TranslatePair* best = nullptr;
    for (const auto& pair : translate) {
        if (!has_prefix(parent, pair.source_root)) continue;
        if (!best || depth_of(pair.source_root) < depth_of(best->source_root)) {
            best = &pair;
        }
    }

    if (best) {
        fs::path rel = parent.lexically_relative(best->source_root);
        if (best->source_root.empty() || best->source_root == ".") {
            rel = parent;
        }
        out_dir = (rel.empty() || rel == ".") ? best->output_root : best->output_root / rel;
    }

    return (out_dir / natural_output_name(kind, source, hash_filenames)).lexically_normal();
}

// =============================================================================
// Discovery
// =============================================================================

void PathResolver::scan_directory(StageKind kind, const fs::path& dir, bool recurse,
                                  std::vector<fs::path>& out) const {
    std::error_code ec;
    fs::directory_iterator it(absolute(dir), ec);
    if (ec) {
        throw ConfigurationError("Cannot read directory '" + dir.string() + "': " + ec.message());
    }

    std::vector<fs::directory_entry> entries;
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw ConfigurationError(
                "Cannot read directory '" + dir.string() + "': " + ec.message());
        }
        entries.push_back(*it);
    }
    if (ec) {
        throw ConfigurationError("Cannot read directory '" + dir.string() + "': " + ec.message());
    }

    std::sort(entries.begin(), entries.end(),
              [](const fs::directory_entry& a, const fs::directory_entry& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& entry : entries) {
        fs::path name = entry.path().filename();
        fs::path rel = dir.empty() ? name : dir / name;

        std::error_code st_ec;
        fs::file_status link_status = entry.symlink_status(st_ec);
        if (st_ec) continue;

        if (fs::is_directory(link_status)) {
            if (recurse) {
                scan_directory(kind, rel, recurse, out);
            }
            continue;
        }

        if (!entry.is_regular_file(st_ec)) continue;
        if (is_partial(name) || !is_source_for(kind, name)) continue;

        out.push_back(rel.lexically_normal());
    }
}

std::vector<fs::path> PathResolver::list_sources(StageKind kind,
                                                 const fs::path& dir,
                                                 bool recurse) const {
    std::vector<fs::path> sources;
    scan_directory(kind, relative_to_root(dir), recurse, sources);
    return sources;
}

std::vector<fs::path> PathResolver::expand_partial(StageKind kind,
                                                   const fs::path& partial,
                                                   int depth) const {
    std::vector<fs::path> sources;
    std::unordered_set<std::string> seen;

    fs::path dir = relative_to_root(partial).parent_path();
    for (int level = 0; level <= depth; ++level) {
        std::vector<fs::path> found;
        scan_directory(kind, dir, false, found);
        for (auto& source : found) {
            if (seen.insert(source.generic_string()).second) {
                sources.push_back(std::move(source));
            }
        }

        // Stop at the project root (relative) or the filesystem root
        if (dir.empty()) break;
        fs::path parent = dir.parent_path();
        if (parent == dir) break;
        dir = parent;
    }

    return sources;
}

// =============================================================================
// Resolution
// =============================================================================

std::vector<CompilationUnit> PathResolver::resolve(StageKind kind,
                                                   const AssetOptions& assets,
                                                   const UnitOptions& unit_options) const {
    const std::vector<TranslatePair> translate = parse_translate(assets.translate);

    std::vector<CompilationUnit> units;
    std::unordered_set<std::string> seen;

    auto emit = [&](const fs::path& source, const fs::path& output) {
        fs::path source_norm = source.lexically_normal();
        fs::path output_norm = output.lexically_normal();
        validate_output_template(output_norm);

        if (!seen.insert(source_norm.generic_string()).second) {
            return;
        }

        CompilationUnit unit;
        unit.kind = kind;
        unit.source_path = std::move(source_norm);
        unit.output_template = std::move(output_norm);
        unit.options = unit_options;
        units.push_back(std::move(unit));
    };

    for (const auto& mapping : assets.files) {
        if (mapping.source.empty() || mapping.output.empty()) {
            throw ConfigurationError(
                std::string("Empty path in ") + stage_kind_name(kind) + " file mapping");
        }
        emit(relative_to_root(mapping.source), relative_to_root(mapping.output));
    }

    for (const auto& entry : assets.paths) {
        fs::path rel = relative_to_root(entry);

        std::error_code ec;
        fs::file_status status = fs::status(absolute(rel), ec);
        if (ec || !fs::exists(status)) {
            throw ConfigurationError("Path does not exist: '" + entry + "'");
        }

        if (fs::is_directory(status)) {
            for (const auto& source : list_sources(kind, rel, assets.recurse)) {
                emit(source, output_for(kind, source, assets.hash_filenames, translate));
            }
        } else if (is_partial(rel)) {
            for (const auto& source : expand_partial(kind, rel, assets.partial_depth)) {
                emit(source, output_for(kind, source, assets.hash_filenames, translate));
            }
        } else {
            if (!is_source_for(kind, rel)) {
                throw ConfigurationError(
                    "'" + entry + "' is not a " + stage_kind_name(kind) + " source");
            }
            fs::path output = output_for(kind, rel, assets.hash_filenames, translate);
            if (output == rel) {
                throw ConfigurationError(
                    "Output for '" + entry + "' would overwrite the source");
            }
            emit(rel, std::move(output));
        }
    }

    return units;
}

} // namespace web::compile
