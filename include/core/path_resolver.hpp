/**
 * path_resolver.hpp
 * Expands asset configuration into concrete compilation units
 *
 * Two configuration shapes feed the resolver:
 * - files: explicit "source: output" entries, one unit each, verbatim
 * - paths: files or directories; directories are scanned for sources of the
 *   stage's kind, partial files (leading '_') pull in their non-partial
 *   siblings up to `partial_depth` ancestor directories
 *
 * Natural output names per kind:
 *   style     main.scss      -> main.css       (.scss, .sass)
 *   script    app.js         -> app.min.js     (.js, not .min.js)
 *   template  index.html.j2  -> index.html     (.j2, .jinja)
 * With hash_filenames, ".[hash]" goes before the final extension.
 *
 * Ordering is canonical (entries sorted by filename, depth-first), so an
 * unchanged tree always yields the same unit sequence.
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_PATH_RESOLVER_HPP
#define WEB_COMPILE_PATH_RESOLVER_HPP

#include "core/compilation_unit.hpp"
#include "config/config.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace web::compile {

namespace fs = std::filesystem;

struct TranslatePair {
    fs::path source_root;
    fs::path output_root;
};

class PathResolver {
public:
    static constexpr char PARTIAL_MARKER = '_';

    explicit PathResolver(fs::path project_root);

    /**
     * Resolve every unit of one stage.
     *
     * File mappings come first, in declaration order, then units discovered
     * from `paths`. Units with an already-seen source are dropped.
     *
     * @throws ConfigurationError for missing/unreadable paths, malformed or
     *         unmatched translate pairs, and misplaced [hash] placeholders
     */
    std::vector<CompilationUnit> resolve(StageKind kind,
                                         const AssetOptions& assets,
                                         const UnitOptions& unit_options = {}) const;

    /**
     * Sources pulled in by an explicit partial file.
     *
     * Searches the partial's directory and `depth` ancestors (nearest first)
     * for non-partial sources of `kind`, non-recursively. Never returns the
     * partial itself. Paths are relative to the project root.
     */
    std::vector<fs::path> expand_partial(StageKind kind,
                                         const fs::path& partial,
                                         int depth) const;

    /**
     * Non-partial sources of `kind` under a directory, canonical order.
     */
    std::vector<fs::path> list_sources(StageKind kind,
                                       const fs::path& dir,
                                       bool recurse) const;

    /**
     * Output template for a source: natural name in the translated directory.
     */
    fs::path output_for(StageKind kind,
                        const fs::path& source,
                        bool hash_filenames,
                        const std::vector<TranslatePair>& translate) const;

    // Parse and validate "src:out" pairs against the project tree
    std::vector<TranslatePair> parse_translate(const std::vector<std::string>& specs) const;

    // Relative to the project root, lexically normal
    fs::path relative_to_root(const fs::path& path) const;

    const fs::path& project_root() const { return project_root_; }

    // =========================================================================
    // Naming rules (pure)
    // =========================================================================

    static bool is_partial(const fs::path& path);
    static bool is_source_for(StageKind kind, const fs::path& path);
    static fs::path natural_output_name(StageKind kind,
                                        const fs::path& source,
                                        bool hash_filenames);

    // Placeholder only in the filename, at most once
    static void validate_output_template(const fs::path& output_template);

private:
    fs::path project_root_;

    fs::path absolute(const fs::path& relative) const;
    void scan_directory(StageKind kind, const fs::path& dir, bool recurse,
                        std::vector<fs::path>& out) const;
};

} // namespace web::compile

#endif // WEB_COMPILE_PATH_RESOLVER_HPP
