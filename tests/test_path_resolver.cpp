/**
 * test_path_resolver.cpp
 * Tests for configuration -> compilation unit expansion
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "core/path_resolver.hpp"
#include "test_harness.hpp"

#include <algorithm>

using namespace web::compile;

static std::vector<std::string> sources_of(const std::vector<CompilationUnit>& units) {
    std::vector<std::string> out;
    for (const auto& unit : units) {
        out.push_back(unit.source_path.generic_string());
    }
    return out;
}

static const CompilationUnit* find_unit(const std::vector<CompilationUnit>& units,
                                        const std::string& source) {
    for (const auto& unit : units) {
        if (unit.source_path.generic_string() == source) return &unit;
    }
    return nullptr;
}

// =============================================================================
// Naming Rules
// =============================================================================

void test_natural_output_names() {
    ASSERT_EQ(PathResolver::natural_output_name(StageKind::STYLE, "a/main.scss", false),
              fs::path("main.css"));
    ASSERT_EQ(PathResolver::natural_output_name(StageKind::SCRIPT, "a/app.js", false),
              fs::path("app.min.js"));
    ASSERT_EQ(PathResolver::natural_output_name(StageKind::TEMPLATE, "index.html.j2", false),
              fs::path("index.html"));
}

void test_natural_output_names_hashed() {
    ASSERT_EQ(PathResolver::natural_output_name(StageKind::STYLE, "main.scss", true),
              fs::path("main.[hash].css"));
    ASSERT_EQ(PathResolver::natural_output_name(StageKind::SCRIPT, "app.js", true),
              fs::path("app.min.[hash].js"));
}

void test_template_without_known_extension() {
    ASSERT_THROWS(PathResolver::natural_output_name(StageKind::TEMPLATE, "index.html", false),
                  ConfigurationError);
}

void test_source_kinds() {
    ASSERT(PathResolver::is_source_for(StageKind::STYLE, "x.scss"));
    ASSERT(PathResolver::is_source_for(StageKind::STYLE, "x.sass"));
    ASSERT(!PathResolver::is_source_for(StageKind::STYLE, "x.css"));
    ASSERT(PathResolver::is_source_for(StageKind::SCRIPT, "x.js"));
    ASSERT(!PathResolver::is_source_for(StageKind::SCRIPT, "x.min.js"));
    ASSERT(PathResolver::is_source_for(StageKind::TEMPLATE, "x.html.jinja"));
    ASSERT(PathResolver::is_partial("src/_vars.scss"));
    ASSERT(!PathResolver::is_partial("src/vars.scss"));
}

void test_placeholder_validation() {
    PathResolver::validate_output_template("dist/a.[hash].css");
    PathResolver::validate_output_template("dist/a.css");
    ASSERT_THROWS(PathResolver::validate_output_template("dist/[hash]/a.css"),
                  ConfigurationError);
    ASSERT_THROWS(PathResolver::validate_output_template("dist/a.[hash].[hash].css"),
                  ConfigurationError);
}

// =============================================================================
// Resolution
// =============================================================================

void test_file_mappings_verbatim() {
    TempDir root("resolve_files");
    write_file(root / "src/js/app.js", "x");

    AssetOptions assets;
    assets.files.push_back({"src/js/app.js", "dist/js/app.[hash].min.js"});

    PathResolver resolver(root.path);
    auto units = resolver.resolve(StageKind::SCRIPT, assets);
    ASSERT_EQ(units.size(), 1u);
    ASSERT_EQ(units[0].source_path, fs::path("src/js/app.js"));
    ASSERT_EQ(units[0].output_template, fs::path("dist/js/app.[hash].min.js"));
    ASSERT(units[0].kind == StageKind::SCRIPT);
}

void test_directory_scan_skips_partials_and_sorts() {
    TempDir root("resolve_scan");
    write_file(root / "src/scss/b.scss", "");
    write_file(root / "src/scss/a.scss", "");
    write_file(root / "src/scss/_vars.scss", "");
    write_file(root / "src/scss/readme.txt", "");
    write_file(root / "src/scss/sub/c.scss", "");

    AssetOptions assets;
    assets.paths.push_back("src/scss");

    PathResolver resolver(root.path);
    auto units = resolver.resolve(StageKind::STYLE, assets);
    std::vector<std::string> expected = {"src/scss/a.scss", "src/scss/b.scss",
                                         "src/scss/sub/c.scss"};
    ASSERT(sources_of(units) == expected);
    ASSERT_EQ(units[0].output_template, fs::path("src/scss/a.css"));

    assets.recurse = false;
    auto flat = resolver.resolve(StageKind::STYLE, assets);
    ASSERT_EQ(flat.size(), 2u);
}

void test_resolution_is_stable() {
    TempDir root("resolve_stable");
    write_file(root / "src/js/z.js", "");
    write_file(root / "src/js/m.js", "");
    write_file(root / "src/js/a.js", "");

    AssetOptions assets;
    assets.paths.push_back("src/js");

    PathResolver resolver(root.path);
    auto first = resolver.resolve(StageKind::SCRIPT, assets);
    auto second = resolver.resolve(StageKind::SCRIPT, assets);
    ASSERT(first == second);
}

void test_translate_shortest_prefix() {
    TempDir root("resolve_translate");
    write_file(root / "src/scss/main.scss", "");
    write_file(root / "src/scss/admin/panel.scss", "");

    AssetOptions assets;
    assets.paths.push_back("src/scss");
    assets.translate = {"src/scss:dist/css", "src/scss/admin:dist/admin"};
    assets.hash_filenames = true;

    PathResolver resolver(root.path);
    auto units = resolver.resolve(StageKind::STYLE, assets);
    ASSERT_EQ(units.size(), 2u);

    const CompilationUnit* main = find_unit(units, "src/scss/main.scss");
    const CompilationUnit* panel = find_unit(units, "src/scss/admin/panel.scss");
    ASSERT(main != nullptr);
    ASSERT(panel != nullptr);
    ASSERT_EQ(main->output_template, fs::path("dist/css/main.[hash].css"));
    ASSERT_EQ(panel->output_template, fs::path("dist/css/admin/panel.[hash].css"));

    // Declaration order does not change which root wins
    assets.translate = {"src/scss/admin:dist/admin", "src/scss:dist/css"};
    units = resolver.resolve(StageKind::STYLE, assets);
    panel = find_unit(units, "src/scss/admin/panel.scss");
    ASSERT(panel != nullptr);
    ASSERT_EQ(panel->output_template, fs::path("dist/css/admin/panel.[hash].css"));
}

void test_translate_component_prefix() {
    TempDir root("resolve_prefix");
    write_file(root / "src/scss2/x.scss", "");
    fs::create_directories(root / "src/scss");

    AssetOptions assets;
    assets.paths.push_back("src/scss2");
    assets.translate = {"src/scss:dist/css"};

    PathResolver resolver(root.path);
    auto units = resolver.resolve(StageKind::STYLE, assets);
    ASSERT_EQ(units.size(), 1u);
    ASSERT_EQ(units[0].output_template, fs::path("src/scss2/x.css"));
}

void test_malformed_translate() {
    TempDir root("resolve_bad_translate");
    write_file(root / "src/scss/main.scss", "");

    AssetOptions assets;
    assets.paths.push_back("src/scss");
    assets.translate = {"src/scss"};

    PathResolver resolver(root.path);
    ASSERT_THROWS(resolver.resolve(StageKind::STYLE, assets), ConfigurationError);

    assets.translate = {"src/missing:dist"};
    ASSERT_THROWS(resolver.resolve(StageKind::STYLE, assets), ConfigurationError);
}

void test_missing_path_is_configuration_error() {
    TempDir root("resolve_missing");

    AssetOptions assets;
    assets.paths.push_back("src/nowhere");

    PathResolver resolver(root.path);
    ASSERT_THROWS(resolver.resolve(StageKind::STYLE, assets), ConfigurationError);
}

void test_explicit_file_of_wrong_kind() {
    TempDir root("resolve_wrong_kind");
    write_file(root / "src/a.css", "a{}");
    write_file(root / "src/x.min.js", "var x;");
    write_file(root / "src/app.js", "var y;");

    PathResolver resolver(root.path);

    AssetOptions styles;
    styles.paths.push_back("src/a.css");
    ASSERT_THROWS(resolver.resolve(StageKind::STYLE, styles), ConfigurationError);

    AssetOptions scripts;
    scripts.paths.push_back("src/x.min.js");
    ASSERT_THROWS(resolver.resolve(StageKind::SCRIPT, scripts), ConfigurationError);

    scripts.paths = {"src/app.js"};
    auto units = resolver.resolve(StageKind::SCRIPT, scripts);
    ASSERT_EQ(units.size(), 1u);
    ASSERT_EQ(units[0].output_template, fs::path("src/app.min.js"));
}

void test_partial_expands_to_siblings() {
    TempDir root("resolve_partial");
    write_file(root / "src/scss/parts/_mixins.scss", "");
    write_file(root / "src/scss/parts/widget.scss", "");
    write_file(root / "src/scss/main.scss", "");
    write_file(root / "src/scss/_vars.scss", "");

    PathResolver resolver(root.path);

    auto same_dir = resolver.expand_partial(StageKind::STYLE, "src/scss/parts/_mixins.scss", 0);
    ASSERT_EQ(same_dir.size(), 1u);
    ASSERT_EQ(same_dir[0], fs::path("src/scss/parts/widget.scss"));

    auto one_up = resolver.expand_partial(StageKind::STYLE, "src/scss/parts/_mixins.scss", 1);
    ASSERT_EQ(one_up.size(), 2u);
    ASSERT_EQ(one_up[0], fs::path("src/scss/parts/widget.scss"));
    ASSERT_EQ(one_up[1], fs::path("src/scss/main.scss"));

    AssetOptions assets;
    assets.paths.push_back("src/scss/_vars.scss");
    auto units = resolver.resolve(StageKind::STYLE, assets);
    ASSERT_EQ(units.size(), 1u);
    ASSERT_EQ(units[0].source_path, fs::path("src/scss/main.scss"));
}

void test_duplicate_sources_resolve_once() {
    TempDir root("resolve_dupes");
    write_file(root / "src/js/app.js", "");

    AssetOptions assets;
    assets.files.push_back({"src/js/app.js", "dist/app.js"});
    assets.paths.push_back("src/js");
    assets.paths.push_back("./src/js/app.js");

    PathResolver resolver(root.path);
    auto units = resolver.resolve(StageKind::SCRIPT, assets);
    ASSERT_EQ(units.size(), 1u);
    ASSERT_EQ(units[0].output_template, fs::path("dist/app.js"));
}

void test_absolute_paths_under_root() {
    TempDir root("resolve_absolute");
    write_file(root / "site/index.html.j2", "");

    AssetOptions assets;
    assets.paths.push_back((root / "site").string());

    PathResolver resolver(root.path);
    auto units = resolver.resolve(StageKind::TEMPLATE, assets);
    ASSERT_EQ(units.size(), 1u);
    ASSERT_EQ(units[0].source_path, fs::path("site/index.html.j2"));
    ASSERT_EQ(units[0].output_template, fs::path("site/index.html"));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== PathResolver Test Suite ===\n\n";

    std::cout << "Naming rules:\n";
    TEST(natural_output_names);
    TEST(natural_output_names_hashed);
    TEST(template_without_known_extension);
    TEST(source_kinds);
    TEST(placeholder_validation);

    std::cout << "\nResolution:\n";
    TEST(file_mappings_verbatim);
    TEST(directory_scan_skips_partials_and_sorts);
    TEST(resolution_is_stable);
    TEST(translate_shortest_prefix);
    TEST(translate_component_prefix);
    TEST(malformed_translate);
    TEST(missing_path_is_configuration_error);
    TEST(explicit_file_of_wrong_kind);
    TEST(partial_expands_to_siblings);
    TEST(duplicate_sources_resolve_once);
    TEST(absolute_paths_under_root);

    return finish_tests();
}
