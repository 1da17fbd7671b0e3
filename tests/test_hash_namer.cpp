/**
 * test_hash_namer.cpp
 * Tests for content-hashed names, the compiled name registry and run results
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "core/compiled_name_registry.hpp"
#include "core/hash_namer.hpp"
#include "core/run_result.hpp"
#include "test_harness.hpp"

using namespace web::compile;

static const std::string MD5_EMPTY = "d41d8cd98f00b204e9800998ecf8427e";
static const std::string MD5_ABC = "900150983cd24fb0d6963f7d28e17f72";

// =============================================================================
// Hash Namer Tests
// =============================================================================

void test_content_hash_known_vectors() {
    ASSERT_EQ(HashNamer::content_hash(""), MD5_EMPTY);
    ASSERT_EQ(HashNamer::content_hash("abc"), MD5_ABC);
    ASSERT_EQ(HashNamer::content_hash("abc").size(), HashNamer::DIGEST_HEX_LENGTH);
}

void test_name_for_substitutes_placeholder() {
    fs::path named = HashNamer::name_for("dist/css/main.[hash].css", "abc");
    ASSERT_EQ(named, fs::path("dist/css/main." + MD5_ABC + ".css"));
}

void test_name_for_without_placeholder() {
    fs::path named = HashNamer::name_for("dist/css/main.css", "abc");
    ASSERT_EQ(named, fs::path("dist/css/main.css"));
    ASSERT(!HashNamer::is_hashed("dist/css/main.css"));
    ASSERT(HashNamer::is_hashed("dist/css/main.[hash].css"));
}

void test_name_is_deterministic() {
    ASSERT_EQ(HashNamer::name_for("a.[hash].js", "x = 1;\n"),
              HashNamer::name_for("a.[hash].js", "x = 1;\n"));
    ASSERT(HashNamer::name_for("a.[hash].js", "x = 1;\n") !=
           HashNamer::name_for("a.[hash].js", "x = 2;\n"));
}

void test_matches_template() {
    const std::string tmpl = "main.[hash].css";
    ASSERT(HashNamer::matches_template("main." + MD5_ABC + ".css", tmpl));
    ASSERT(!HashNamer::matches_template("main.css", tmpl));
    ASSERT(!HashNamer::matches_template("main.abc.css", tmpl));
    ASSERT(!HashNamer::matches_template("other." + MD5_ABC + ".css", tmpl));
    ASSERT(!HashNamer::matches_template("main." + MD5_ABC + ".js", tmpl));

    // Upper-case hex is not a digest we produce
    std::string upper = "main.900150983CD24FB0D6963F7D28E17F72.css";
    ASSERT(!HashNamer::matches_template(upper, tmpl));

    ASSERT(!HashNamer::matches_template("main.css", "main.css"));
}

void test_prune_removes_only_stale_siblings() {
    TempDir dir("prune");
    const fs::path tmpl = dir / "main.[hash].css";
    const fs::path kept = dir / ("main." + MD5_ABC + ".css");
    const fs::path stale = dir / ("main." + MD5_EMPTY + ".css");
    const fs::path other = dir / "main.css";
    const fs::path foreign = dir / ("theme." + MD5_EMPTY + ".css");

    write_file(kept, "abc");
    write_file(stale, "");
    write_file(other, "plain");
    write_file(foreign, "");

    PruneResult result = HashNamer::prune_stale(tmpl, kept);
    ASSERT(result.ok());
    ASSERT_EQ(result.removed.size(), 1u);
    ASSERT_EQ(result.removed[0], stale);

    ASSERT(fs::exists(kept));
    ASSERT(!fs::exists(stale));
    ASSERT(fs::exists(other));
    ASSERT(fs::exists(foreign));

    // Second run finds nothing left to do
    PruneResult again = HashNamer::prune_stale(tmpl, kept);
    ASSERT(again.removed.empty());
    ASSERT(fs::exists(kept));
}

void test_prune_dry_run_reports_without_deleting() {
    TempDir dir("prune_dry");
    const fs::path tmpl = dir / "app.[hash].min.js";
    const fs::path kept = dir / ("app." + MD5_ABC + ".min.js");
    const fs::path stale = dir / ("app." + MD5_EMPTY + ".min.js");
    write_file(kept, "abc");
    write_file(stale, "");

    PruneResult result = HashNamer::prune_stale(tmpl, kept, true);
    ASSERT_EQ(result.removed.size(), 1u);
    ASSERT(fs::exists(stale));
}

void test_prune_missing_directory() {
    TempDir dir("prune_missing");
    PruneResult result = HashNamer::prune_stale(dir / "nope" / "a.[hash].css",
                                                dir / "nope" / "a.css");
    ASSERT(result.ok());
    ASSERT(result.removed.empty());
}

// =============================================================================
// Compiled Name Registry Tests
// =============================================================================

void test_registry_lookup() {
    CompiledNameRegistry registry;
    registry.add("src/scss/main.scss", "dist/css/main.abc.css");

    ASSERT_EQ(registry.lookup("src/scss/main.scss"), fs::path("dist/css/main.abc.css"));
    ASSERT_EQ(registry.lookup("./src//scss/main.scss"), fs::path("dist/css/main.abc.css"));
    ASSERT(registry.find("src/scss/other.scss") == std::nullopt);
    ASSERT_EQ(registry.size(), 1u);
}

void test_registry_dangling_reference() {
    CompiledNameRegistry registry;
    ASSERT_THROWS(registry.lookup("src/js/missing.js"), DanglingReferenceError);

    try {
        registry.lookup("src/js/missing.js");
    } catch (const DanglingReferenceError& e) {
        ASSERT_EQ(e.source(), std::string("src/js/missing.js"));
    }
}

void test_registry_sealed_rejects_writes() {
    CompiledNameRegistry registry;
    registry.add("a.scss", "a.css");
    registry.seal();
    ASSERT(registry.sealed());
    ASSERT_THROWS(registry.add("b.scss", "b.css"), std::logic_error);
    ASSERT_EQ(registry.lookup("a.scss"), fs::path("a.css"));
}

// =============================================================================
// Run Result Tests
// =============================================================================

void test_exit_code_precedence() {
    ASSERT_EQ(compute_exit_code(false, false, 3, 1), 0);
    ASSERT_EQ(compute_exit_code(false, true, 3, 1), 3);
    ASSERT_EQ(compute_exit_code(true, false, 3, 1), 1);
    ASSERT_EQ(compute_exit_code(true, true, 3, 1), 1);
    ASSERT_EQ(compute_exit_code(false, true, 7, 9), 7);
}

void test_run_result_aggregates() {
    RunResult result;

    UnitOutcome written;
    written.status = UnitStatus::WRITTEN;
    result.record(written);
    ASSERT(result.any_changed());
    ASSERT(!result.any_failed());

    UnitOutcome failed;
    failed.status = UnitStatus::FAILED;
    failed.error = UnitError(ErrorKind::COMPILE, "bad");
    result.record(failed);
    ASSERT(result.any_failed());
    ASSERT_EQ(result.failures().size(), 1u);
    ASSERT_EQ(result.count(UnitStatus::WRITTEN), 1u);
    ASSERT_EQ(result.exit_code(3, 1), 1);
}

void test_test_run_never_reports_changed() {
    RunResult result(true);
    UnitOutcome written;
    written.status = UnitStatus::WRITTEN;
    result.record(written);
    ASSERT(!result.any_changed());
    ASSERT_EQ(result.exit_code(3, 1), 0);
}

void test_unit_error_formatting() {
    UnitError error(ErrorKind::COMPILE, "Invalid CSS");
    error.line = 3;
    error.column = 5;
    ASSERT_EQ(error.to_string(), std::string("CompileError (line 3:5): Invalid CSS"));
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== HashNamer Test Suite ===\n\n";

    std::cout << "Naming:\n";
    TEST(content_hash_known_vectors);
    TEST(name_for_substitutes_placeholder);
    TEST(name_for_without_placeholder);
    TEST(name_is_deterministic);
    TEST(matches_template);

    std::cout << "\nPruning:\n";
    TEST(prune_removes_only_stale_siblings);
    TEST(prune_dry_run_reports_without_deleting);
    TEST(prune_missing_directory);

    std::cout << "\nRegistry:\n";
    TEST(registry_lookup);
    TEST(registry_dangling_reference);
    TEST(registry_sealed_rejects_writes);

    std::cout << "\nResults:\n";
    TEST(exit_code_precedence);
    TEST(run_result_aggregates);
    TEST(test_run_never_reports_changed);
    TEST(unit_error_formatting);

    return finish_tests();
}
