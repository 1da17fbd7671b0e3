/**
 * test_pipeline.cpp
 * End-to-end runs of the pipeline orchestrator with in-process backends
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "backend/template_backend.hpp"
#include "core/hash_namer.hpp"
#include "core/pipeline_orchestrator.hpp"
#include "fake_backends.hpp"
#include "test_harness.hpp"

using namespace web::compile;

// A small site: one stylesheet, one script, one page referencing both
class SiteFixture {
public:
    explicit SiteFixture(const std::string& name) : root(name) {
        write_file(root / "src/scss/main.scss", "body{color:red}");
        write_file(root / "src/scss/_vars.scss", "$c: red;");
        write_file(root / "src/js/app.js", "var x = 1;");
        write_file(root / "site/index.html.j2",
                   "<title>{{ title }}</title>\n"
                   "<link href=\"/{{ 'src/scss/main.scss' | compiled_path }}\">\n"
                   "<script src=\"/{{ 'src/js/app.js' | compiled_path }}\"></script>\n");

        config.project_root = root.path;
        config.config_file = root / "web-compile.abc";
        config.run.git_add = false;

        config.styles.assets.paths = {"src/scss"};
        config.styles.assets.translate = {"src/scss:dist/css"};
        config.styles.assets.hash_filenames = true;

        config.scripts.assets.files = {{"src/js/app.js", "dist/js/app.[hash].min.js"}};

        config.templates.assets.paths = {"site"};
        config.templates.variables["title"] = "Home";
    }

    BackendSet backends() const {
        BackendSet set;
        set.style = std::make_unique<UpperBackend>();
        set.script = std::make_unique<UpperBackend>();
        set.templates = std::make_unique<TemplateBackend>(config.templates);
        return set;
    }

    RunResult run(RecordingRegistrar* vcs = nullptr) {
        std::unique_ptr<VcsRegistrar> registrar;
        if (vcs) {
            registrar = std::make_unique<ForwardingRegistrar>(*vcs);
        }
        PipelineOrchestrator orchestrator(config, backends(), std::move(registrar));
        RunResult result = orchestrator.run_all();
        last_exit_code = orchestrator.exit_code(result);
        return result;
    }

    fs::path css_name(const std::string& css) const {
        return "dist/css/main." + HashNamer::content_hash(css) + ".css";
    }

    // Lets a test keep the RecordingRegistrar the orchestrator owns a handle to
    class ForwardingRegistrar : public VcsRegistrar {
    public:
        explicit ForwardingRegistrar(RecordingRegistrar& target) : target_(target) {}
        std::string name() const override { return target_.name(); }
        RegistrationResult add(const fs::path& p) override { return target_.add(p); }
        RegistrationResult remove(const fs::path& p) override { return target_.remove(p); }

    private:
        RecordingRegistrar& target_;
    };

    TempDir root;
    Config config;
    int last_exit_code = -1;
};

// =============================================================================
// Change Detection Tests
// =============================================================================

void test_first_run_then_noop_then_change() {
    SiteFixture site("pipeline_cycle");

    // First run compiles everything
    RunResult first = site.run();
    ASSERT(!first.any_failed());
    ASSERT(first.any_changed());
    ASSERT_EQ(site.last_exit_code, 3);
    ASSERT_EQ(first.outcomes().size(), 3u);

    const fs::path css = site.css_name("BODY{COLOR:RED}");
    ASSERT(fs::exists(site.root / css));
    std::string page = read_text(site.root / "site/index.html");
    ASSERT(page.find("href=\"/" + css.generic_string() + "\"") != std::string::npos);
    ASSERT(page.find("<title>Home</title>") != std::string::npos);

    // Nothing changed on disk: exit 0
    RunResult second = site.run();
    ASSERT(!second.any_changed());
    ASSERT_EQ(site.last_exit_code, 0);
    ASSERT_EQ(second.count(UnitStatus::UNCHANGED), 3u);

    // Source edit: new hash, page rewritten, old file pruned
    write_file(site.root / "src/scss/main.scss", "body{color:blue}");
    RunResult third = site.run();
    ASSERT_EQ(site.last_exit_code, 3);

    const fs::path css2 = site.css_name("BODY{COLOR:BLUE}");
    ASSERT(fs::exists(site.root / css2));
    ASSERT(!fs::exists(site.root / css));
    ASSERT_EQ(count_files(site.root / "dist/css"), 1u);
    page = read_text(site.root / "site/index.html");
    ASSERT(page.find(css2.generic_string()) != std::string::npos);
    ASSERT_EQ(third.outcomes()[0].removed.size(), 1u);
}

void test_custom_exit_codes() {
    SiteFixture site("pipeline_codes");
    site.config.run.changed_exit_code = 42;
    site.config.run.error_exit_code = 9;

    site.run();
    ASSERT_EQ(site.last_exit_code, 42);

    write_file(site.root / "src/js/app.js", "ERROR");
    site.run();
    ASSERT_EQ(site.last_exit_code, 9);
}

void test_test_run_writes_nothing() {
    SiteFixture site("pipeline_test_run");
    site.config.run.test_run = true;

    RunResult result = site.run();
    ASSERT(result.test_run());
    ASSERT(!result.any_failed());
    ASSERT(!result.any_changed());
    ASSERT_EQ(site.last_exit_code, 0);
    ASSERT_EQ(result.count(UnitStatus::WRITTEN), 3u);
    ASSERT(!fs::exists(site.root / "dist"));
    ASSERT(!fs::exists(site.root / "site/index.html"));
}

void test_vcs_sees_created_and_removed() {
    SiteFixture site("pipeline_vcs");
    RecordingRegistrar vcs;

    site.run(&vcs);
    ASSERT_EQ(vcs.added.size(), 3u);
    ASSERT(vcs.removed.empty());

    write_file(site.root / "src/js/app.js", "var x = 2;");
    site.run(&vcs);
    ASSERT_EQ(vcs.added.size(), 4u);
    ASSERT_EQ(vcs.removed.size(), 1u);
}

// =============================================================================
// Failure Policy Tests
// =============================================================================

void test_stop_on_first_error() {
    SiteFixture site("pipeline_stop");
    write_file(site.root / "src/scss/a.scss", "ERROR");

    RunResult result = site.run();
    ASSERT(result.any_failed());
    ASSERT_EQ(site.last_exit_code, 1);

    // a.scss sorts first and fails; nothing after it runs
    ASSERT_EQ(result.outcomes().size(), 1u);
    ASSERT_EQ(result.outcomes()[0].unit.source_path, fs::path("src/scss/a.scss"));
    ASSERT(!fs::exists(site.root / "dist"));
    ASSERT(!fs::exists(site.root / "site/index.html"));
}

void test_continue_on_error_runs_every_unit() {
    SiteFixture site("pipeline_continue");
    site.config.run.continue_on_error = true;
    write_file(site.root / "src/scss/a.scss", "ERROR");

    RunResult result = site.run();
    ASSERT(result.any_failed());
    ASSERT_EQ(site.last_exit_code, 1);
    ASSERT_EQ(result.outcomes().size(), 4u);
    ASSERT_EQ(result.failures().size(), 1u);
    ASSERT(fs::exists(site.root / "site/index.html"));
}

void test_dangling_reference_to_failed_source() {
    SiteFixture site("pipeline_dangling");
    site.config.run.continue_on_error = true;
    write_file(site.root / "src/scss/main.scss", "ERROR");

    RunResult result = site.run();
    auto failures = result.failures();
    ASSERT_EQ(failures.size(), 2u);
    ASSERT(failures[0]->error->kind == ErrorKind::COMPILE);
    ASSERT(failures[1]->error->kind == ErrorKind::DANGLING_REFERENCE);
    ASSERT_EQ(failures[1]->unit.source_path, fs::path("site/index.html.j2"));
    ASSERT(!fs::exists(site.root / "site/index.html"));
}

// =============================================================================
// Configuration Error Tests
// =============================================================================

void test_missing_path_aborts_before_writing() {
    SiteFixture site("pipeline_bad_path");
    site.config.scripts.assets.paths = {"src/nowhere"};

    PipelineOrchestrator orchestrator(site.config, site.backends(), nullptr);
    ASSERT_THROWS(orchestrator.run_all(), ConfigurationError);
    ASSERT(!fs::exists(site.root / "dist"));
}

void test_unavailable_backend_aborts() {
    SiteFixture site("pipeline_no_tool");
    BackendSet set = site.backends();
    set.script = std::make_unique<UnavailableBackend>();

    PipelineOrchestrator orchestrator(site.config, std::move(set), nullptr);
    ASSERT_THROWS(orchestrator.run_all(), ConfigurationError);
    ASSERT(!fs::exists(site.root / "dist"));
}

void test_resolve_all_plans_every_stage() {
    SiteFixture site("pipeline_plan");
    PipelineOrchestrator orchestrator(site.config, site.backends(), nullptr);

    auto plans = orchestrator.resolve_all();
    ASSERT_EQ(plans.size(), 3u);
    ASSERT(plans[0].kind == StageKind::STYLE);
    ASSERT_EQ(plans[0].units.size(), 1u);
    ASSERT_EQ(plans[1].units[0].output_template, fs::path("dist/js/app.[hash].min.js"));
    ASSERT_EQ(plans[2].units[0].output_template, fs::path("site/index.html"));
}

// =============================================================================
// Parallel Tests
// =============================================================================

void test_parallel_units_keep_order() {
    SiteFixture site("pipeline_parallel");
    site.config.run.jobs = 4;
    site.config.scripts.assets.files.clear();
    site.config.scripts.assets.paths = {"src/js"};
    for (int i = 0; i < 8; ++i) {
        write_file(site.root / ("src/js/mod" + std::to_string(i) + ".js"),
                   "var m = " + std::to_string(i) + ";");
    }
    // index.html.j2 still references app.js, which is resolved from the directory

    RunResult result = site.run();
    ASSERT(!result.any_failed());
    ASSERT_EQ(result.outcomes().size(), 11u);

    const auto& outcomes = result.outcomes();
    ASSERT_EQ(outcomes[1].unit.source_path, fs::path("src/js/app.js"));
    for (int i = 0; i < 8; ++i) {
        const auto& outcome = outcomes[2 + static_cast<size_t>(i)];
        ASSERT_EQ(outcome.unit.source_path, fs::path("src/js/mod" + std::to_string(i) + ".js"));
        ASSERT(fs::exists(site.root / outcome.resolved_output));
    }

    RunResult again = site.run();
    ASSERT(!again.any_changed());
}

void test_parallel_stop_on_error() {
    SiteFixture site("pipeline_parallel_stop");
    site.config.run.jobs = 2;
    site.config.scripts.assets.files.clear();
    site.config.scripts.assets.paths = {"src/js"};
    write_file(site.root / "src/js/bad.js", "ERROR");

    RunResult result = site.run();
    ASSERT(result.any_failed());
    ASSERT_EQ(site.last_exit_code, 1);

    // Templates never start after a failed stage
    for (const auto& outcome : result.outcomes()) {
        ASSERT(outcome.unit.kind != StageKind::TEMPLATE);
        if (outcome.status == UnitStatus::SKIPPED) {
            ASSERT_EQ(outcome.skip_reason, std::string("cancelled"));
        }
    }
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "=== Pipeline Test Suite ===\n\n";

    std::cout << "Change detection:\n";
    TEST(first_run_then_noop_then_change);
    TEST(custom_exit_codes);
    TEST(test_run_writes_nothing);
    TEST(vcs_sees_created_and_removed);

    std::cout << "\nFailure policy:\n";
    TEST(stop_on_first_error);
    TEST(continue_on_error_runs_every_unit);
    TEST(dangling_reference_to_failed_source);

    std::cout << "\nConfiguration errors:\n";
    TEST(missing_path_aborts_before_writing);
    TEST(unavailable_backend_aborts);
    TEST(resolve_all_plans_every_stage);

    std::cout << "\nParallel stages:\n";
    TEST(parallel_units_keep_order);
    TEST(parallel_stop_on_error);

    return finish_tests();
}
