/**
 * pipeline_orchestrator.hpp
 * Central pipeline for web_compile
 *
 * Integrates:
 * - PathResolver for expanding the configuration into units
 * - StageRunner for compile + idempotent write per unit
 * - CompiledNameRegistry shared between the asset and template stages
 * - Optional worker pool for units within one stage
 *
 * Run Flow:
 * 1. Resolve units for every stage (ConfigurationError aborts here,
 *    before anything on disk changes)
 * 2. Check that each stage with units has a usable backend
 * 3. Styles, then scripts: each success registers its compiled name
 * 4. Seal the registry
 * 5. Templates, which may look up compiled names
 * 6. Aggregate outcomes into a RunResult and an exit code
 *
 * Stop-on-first-error halts at the first failed unit; later units (and
 * stages) are not attempted. With continue_on_error every unit runs.
 *
 * Copyright (c) 2025 Web Compile Project
 */

#ifndef WEB_COMPILE_PIPELINE_ORCHESTRATOR_HPP
#define WEB_COMPILE_PIPELINE_ORCHESTRATOR_HPP

#include "backend/compiler_backend.hpp"
#include "config/config.hpp"
#include "core/compiled_name_registry.hpp"
#include "core/run_result.hpp"
#include "core/stage_runner.hpp"
#include "vcs/vcs_registrar.hpp"

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace web::compile {

namespace fs = std::filesystem;

// =============================================================================
// Progress Callback
// =============================================================================
enum class RunPhase {
    RESOLVING,      // Expanding configuration into units
    COMPILING,      // Running units of one stage
    COMPLETE
};

struct RunProgress {
    RunPhase phase = RunPhase::RESOLVING;
    StageKind stage = StageKind::STYLE;
    size_t current = 0;
    size_t total = 0;
    std::string message;

    // Set for COMPILING events, one per finished (or skipped) unit
    const UnitOutcome* outcome = nullptr;
};

using ProgressCallback = std::function<void(const RunProgress&)>;

// Units of one stage, in canonical order
struct StagePlan {
    StageKind kind;
    std::vector<CompilationUnit> units;
};

// =============================================================================
// Pipeline Orchestrator
// =============================================================================
class PipelineOrchestrator {
public:
    /**
     * @param config Validated configuration
     * @param backends One backend per stage
     * @param vcs Registrar for created/removed outputs (NullRegistrar to disable)
     */
    PipelineOrchestrator(Config config,
                         BackendSet backends,
                         std::unique_ptr<VcsRegistrar> vcs);

    ~PipelineOrchestrator();

    PipelineOrchestrator(const PipelineOrchestrator&) = delete;
    PipelineOrchestrator& operator=(const PipelineOrchestrator&) = delete;

    /**
     * Execute every stage.
     *
     * @throws ConfigurationError before any unit runs
     */
    RunResult run_all();

    /**
     * Resolve all stages without running anything.
     *
     * @throws ConfigurationError
     */
    std::vector<StagePlan> resolve_all() const;

    // 0, the changed code, or the error code (error wins)
    int exit_code(const RunResult& result) const;

    void set_progress_callback(ProgressCallback cb) { progress_cb_ = std::move(cb); }

    const Config& config() const { return config_; }

    // Registry of the most recent run
    const CompiledNameRegistry& registry() const { return *registry_; }

private:
    Config config_;
    BackendSet backends_;
    std::unique_ptr<VcsRegistrar> vcs_;
    std::unique_ptr<CompiledNameRegistry> registry_;
    ProgressCallback progress_cb_;

    void check_backends(const std::vector<StagePlan>& plans) const;

    // Returns false when the run must halt (stop-on-first-error)
    bool run_stage(const StagePlan& plan, const StageRunner& runner, RunResult& result);

    std::vector<UnitOutcome> run_sequential(const StagePlan& plan,
                                            const CompilerBackend& backend,
                                            const StageRunner& runner);
    std::vector<UnitOutcome> run_parallel(const StagePlan& plan,
                                          const CompilerBackend& backend,
                                          const StageRunner& runner);

    void report_progress(RunPhase phase, StageKind stage, size_t current, size_t total,
                         const std::string& message = "",
                         const UnitOutcome* outcome = nullptr);
};

// =============================================================================
// Convenience Functions
// =============================================================================

/**
 * Run a configuration with the production backends and registrar.
 */
RunResult run_project(const Config& config, ProgressCallback progress = nullptr);

} // namespace web::compile

#endif // WEB_COMPILE_PIPELINE_ORCHESTRATOR_HPP
