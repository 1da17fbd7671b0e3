/**
 * pipeline_orchestrator.cpp
 * Central pipeline for web_compile
 *
 * Copyright (c) 2025 Web Compile Project
 */

#include "core/pipeline_orchestrator.hpp"
#include "core/path_resolver.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>
#include <thread>

namespace web::compile {

// =============================================================================
// Worker Pool
// =============================================================================

class WorkerPool {
public:
    explicit WorkerPool(size_t threads) : stop_(false) {
        for (size_t i = 0; i < threads; ++i) {
            workers_.emplace_back([this] {
                while (true) {
                    std::function<void()> task;
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
                        if (stop_ && tasks_.empty()) return;
                        task = std::move(tasks_.front());
                        tasks_.pop();
                    }
                    task();
                    {
                        std::unique_lock<std::mutex> lock(mutex_);
                        if (--pending_ == 0) {
                            done_cv_.notify_all();
                        }
                    }
                }
            });
        }
    }

    ~WorkerPool() {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            stop_ = true;
        }
        cv_.notify_all();
        for (auto& w : workers_) {
            w.join();
        }
    }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Tasks must not throw
    template<typename F>
    void enqueue(F&& f) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            tasks_.emplace(std::forward<F>(f));
            ++pending_;
        }
        cv_.notify_one();
    }

    // Blocks until every enqueued task has finished
    void wait_all() {
        std::unique_lock<std::mutex> lock(mutex_);
        done_cv_.wait(lock, [this] { return pending_ == 0; });
    }

private:
    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable done_cv_;
    size_t pending_ = 0;   // queued + running
    bool stop_;
};

namespace {

// Unexpected exceptions still end up as a failed outcome for the unit
UnitOutcome run_unit(const StageRunner& runner,
                     const CompilationUnit& unit,
                     const CompilerBackend& backend) {
    try {
        return runner.run(unit, backend);
    } catch (const std::exception& e) {
        UnitOutcome outcome;
        outcome.unit = unit;
        outcome.status = UnitStatus::FAILED;
        outcome.error = UnitError(ErrorKind::IO, e.what());
        return outcome;
    }
}

UnitOutcome cancelled(const CompilationUnit& unit) {
    UnitOutcome outcome;
    outcome.unit = unit;
    outcome.status = UnitStatus::SKIPPED;
    outcome.skip_reason = "cancelled";
    return outcome;
}

const char* stage_title(StageKind kind) {
    switch (kind) {
        case StageKind::STYLE:    return "styles";
        case StageKind::SCRIPT:   return "scripts";
        case StageKind::TEMPLATE: return "templates";
    }
    return "units";
}

} // namespace

// =============================================================================
// Pipeline Orchestrator Implementation
// =============================================================================

PipelineOrchestrator::PipelineOrchestrator(Config config,
                                           BackendSet backends,
                                           std::unique_ptr<VcsRegistrar> vcs)
    : config_(std::move(config))
    , backends_(std::move(backends))
    , vcs_(std::move(vcs))
    , registry_(std::make_unique<CompiledNameRegistry>())
{
    if (!vcs_) {
        vcs_ = std::make_unique<NullRegistrar>();
    }
}

PipelineOrchestrator::~PipelineOrchestrator() = default;

std::vector<StagePlan> PipelineOrchestrator::resolve_all() const {
    PathResolver resolver(config_.project_root);

    std::vector<StagePlan> plans;
    for (StageKind kind : {StageKind::STYLE, StageKind::SCRIPT, StageKind::TEMPLATE}) {
        StagePlan plan{kind, {}};
        const AssetOptions& assets = config_.assets_for(kind);
        if (!assets.empty()) {
            plan.units = resolver.resolve(kind, assets, config_.unit_options_for(kind));
        }
        plans.push_back(std::move(plan));
    }
    return plans;
}

void PipelineOrchestrator::check_backends(const std::vector<StagePlan>& plans) const {
    for (const auto& plan : plans) {
        if (plan.units.empty()) continue;

        const CompilerBackend* backend = backends_.for_kind(plan.kind);
        if (!backend) {
            throw ConfigurationError(std::string("No backend configured for ") +
                                     stage_title(plan.kind));
        }
        if (!backend->is_available()) {
            throw ConfigurationError("Compiler '" + backend->name() + "' for " +
                                     stage_title(plan.kind) + " was not found");
        }
    }
}

RunResult PipelineOrchestrator::run_all() {
    // Fresh table per run
    registry_ = std::make_unique<CompiledNameRegistry>();

    report_progress(RunPhase::RESOLVING, StageKind::STYLE, 0, 0, "Resolving compilation units...");
    std::vector<StagePlan> plans = resolve_all();
    check_backends(plans);

    StageContext context;
    context.project_root = config_.project_root;
    context.test_run = config_.run.test_run;
    context.registry = registry_.get();
    context.vcs = vcs_.get();
    StageRunner runner(context);

    RunResult result(config_.run.test_run);

    for (const auto& plan : plans) {
        // Read-after-write barrier: templates only ever read compiled names
        if (plan.kind == StageKind::TEMPLATE) {
            registry_->seal();
        }

        if (plan.units.empty()) continue;

        if (!run_stage(plan, runner, result)) {
            break;
        }
    }

    report_progress(RunPhase::COMPLETE, StageKind::TEMPLATE,
                    result.outcomes().size(), result.outcomes().size());
    return result;
}

bool PipelineOrchestrator::run_stage(const StagePlan& plan,
                                     const StageRunner& runner,
                                     RunResult& result) {
    const CompilerBackend& backend = *backends_.for_kind(plan.kind);
    const bool parallel = config_.run.jobs > 1 && plan.units.size() > 1;

    report_progress(RunPhase::COMPILING, plan.kind, 0, plan.units.size(),
                    std::string("Compiling ") + stage_title(plan.kind) + "...");

    std::vector<UnitOutcome> outcomes = parallel
        ? run_parallel(plan, backend, runner)
        : run_sequential(plan, backend, runner);

    bool failed = false;
    for (auto& outcome : outcomes) {
        failed = failed || outcome.failed();
        result.record(std::move(outcome));
    }

    return !(failed && !config_.run.continue_on_error);
}

std::vector<UnitOutcome> PipelineOrchestrator::run_sequential(const StagePlan& plan,
                                                              const CompilerBackend& backend,
                                                              const StageRunner& runner) {
    std::vector<UnitOutcome> outcomes;
    outcomes.reserve(plan.units.size());

    for (size_t i = 0; i < plan.units.size(); ++i) {
        outcomes.push_back(run_unit(runner, plan.units[i], backend));
        report_progress(RunPhase::COMPILING, plan.kind, i + 1, plan.units.size(),
                        "", &outcomes.back());

        if (outcomes.back().failed() && !config_.run.continue_on_error) {
            break;
        }
    }
    return outcomes;
}

std::vector<UnitOutcome> PipelineOrchestrator::run_parallel(const StagePlan& plan,
                                                            const CompilerBackend& backend,
                                                            const StageRunner& runner) {
    const size_t count = plan.units.size();
    const bool stop_on_error = !config_.run.continue_on_error;

    // One slot per unit so reporting order equals resolution order
    std::vector<std::optional<UnitOutcome>> slots(count);
    std::atomic<bool> failure_seen{false};

    {
        WorkerPool pool(std::min(config_.run.jobs, count));
        for (size_t i = 0; i < count; ++i) {
            pool.enqueue([&, i] {
                if (stop_on_error && failure_seen.load()) {
                    slots[i] = cancelled(plan.units[i]);
                    return;
                }
                slots[i] = run_unit(runner, plan.units[i], backend);
                if (slots[i]->failed()) {
                    failure_seen = true;
                }
            });
        }
        pool.wait_all();
    }

    std::vector<UnitOutcome> outcomes;
    outcomes.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        outcomes.push_back(std::move(*slots[i]));
        report_progress(RunPhase::COMPILING, plan.kind, i + 1, count, "", &outcomes.back());
    }
    return outcomes;
}

int PipelineOrchestrator::exit_code(const RunResult& result) const {
    return result.exit_code(config_.run.changed_exit_code, config_.run.error_exit_code);
}

void PipelineOrchestrator::report_progress(RunPhase phase, StageKind stage,
                                           size_t current, size_t total,
                                           const std::string& message,
                                           const UnitOutcome* outcome) {
    if (!progress_cb_) return;

    RunProgress progress;
    progress.phase = phase;
    progress.stage = stage;
    progress.current = current;
    progress.total = total;
    progress.message = message;
    progress.outcome = outcome;
    progress_cb_(progress);
}

// =============================================================================
// Convenience Functions
// =============================================================================

RunResult run_project(const Config& config, ProgressCallback progress) {
    PipelineOrchestrator orchestrator(config, make_backends(config), make_registrar(config));
    orchestrator.set_progress_callback(std::move(progress));
    return orchestrator.run_all();
}

} // namespace web::compile
