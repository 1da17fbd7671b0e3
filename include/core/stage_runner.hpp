#ifndef WEB_COMPILE_STAGE_RUNNER_HPP
#define WEB_COMPILE_STAGE_RUNNER_HPP

// stage_runner.hpp - Compiles one unit and performs the idempotent write
// Part of web_compile - Web Asset Compiler
//
// Per unit:
//   read source -> backend.compile -> hash name -> compare with disk
//   -> write (or not) -> register compiled name -> prune stale siblings
//
// The StageRunner owns every filesystem write of a run. It never throws for
// per-unit problems; they come back as a FAILED outcome.

#include "backend/compiler_backend.hpp"
#include "core/compilation_unit.hpp"
#include "core/compiled_name_registry.hpp"
#include "core/run_result.hpp"
#include "vcs/vcs_registrar.hpp"

#include <filesystem>
#include <string>

namespace web::compile {

namespace fs = std::filesystem;

// Run-scoped collaborators shared by every unit
struct StageContext {
    fs::path project_root;
    bool test_run = false;
    CompiledNameRegistry* registry = nullptr;   // filled by style/script, read by templates
    VcsRegistrar* vcs = nullptr;                // nullptr = no registration
};

class StageRunner {
public:
    explicit StageRunner(StageContext context);

    // Thread-safe: may be called from several workers for one stage
    UnitOutcome run(const CompilationUnit& unit, const CompilerBackend& backend) const;

    const StageContext& context() const { return context_; }

    // Side-car name for a source map: "<source filename>.map.json"
    static std::string source_map_name(const fs::path& source);

private:
    StageContext context_;

    enum class WriteStatus {
        UNCHANGED,
        WRITTEN,
        FAILED
    };

    struct WriteResult {
        WriteStatus status;
        std::string error;
    };

    // Compare-then-write of one output, recorded into `outcome`
    WriteResult write_if_changed(const fs::path& relative,
                                 const std::string& bytes,
                                 UnitOutcome& outcome) const;

    void register_output(const UnitOutcome& outcome) const;
    void prune(UnitOutcome& outcome) const;
};

// Whole-file read; false with `error` set on failure
bool read_file(const fs::path& path, std::string& contents, std::string& error);

} // namespace web::compile

#endif // WEB_COMPILE_STAGE_RUNNER_HPP
