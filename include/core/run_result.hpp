#ifndef WEB_COMPILE_RUN_RESULT_HPP
#define WEB_COMPILE_RUN_RESULT_HPP

// run_result.hpp - Per-unit outcomes and the aggregated run result
// Part of web_compile - Web Asset Compiler
//
// Per-unit failures are values stored here; they never propagate as
// exceptions past the StageRunner. Only ConfigurationError aborts a run.

#include "core/compilation_unit.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace web::compile {

enum class UnitStatus {
    WRITTEN,      // output (or side-car) written, or would be in a test run
    UNCHANGED,    // on-disk bytes already identical
    SKIPPED,      // not attempted (cancelled after an earlier failure)
    FAILED
};

enum class ErrorKind {
    IO,                  // source unreadable, output unwritable
    COMPILE,             // backend rejected the input
    DANGLING_REFERENCE   // template referenced an unregistered source
};

inline const char* unit_status_name(UnitStatus status) {
    switch (status) {
        case UnitStatus::WRITTEN:   return "written";
        case UnitStatus::UNCHANGED: return "unchanged";
        case UnitStatus::SKIPPED:   return "skipped";
        case UnitStatus::FAILED:    return "failed";
    }
    return "unknown";
}

inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::IO:                 return "IOError";
        case ErrorKind::COMPILE:            return "CompileError";
        case ErrorKind::DANGLING_REFERENCE: return "DanglingReferenceError";
    }
    return "Error";
}

struct UnitError {
    ErrorKind kind = ErrorKind::COMPILE;
    std::string message;
    std::optional<uint32_t> line;
    std::optional<uint32_t> column;

    UnitError() = default;
    UnitError(ErrorKind k, std::string msg)
        : kind(k), message(std::move(msg)) {}

    // "CompileError (line 3:5): message"
    std::string to_string() const;
};

struct UnitOutcome {
    CompilationUnit unit;
    UnitStatus status = UnitStatus::SKIPPED;

    fs::path resolved_output;            // template with the hash substituted
    std::vector<fs::path> written;       // files written (or that would be)
    std::vector<fs::path> created;       // subset of written that did not exist
    std::vector<fs::path> removed;       // stale hashed siblings
    std::vector<std::string> warnings;   // non-fatal, e.g. git index failures

    std::string skip_reason;
    std::optional<UnitError> error;
    std::chrono::milliseconds duration{0};

    bool failed() const { return status == UnitStatus::FAILED; }
    bool succeeded() const {
        return status == UnitStatus::WRITTEN || status == UnitStatus::UNCHANGED;
    }
    bool changed() const {
        return status == UnitStatus::WRITTEN || !removed.empty();
    }
};

// Exit code precedence: error > changed > 0
int compute_exit_code(bool any_failed, bool any_changed,
                      int changed_exit_code, int error_exit_code);

class RunResult {
public:
    RunResult() = default;
    explicit RunResult(bool test_run) : test_run_(test_run) {}

    // Append one outcome and update the aggregate flags
    void record(UnitOutcome outcome);

    const std::vector<UnitOutcome>& outcomes() const { return outcomes_; }
    bool any_changed() const { return any_changed_; }
    bool any_failed() const { return any_failed_; }
    bool test_run() const { return test_run_; }

    size_t count(UnitStatus status) const;
    std::vector<const UnitOutcome*> failures() const;

    int exit_code(int changed_exit_code, int error_exit_code) const {
        return compute_exit_code(any_failed_, any_changed_,
                                 changed_exit_code, error_exit_code);
    }

private:
    std::vector<UnitOutcome> outcomes_;
    bool any_changed_ = false;
    bool any_failed_ = false;
    bool test_run_ = false;
};

} // namespace web::compile

#endif // WEB_COMPILE_RUN_RESULT_HPP
