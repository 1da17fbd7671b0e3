// run_result.cpp - Per-unit outcomes and the aggregated run result
// Part of web_compile - Web Asset Compiler

#include "core/run_result.hpp"

#include <algorithm>
#include <sstream>

namespace web::compile {

std::string UnitError::to_string() const {
    std::ostringstream oss;
    oss << error_kind_name(kind);
    if (line) {
        oss << " (line " << *line;
        if (column) {
            oss << ":" << *column;
        }
        oss << ")";
    }
    oss << ": " << message;
    return oss.str();
}

int compute_exit_code(bool any_failed, bool any_changed,
                      int changed_exit_code, int error_exit_code) {
    if (any_failed) {
        return error_exit_code;
    }
    if (any_changed) {
        return changed_exit_code;
    }
    return 0;
}

void RunResult::record(UnitOutcome outcome) {
    if (outcome.failed()) {
        any_failed_ = true;
    }
    // A test run reports what would change but never counts as a change
    if (!test_run_ && outcome.changed()) {
        any_changed_ = true;
    }
    outcomes_.push_back(std::move(outcome));
}

size_t RunResult::count(UnitStatus status) const {
    return static_cast<size_t>(std::count_if(
        outcomes_.begin(), outcomes_.end(),
        [status](const UnitOutcome& o) { return o.status == status; }));
}

std::vector<const UnitOutcome*> RunResult::failures() const {
    std::vector<const UnitOutcome*> failed;
    for (const auto& outcome : outcomes_) {
        if (outcome.failed()) {
            failed.push_back(&outcome);
        }
    }
    return failed;
}

} // namespace web::compile
