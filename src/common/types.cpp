#include "common/types.hpp"

#include <array>
#include <initializer_list>
#include <utility>

namespace {

constexpr std::array<std::pair<FailureKind, std::string_view>, 6> kFailureKindNames{{
    {FailureKind::kSyntaxInvalid,     "syntax_invalid"},
    {FailureKind::kPolicyViolation,   "policy_violation"},
    {FailureKind::kExecutionError,    "execution_error"},
    {FailureKind::kTimeoutExceeded,   "timeout_exceeded"},
    {FailureKind::kContractViolation, "contract_violation"},
    {FailureKind::kInternalError,     "internal_error"},
}};

} // namespace

std::string_view to_string(FailureKind kind) noexcept {
    for (const auto& [k, name] : kFailureKindNames) {
        if (k == kind) {
            return name;
        }
    }
    return "internal_error";
}

std::string_view to_string(GradeState state) noexcept {
    switch (state) {
        case GradeState::kValidating:          return "validating";
        case GradeState::kExecutingSubmission: return "executing_submission";
        case GradeState::kExecutingGrader:     return "executing_grader";
        case GradeState::kInvoking:            return "invoking";
        case GradeState::kNormalizing:         return "normalizing";
        case GradeState::kDone:                return "done";
        case GradeState::kFailed:              return "failed";
    }
    return "failed";
}

std::string_view to_string(ExecutionRole role) noexcept {
    return role == ExecutionRole::kGrader ? "grader" : "submission";
}

std::optional<FailureKind> failure_kind_from_string(std::string_view name) noexcept {
    for (const auto& [k, kind_name] : kFailureKindNames) {
        if (kind_name == name) {
            return k;
        }
    }
    return std::nullopt;
}

std::optional<GradeState> grade_state_from_string(std::string_view name) noexcept {
    for (auto state : {GradeState::kValidating, GradeState::kExecutingSubmission,
                       GradeState::kExecutingGrader, GradeState::kInvoking,
                       GradeState::kNormalizing, GradeState::kDone, GradeState::kFailed}) {
        if (to_string(state) == name) {
            return state;
        }
    }
    return std::nullopt;
}
