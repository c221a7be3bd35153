#include "grading/grading_protocol.hpp"

#include <algorithm>
#include <csignal>
#include <cstdint>
#include <initializer_list>
#include <optional>

#include <spdlog/spdlog.h>

namespace {

void enter(GradeTrace* trace, GradeState state) {
    spdlog::debug("[grading] -> {}", to_string(state));
    if (trace != nullptr) {
        trace->states.push_back(state);
    }
}

[[nodiscard]] std::unexpected<GradeFailure> fail(GradeTrace* trace, GradeFailure failure) {
    enter(trace, GradeState::kFailed);
    if (failure.kind == FailureKind::kContractViolation) {
        spdlog::error("[grading] contract violation (operator_fault=true) at {}: {}",
                      to_string(failure.stage), failure.detail);
    } else {
        spdlog::debug("[grading] failed at {}: kind={} detail='{}'",
                      to_string(failure.stage), to_string(failure.kind), failure.detail);
    }
    return std::unexpected(std::move(failure));
}

[[nodiscard]] GradeState stage_of(SandboxPhase phase) noexcept {
    switch (phase) {
        case SandboxPhase::kSubmission: return GradeState::kExecutingSubmission;
        case SandboxPhase::kGrader:     return GradeState::kExecutingGrader;
        case SandboxPhase::kProbe:      return GradeState::kNormalizing;
    }
    return GradeState::kExecutingSubmission;
}

[[nodiscard]] GradeFailure timeout_failure(GradeState stage, std::string detail) {
    GradeFailure f{};
    f.kind    = FailureKind::kTimeoutExceeded;
    f.stage   = stage;
    f.detail  = std::move(detail);
    f.message = f.detail;
    return f;
}

} // namespace

GradingProtocol::GradingProtocol(const Policy& policy)
    : policy_(policy)
    , validator_(policy)
    , sandbox_(policy.sandbox) {}

GradeResult GradingProtocol::normalize(const RawGrade& raw) {
    GradeResult result{};
    result.max_score   = std::max<std::int64_t>(0, raw.max_score);
    result.score       = std::clamp<std::int64_t>(raw.score, 0, result.max_score);
    result.feedback    = raw.feedback;
    result.stdout_text = raw.stdout_text;
    result.stderr_text = raw.stderr_text;
    return result;
}

std::expected<GradeResult, GradeFailure>
GradingProtocol::grade(const std::string& submission, const std::string& grader,
                       GradeTrace* trace) const {
    // ── Validating ──────────────────────────────────────────────────────
    enter(trace, GradeState::kValidating);
    if (auto parsed = validator_.validate(submission); !parsed) {
        GradeFailure f = parsed.error();
        f.stage        = GradeState::kValidating;
        return fail(trace, std::move(f));
    }

    // ── ExecutingSubmission 이후는 러너 프로세스 안에서 ─────────────────
    enter(trace, GradeState::kExecutingSubmission);
    const RunnerRequest request{policy_, submission, grader};
    if (trace != nullptr) {
        trace->sandbox_launched = true;
    }
    auto transcript = sandbox_.run(request);
    if (!transcript) {
        return fail(trace, transcript.error());
    }
    if (trace != nullptr) {
        trace->runner_pid = transcript->pid;
    }
    return interpret(*transcript, grader, trace);
}

std::expected<GradeResult, GradeFailure>
GradingProtocol::interpret(const SandboxTranscript& transcript, const std::string& grader,
                           GradeTrace* trace) const {
    const RawGrade*    raw         = nullptr;
    const Diagnostics* diagnostics = nullptr;

    for (const auto& event : transcript.events) {
        switch (event.type) {
            case RunnerEventType::kSubmissionDone:
                enter(trace, GradeState::kExecutingGrader);
                break;
            case RunnerEventType::kFailure:
                // 러너가 보고한 단계까지 전이 기록을 맞춘다
                for (const GradeState s : {GradeState::kInvoking, GradeState::kNormalizing}) {
                    if (event.failure->stage >= s && event.failure->stage < GradeState::kDone) {
                        enter(trace, s);
                    }
                }
                return fail(trace, *event.failure);
            case RunnerEventType::kResult:
                raw = &*event.grade;
                break;
            case RunnerEventType::kDiagnostics:
                diagnostics = &*event.diagnostics;
                break;
        }
    }

    if (raw == nullptr) {
        if (transcript.expired_phase) {
            const SandboxPhase phase = *transcript.expired_phase;
            const auto budget_ms = phase == SandboxPhase::kSubmission
                ? policy_.sandbox.submission_timeout_ms
                : policy_.sandbox.grader_timeout_ms;
            return fail(trace, timeout_failure(stage_of(phase), fmt::format(
                "{} execution exceeded {} ms", to_string(phase), budget_ms)));
        }
        const GradeState stage = transcript.events.empty() ? GradeState::kExecutingSubmission
                                                           : GradeState::kExecutingGrader;
        if (transcript.term_signal == SIGXCPU) {
            return fail(trace, timeout_failure(stage, "CPU time limit exceeded"));
        }

        GradeFailure f{};
        f.kind   = FailureKind::kInternalError;
        f.stage  = stage;
        f.detail = transcript.protocol_error.empty()
            ? fmt::format("runner exited without a verdict (exit={} signal={})",
                          transcript.exit_code, transcript.term_signal)
            : "runner protocol error: " + transcript.protocol_error;
        spdlog::error("[grading] {} pid={} log_tail='{}'", f.detail, transcript.pid,
                      transcript.log_tail);
        return fail(trace, std::move(f));
    }

    // ── Invoking 완료 → Normalizing ─────────────────────────────────────
    enter(trace, GradeState::kInvoking);
    enter(trace, GradeState::kNormalizing);
    GradeResult result = normalize(*raw);

    if (policy_.probing.enabled) {
        Diagnostics diag = diagnostics != nullptr ? *diagnostics : Diagnostics{};
        diag.probes_complete = diagnostics != nullptr
            && transcript.expired_phase != SandboxPhase::kProbe;
        if (!diag.probes_complete) {
            spdlog::warn("[grading] diagnostics incomplete (pid={})", transcript.pid);
        }
        result.diagnostics = std::move(diag);
    }

    // 만점이면 기대값을 보여주지 않는다. 추출 실패는 결과에 영향을 주지 않는다.
    if (policy_.probing.enrich_expected && result.score < result.max_score) {
        if (auto expected = extractor_.extract(grader); expected) {
            if (!result.diagnostics) {
                result.diagnostics = Diagnostics{};
            }
            result.diagnostics->expected = std::move(*expected);
        }
    }

    enter(trace, GradeState::kDone);
    spdlog::debug("[grading] done: score={}/{} elapsed={}ms", result.score, result.max_score,
                  transcript.elapsed.count());
    return result;
}
