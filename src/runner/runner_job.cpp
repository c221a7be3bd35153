#include "runner/runner_job.hpp"
#include "runner/execution_engine.hpp"
#include "runner/import_gate.hpp"
#include "runner/probe.hpp"
#include "runner/python_namespace.hpp"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace {

constexpr const char* kEntrypointContract = "Grader must define grade(user_ns) -> dict";

[[nodiscard]] GradeFailure contract_failure(std::string detail) {
    GradeFailure f{};
    f.kind    = FailureKind::kContractViolation;
    f.detail  = std::move(detail);
    f.message = f.detail;
    return f;
}

// runtime_violation
//   게이트/감사 훅이 기록한 첫 위반 → PolicyViolation.
[[nodiscard]] GradeFailure runtime_violation(const ImportGate& gate, const CapturedOutput& output) {
    const RuntimeViolation& first = gate.violations().front();
    GradeFailure f{};
    f.kind           = FailureKind::kPolicyViolation;
    f.detail         = first.offending;
    f.exception_type = first.exception_type;
    f.message        = first.message;
    f.stdout_text    = output.stdout_text;
    f.stderr_text    = output.stderr_text;
    return f;
}

// to_int64
//   int(value) 와 같은 변환. 범위를 넘으면 포화(saturate)한다.
//   실패 시 std::nullopt (파이썬 예외는 지워짐, message 에 사유).
[[nodiscard]] std::optional<std::int64_t> to_int64(PyObject* value, std::string& message) {
    PyRef as_int{PyNumber_Long(value)};
    if (!as_int) {
        const PyErrorInfo err = fetch_python_error(false);
        message = err.type + ": " + err.message;
        return std::nullopt;
    }
    int overflow = 0;
    const long long v = PyLong_AsLongLongAndOverflow(as_int.get(), &overflow);
    if (overflow > 0) {
        return std::numeric_limits<std::int64_t>::max();
    }
    if (overflow < 0) {
        return std::numeric_limits<std::int64_t>::min();
    }
    if (v == -1 && PyErr_Occurred() != nullptr) {
        const PyErrorInfo err = fetch_python_error(false);
        message = err.type + ": " + err.message;
        return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
}

// extract_grade
//   채점 함수 반환값 → RawGrade. 키가 없으면 기본값 (score 0, max_score 100, feedback "").
[[nodiscard]] std::expected<RawGrade, GradeFailure> extract_grade(PyObject* result) {
    if (!PyDict_Check(result)) {
        return std::unexpected(contract_failure(
            "grade() must return a dict, got " + py_type_name(result)));
    }

    RawGrade grade{};
    std::string message;
    if (PyObject* score = PyDict_GetItemString(result, "score"); score != nullptr) {
        const auto v = to_int64(score, message);
        if (!v) {
            return std::unexpected(contract_failure("grade() returned a non-integer score: " + message));
        }
        grade.score = *v;
    }
    if (PyObject* max_score = PyDict_GetItemString(result, "max_score"); max_score != nullptr) {
        const auto v = to_int64(max_score, message);
        if (!v) {
            return std::unexpected(contract_failure("grade() returned a non-integer max_score: " + message));
        }
        grade.max_score = *v;
    }
    if (PyObject* feedback = PyDict_GetItemString(result, "feedback"); feedback != nullptr) {
        PyRef text{PyObject_Str(feedback)};
        if (!text) {
            const PyErrorInfo err = fetch_python_error(false);
            return std::unexpected(contract_failure(
                "grade() returned a feedback value str() cannot convert: " + err.message));
        }
        grade.feedback = py_str(text.get());
    }
    return grade;
}

} // namespace

bool RunnerJob::emit_failure(GradeState stage, GradeFailure failure) {
    failure.stage = stage;
    spdlog::info("[runner] grading failed at {}: kind={} detail='{}'",
                 to_string(stage), to_string(failure.kind), failure.detail);
    RunnerEvent event{};
    event.type    = RunnerEventType::kFailure;
    event.failure = std::move(failure);
    return sink_(event);
}

int RunnerJob::run() {
    const Policy& policy = request_.policy;
    const std::size_t output_limit =
        static_cast<std::size_t>(policy.sandbox.output_limit_kb) * 1024u;

    ImportGate       gate{policy.validator};
    NamespaceFactory factory{policy.namespaces, gate};
    ExecutionEngine  engine{output_limit};

    auto verdict_sent = [](bool ok) { return ok ? 0 : 2; };

    if (!ImportGate::install_audit_hook()) {
        GradeFailure f{};
        f.kind   = FailureKind::kInternalError;
        f.detail = "runner: cannot install audit hook";
        return verdict_sent(emit_failure(GradeState::kExecutingSubmission, std::move(f)));
    }
    gate.arm();

    // ---- ExecutingSubmission ----------------------------------------------
    auto submission_ns = factory.build(ExecutionRole::kSubmission, request_.submission);
    if (!submission_ns) {
        return verdict_sent(emit_failure(GradeState::kExecutingSubmission, submission_ns.error()));
    }

    auto submission_run = engine.run(request_.submission, *submission_ns, kSubmissionFilename);
    if (!gate.violations().empty()) {
        const CapturedOutput partial = submission_run
            ? *submission_run
            : CapturedOutput{submission_run.error().stdout_text, submission_run.error().stderr_text};
        return verdict_sent(emit_failure(GradeState::kExecutingSubmission,
                                         runtime_violation(gate, partial)));
    }
    if (!submission_run) {
        return verdict_sent(emit_failure(GradeState::kExecutingSubmission, submission_run.error()));
    }
    if (!sink_(RunnerEvent{RunnerEventType::kSubmissionDone, {}, {}, {}})) {
        return 2;
    }

    // ---- ExecutingGrader --------------------------------------------------
    auto grader_ns = factory.build(ExecutionRole::kGrader, request_.grader);
    if (!grader_ns) {
        return verdict_sent(emit_failure(GradeState::kExecutingGrader, grader_ns.error()));
    }

    auto grader_run = engine.run(request_.grader, *grader_ns, "<grader>");
    if (!grader_run) {
        GradeFailure f = grader_run.error();
        if (f.kind == FailureKind::kSyntaxInvalid) {
            f = contract_failure("grader source does not compile: " + f.detail);
        }
        return verdict_sent(emit_failure(GradeState::kExecutingGrader, std::move(f)));
    }

    PyObject* entrypoint = grader_ns->lookup(policy.namespaces.entrypoint.c_str());
    if (entrypoint == nullptr || !PyCallable_Check(entrypoint)) {
        return verdict_sent(emit_failure(GradeState::kExecutingGrader,
                                         contract_failure(kEntrypointContract)));
    }

    // ---- Invoking ---------------------------------------------------------
    PyRef args{PyTuple_Pack(1, submission_ns->dict())};
    if (!args) {
        GradeFailure f{};
        f.kind   = FailureKind::kInternalError;
        f.detail = "invoke: cannot build argument tuple";
        PyErr_Clear();
        return verdict_sent(emit_failure(GradeState::kInvoking, std::move(f)));
    }

    auto invocation = engine.invoke(entrypoint, args.get());
    if (!gate.violations().empty()) {
        return verdict_sent(emit_failure(GradeState::kInvoking,
                                         runtime_violation(gate, *submission_run)));
    }
    if (!invocation) {
        return verdict_sent(emit_failure(GradeState::kInvoking, invocation.error()));
    }

    // ---- Normalizing (원시 추출) ------------------------------------------
    auto grade = extract_grade(invocation->value.get());
    if (!grade) {
        return verdict_sent(emit_failure(GradeState::kNormalizing, grade.error()));
    }
    grade->stdout_text = submission_run->stdout_text;
    grade->stderr_text = submission_run->stderr_text;

    spdlog::info("[runner] grade computed: score={} max_score={}", grade->score, grade->max_score);
    if (!sink_(RunnerEvent{RunnerEventType::kResult, {}, std::move(*grade), {}})) {
        return 2;
    }

    // ---- 진단 프로브 (결과 전송 후) ---------------------------------------
    if (!policy.probing.enabled) {
        return 0;
    }
    ProbeRunner probes{engine, policy.sandbox.probe_call_timeout_ms};
    Diagnostics diagnostics = probes.collect(*submission_ns);
    return sink_(RunnerEvent{RunnerEventType::kDiagnostics, {}, {}, std::move(diagnostics)}) ? 0 : 2;
}
