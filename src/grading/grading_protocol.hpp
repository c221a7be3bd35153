#pragma once

// ---------------------------------------------------------------------------
// grading_protocol.hpp
//
// 채점 호출 하나를 끝까지 진행하는 상태 기계 (외부 계층의 유일한 진입점).
//
// [상태]
//   Validating → ExecutingSubmission → ExecutingGrader → Invoking
//              → Normalizing → Done
//   어느 상태에서든 Failed(kind) 로 종료할 수 있다.
//
// [단계별 책임 위치]
//   Validating           호스트: PolicyValidator (실패 시 러너를 띄우지 않음)
//   ExecutingSubmission  러너: 제출물 실행 (submission_timeout_ms)
//   ExecutingGrader      러너: 채점 코드 실행 + 진입점 확인 (grader_timeout_ms)
//   Invoking             러너: grade(submission_ns)
//   Normalizing          호스트: clamp + 기대값 추출(점수가 만점 미만일 때만)
//
// [정규화]
//   max_score = max(0, raw.max_score)
//   score     = clamp(raw.score, 0, max_score)
//   러너가 보낸 값은 신뢰하지 않고 호스트에서 다시 정규화한다.
//
// [실패 해석]
//   러너 failure 이벤트      → 그대로 (stage 포함)
//   단계 마감 만료            → kTimeoutExceeded (해당 단계)
//   SIGXCPU (CPU rlimit)      → kTimeoutExceeded
//   판정 없이 종료/프로토콜 오류 → kInternalError
//   프로브 단계 마감 만료      → 결과 유지, diagnostics.probes_complete = false
//
// [스레드 안전성]
//   grade() 는 const 이며 호출 간 공유 상태가 없다. 여러 워커 스레드에서
//   동시에 호출할 수 있다 (호출마다 별도 러너 프로세스).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "parser/expected_extractor.hpp"
#include "policy/policy_validator.hpp"
#include "policy/rule.hpp"
#include "protocol/runner_message.hpp"
#include "sandbox/sandbox_process.hpp"

#include <expected>
#include <string>
#include <vector>

#include <sys/types.h>

// ---------------------------------------------------------------------------
// GradeTrace
//   한 호출이 거친 상태 기록 (감사/테스트용, 선택).
// ---------------------------------------------------------------------------
struct GradeTrace {
    std::vector<GradeState> states{};
    bool                    sandbox_launched{false};
    pid_t                   runner_pid{-1};
};

class GradingProtocol {
public:
    explicit GradingProtocol(const Policy& policy);

    GradingProtocol(const GradingProtocol&)            = delete;
    GradingProtocol& operator=(const GradingProtocol&) = delete;

    // grade
    //   trace 가 주어지면 방문한 상태를 순서대로 기록한다.
    [[nodiscard]] std::expected<GradeResult, GradeFailure>
    grade(const std::string& submission, const std::string& grader,
          GradeTrace* trace = nullptr) const;

    // normalize
    //   원시 점수 → 불변식(0 <= score <= max_score)을 만족하는 결과.
    [[nodiscard]] static GradeResult normalize(const RawGrade& raw);

    [[nodiscard]] const PolicyValidator& validator() const noexcept { return validator_; }

private:
    [[nodiscard]] std::expected<GradeResult, GradeFailure>
    interpret(const SandboxTranscript& transcript, const std::string& grader,
              GradeTrace* trace) const;

    const Policy&          policy_;
    PolicyValidator        validator_;
    SandboxProcess         sandbox_;
    ExpectedValueExtractor extractor_;
};
