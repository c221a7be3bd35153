#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// ExecutionRole
//   네임스페이스/실행 요청의 역할.
//   kSubmission: 학습자 코드 (신뢰하지 않음)
//   kGrader    : 운영자가 작성한 채점 코드 (신뢰함)
// ---------------------------------------------------------------------------
enum class ExecutionRole : std::uint8_t {
    kSubmission = 0,
    kGrader     = 1,
};

// ---------------------------------------------------------------------------
// FailureKind
//   채점 호출 하나가 실패하는 원인 분류.
//   kInternalError 는 샌드박스 인프라 오류(fork 실패, 프레임 손상 등)로,
//   어떤 경우에도 통과(pass)로 바뀌지 않는다 (fail-close).
// ---------------------------------------------------------------------------
enum class FailureKind : std::uint8_t {
    kSyntaxInvalid     = 0,  // 소스 파싱 실패
    kPolicyViolation   = 1,  // 금지 구문/미허용 import (정적 또는 런타임)
    kExecutionError    = 2,  // 제출물/채점 코드가 예외를 던짐
    kTimeoutExceeded   = 3,  // wall-clock 제한 초과 (프로세스 강제 회수)
    kContractViolation = 4,  // 채점 코드 진입점 누락 등 운영 콘텐츠 결함
    kInternalError     = 5,  // 샌드박스 인프라 오류
};

// ---------------------------------------------------------------------------
// GradeState
//   채점 프로토콜 상태. kFailed 는 어느 상태에서든 도달 가능한 종료 상태.
// ---------------------------------------------------------------------------
enum class GradeState : std::uint8_t {
    kValidating          = 0,
    kExecutingSubmission = 1,
    kExecutingGrader     = 2,
    kInvoking            = 3,
    kNormalizing         = 4,
    kDone                = 5,
    kFailed              = 6,
};

// ---------------------------------------------------------------------------
// GradeFailure
//   std::expected<T, GradeFailure> 패턴과 함께 사용하는 실패 정보.
//
//   detail: 위반 구문 종류/모듈 이름/파싱 오류 설명 등 kind 별 핵심 값.
//   stage : 실패가 발생한 프로토콜 상태 (감사 로그용).
//   stdout_text/stderr_text: 실패 시점까지 캡처된 출력 (부분 출력 보존).
// ---------------------------------------------------------------------------
struct GradeFailure {
    FailureKind              kind{FailureKind::kInternalError};
    GradeState               stage{GradeState::kFailed};
    std::string              detail{};
    std::string              exception_type{};
    std::string              message{};
    std::vector<std::string> trace{};
    std::string              stdout_text{};
    std::string              stderr_text{};
    int                      line{0};    // 1-based, 0 = 알 수 없음
    int                      column{0};  // 1-based, 0 = 알 수 없음
};

// ---------------------------------------------------------------------------
// ProbeResult
//   제출물의 최상위 callable 하나에 대한 진단용 호출 결과 (표시 전용).
//   succeeded == false 이면 모든 입력이 예외로 끝났고 last_error 에 마지막
//   예외가 남는다.
// ---------------------------------------------------------------------------
struct ProbeResult {
    std::string name{};
    std::string arguments{};     // 인자 튜플 repr, 예: "([1, 2, 3, 4, 5],)"
    std::string return_value{};  // repr
    std::string return_type{};
    int         attempts{0};
    bool        succeeded{false};
    std::string last_error{};
};

struct ClassInfo {
    std::string              name{};
    std::vector<std::string> methods{};  // 공개(public) callable 메서드
};

struct VariableInfo {
    std::string name{};
    std::string type{};
    std::string value{};  // str(), 100자 이상이면 97자 + "..."
};

// ---------------------------------------------------------------------------
// ExpectedValues
//   채점 코드 텍스트에서 휴리스틱으로 추출한 기대값 (표시 전용, 선택).
// ---------------------------------------------------------------------------
struct ExpectedValues {
    std::string              subject{"unknown"};
    std::vector<std::string> literals{};
};

struct Diagnostics {
    std::vector<ProbeResult>      probes{};
    std::vector<ClassInfo>        classes{};
    std::vector<VariableInfo>     variables{};
    std::optional<ExpectedValues> expected{};
    bool                          probes_complete{true};
};

// ---------------------------------------------------------------------------
// GradeResult
//   정규화된 채점 결과. 불변식: 0 <= score <= max_score.
// ---------------------------------------------------------------------------
struct GradeResult {
    std::int64_t               score{0};
    std::int64_t               max_score{100};
    std::string                feedback{};
    std::string                stdout_text{};
    std::string                stderr_text{};
    std::optional<Diagnostics> diagnostics{};
};

[[nodiscard]] std::string_view to_string(FailureKind kind) noexcept;
[[nodiscard]] std::string_view to_string(GradeState state) noexcept;
[[nodiscard]] std::string_view to_string(ExecutionRole role) noexcept;

// failure_kind_from_string
//   러너 이벤트 역직렬화용. 알 수 없는 값이면 std::nullopt.
[[nodiscard]] std::optional<FailureKind> failure_kind_from_string(std::string_view name) noexcept;
[[nodiscard]] std::optional<GradeState> grade_state_from_string(std::string_view name) noexcept;
