#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 구조화 이벤트 로그 타입 정의.
//
// [민감정보 취급 주의]
// - 학습자 소스/출력은 로그에 넣지 않는다. detail 은 위반 구문 종류나
//   모듈 이름처럼 짧은 분류 값이다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. policy.global.log_level 또는 GRADEGATE_LOG_LEVEL.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

enum class LogFormat : std::uint8_t {
    kJson = 0,
    kText = 1,
};

// "trace"/"debug" → kDebug, "warn"/"warning" → kWarn, "error"/"critical" → kError.
// 알 수 없으면 std::nullopt.
[[nodiscard]] std::optional<LogLevel> log_level_from_string(std::string_view name) noexcept;

// ---------------------------------------------------------------------------
// GradeLog
//   채점 완료 이벤트.
// ---------------------------------------------------------------------------
struct GradeLog {
    std::string                           request_id{};
    std::int64_t                          score{0};
    std::int64_t                          max_score{0};
    bool                                  probes_complete{true};
    std::chrono::milliseconds             duration{0};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// FailureLog
//   채점 실패 이벤트.
//   kind == kContractViolation 이면 운영 콘텐츠 결함으로 error 레벨에
//   operator_fault=true 로 기록된다 (학습자 실패와 구분).
// ---------------------------------------------------------------------------
struct FailureLog {
    std::string                           request_id{};
    FailureKind                           kind{FailureKind::kInternalError};
    GradeState                            stage{GradeState::kFailed};
    std::string                           detail{};
    std::string                           exception_type{};
    std::chrono::milliseconds             duration{0};
    std::chrono::system_clock::time_point timestamp{};
};
