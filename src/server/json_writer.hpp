#pragma once

// ---------------------------------------------------------------------------
// json_writer.hpp
//
// UDS 응답/CLI 출력용 JSON 직렬화 (외부 JSON 라이브러리 없이 fmt 로 작성).
//
// [응답 스키마]
//   성공: {"ok":true,"payload":{...}}
//   실패: {"ok":false,"error":"<detail>","kind":"<failure_kind>","status":N,
//          "stage":"...","exception_type":"...","message":"...",
//          "trace":[...],"stdout":"...","stderr":"...","line":N,"column":N}
//   잘못된 요청: {"ok":false,"error":"<msg>","kind":"bad_request","status":400}
//
// [상태 코드 매핑]
//   syntax_invalid 400 / policy_violation 403 / execution_error 422 /
//   timeout_exceeded 408 / contract_violation 500 / internal_error 500
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "metrics/code_metrics.hpp"
#include "stats/grade_stats.hpp"

#include <string>
#include <string_view>

inline constexpr int kBadRequestStatus = 400;

// json_escape
//   JSON 문자열 값 이스케이프 (따옴표 없이 내용만 반환).
[[nodiscard]] std::string json_escape(std::string_view sv);

[[nodiscard]] int http_status(FailureKind kind) noexcept;

[[nodiscard]] std::string to_json(const GradeResult& result);
[[nodiscard]] std::string to_json(const Diagnostics& diagnostics);
[[nodiscard]] std::string to_json(const MetricsSummary& summary);
[[nodiscard]] std::string to_json(const RefactorAssessment& assessment);
[[nodiscard]] std::string to_json(const GradeStatsSnapshot& snapshot);

// validate 커맨드 성공 payload: {"valid":true,"nodes":N}
[[nodiscard]] std::string make_validation_payload(std::size_t node_count);

[[nodiscard]] std::string make_ok_response(std::string_view payload);
[[nodiscard]] std::string make_error_response(const GradeFailure& failure);
[[nodiscard]] std::string make_bad_request_response(std::string_view msg);
