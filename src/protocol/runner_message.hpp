#pragma once

// ---------------------------------------------------------------------------
// runner_message.hpp
//
// 호스트 ↔ gradegate-runner 메시지 정의와 YAML 직렬화.
//
// [흐름]
//   호스트 → 러너 (stdin, 프레임 1개)
//     RunnerRequest { policy, submission, grader }
//
//   러너 → 호스트 (fd 3, 프레임 N개, 이 순서로만)
//     kSubmissionDone  제출물 최상위 코드 실행 완료 (호스트가 마감을 채점 단계로 교체)
//     kFailure         실패 (이후 이벤트 없음)
//     kResult          채점 함수 원시 반환값 (정규화 전)
//     kDiagnostics     프로브 결과 (선택)
//
// [신뢰 경계]
// 러너는 학습자 코드를 실행한 프로세스이므로 호스트는 이벤트 내용을
// 신뢰하지 않는다: 역직렬화 실패/순서 위반은 kInternalError 로 처리하고,
// 점수는 호스트에서 다시 정규화(clamp)한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "policy/rule.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

struct RunnerRequest {
    Policy      policy{};
    std::string submission{};
    std::string grader{};
};

enum class RunnerEventType : std::uint8_t {
    kSubmissionDone = 0,
    kFailure        = 1,
    kResult         = 2,
    kDiagnostics    = 3,
};

// ---------------------------------------------------------------------------
// RawGrade
//   채점 함수 반환 매핑에서 int()/str() 변환만 거친 값 (clamp 전).
// ---------------------------------------------------------------------------
struct RawGrade {
    std::int64_t score{0};
    std::int64_t max_score{100};
    std::string  feedback{};
    std::string  stdout_text{};  // 제출물 실행 중 캡처된 출력
    std::string  stderr_text{};
};

struct RunnerEvent {
    RunnerEventType            type{RunnerEventType::kFailure};
    std::optional<GradeFailure> failure{};
    std::optional<RawGrade>     grade{};
    std::optional<Diagnostics>  diagnostics{};
};

[[nodiscard]] std::string encode_request(const RunnerRequest& request);
[[nodiscard]] std::expected<RunnerRequest, std::string> decode_request(std::string_view body);

[[nodiscard]] std::string encode_event(const RunnerEvent& event);
[[nodiscard]] std::expected<RunnerEvent, std::string> decode_event(std::string_view body);
