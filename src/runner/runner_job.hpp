#pragma once

// ---------------------------------------------------------------------------
// runner_job.hpp
//
// gradegate-runner 안에서 채점 호출 하나를 실행한다.
//
// [단계]
//   ExecutingSubmission  제출물 네임스페이스 생성 → 제출물 실행
//                        → 런타임 import 위반 검사 → submission_done
//   ExecutingGrader      채점 네임스페이스 생성 → 채점 코드 실행
//                        → 진입점 존재/callable 검사
//   Invoking             entrypoint(submission_ns) 호출
//                        → 런타임 import 위반 재검사
//   Normalizing (원시)   반환 dict 에서 score/max_score/feedback 추출
//                        (clamp 는 호스트가 한다) → result
//   (선택) 프로브        → diagnostics
//
// 정적 검증(Validating)은 호스트가 러너를 띄우기 전에 끝낸다.
//
// [오류 분류]
//   제출물 컴파일 실패            kSyntaxInvalid
//   런타임 import 거부 기록 존재   kPolicyViolation (제출물이 ImportError 를 삼켜도)
//   제출물/채점 코드 예외          kExecutionError
//   채점 코드 컴파일 실패,
//   진입점 누락/비callable,
//   dict 가 아닌 반환, int() 불가  kContractViolation (운영 콘텐츠 결함)
//   네임스페이스/캡처 인프라 오류   kInternalError
//
// 호출자는 GIL 을 보유하고 있어야 한다.
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "protocol/runner_message.hpp"

#include <functional>

// EventSink
//   이벤트 하나를 내보낸다. false 를 반환하면 작업을 중단한다 (호스트 연결 끊김).
using EventSink = std::function<bool(const RunnerEvent&)>;

class RunnerJob {
public:
    RunnerJob(const RunnerRequest& request, EventSink sink)
        : request_(request), sink_(std::move(sink)) {}

    // run
    //   반환값: 0 = 판정(결과 또는 실패)을 전송함, 2 = 이벤트 전송 실패
    [[nodiscard]] int run();

private:
    [[nodiscard]] bool emit_failure(GradeState stage, GradeFailure failure);

    const RunnerRequest& request_;
    EventSink            sink_;
};
