#pragma once

// ---------------------------------------------------------------------------
// probe.hpp
//
// 진단용 프로브: 제출물 네임스페이스의 최상위 객체를 분류하고
// callable 을 고정 입력 배터리로 호출해 본다 (표시 전용).
//
// [입력 배터리 (이 순서로만)]
//   ()  ([],)  ([1, 2, 3, 4, 5],)  ("test",)  (5,)  (0,)
//   비어 있지 않은 시퀀스(list/tuple) 결과 또는 시퀀스가 아닌 결과를 얻으면 중단.
//   빈 시퀀스 결과는 기록하되 다음 입력을 계속 시도한다.
//
// [격리]
// - 각 시도의 예외는 독립적으로 잡힌다. 한 시도의 실패가 다른 시도나
//   채점 결과에 영향을 주지 않는다 (채점 결과는 프로브 전에 이미 전송됨).
// - 시도마다 call_timeout_ms 예산이 있다. ITIMER_REAL 만료 시 SIGALRM
//   핸들러가 PyErr_SetInterruptEx(SIGINT) 로 인터프리터 인터럽트를 요청하고,
//   해당 시도는 KeyboardInterrupt 로 끝난다.
//
// [알려진 한계]
// - C 확장 내부의 긴 연산은 인터럽트 확인 지점까지 멈추지 않는다.
//   이 경우는 호스트의 프로브 단계 마감(SIGKILL)이 회수한다.
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "common/types.hpp"
#include "runner/execution_engine.hpp"
#include "runner/python_namespace.hpp"

#include <cstdint>
#include <string>

class ProbeRunner {
public:
    ProbeRunner(const ExecutionEngine& engine, std::uint32_t call_timeout_ms) noexcept
        : engine_(engine), call_timeout_ms_(call_timeout_ms) {}

    // collect
    //   ns 의 스냅샷(삽입 순서)을 기준으로 probes/classes/variables 를 채운다.
    //   반환 시 파이썬 예외 상태는 비어 있다.
    [[nodiscard]] Diagnostics collect(const Namespace& ns) const;

private:
    [[nodiscard]] ProbeResult probe_callable(const std::string& name, PyObject* fn) const;

    const ExecutionEngine& engine_;
    std::uint32_t          call_timeout_ms_;
};

// describe_class
//   dir(cls) 중 "_" 로 시작하지 않는 callable 속성 이름.
[[nodiscard]] ClassInfo describe_class(const std::string& name, PyObject* cls);

// describe_variable
//   str() 결과가 100자 이상이면 97자 + "...". str() 실패 시 "<unable to serialize>".
[[nodiscard]] VariableInfo describe_variable(const std::string& name, PyObject* value);
