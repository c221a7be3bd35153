#pragma once

// ---------------------------------------------------------------------------
// execution_engine.hpp
//
// 네임스페이스 안에서 파이썬 소스를 컴파일/실행하고 출력을 캡처한다.
//
// [시간 제한]
// 엔진 자체는 시간을 재지 않는다. 엔진은 gradegate-runner 프로세스 안에서만
// 호출되고, 단계별 wall-clock 마감은 호스트(SandboxProcess)가 프로세스 그룹
// SIGKILL 로 강제한다. 순수 연산 무한 루프도 협조 없이 중단된다.
//
// [출력 캡처]
// OutputCapture 는 sys.stdout/sys.stderr 를 호출별 io.StringIO 로 교체하고
// 소멸자에서 원래 객체로 되돌린다. 정상 반환/예외/조기 return 모든 경로에서
// 복원이 보장된다 (RAII). 강제 종료(SIGKILL)는 프로세스 자체가 사라지므로
// 복원할 상태가 남지 않는다.
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "common/types.hpp"
#include "runner/python_namespace.hpp"

#include <cstddef>
#include <expected>
#include <string>

struct CapturedOutput {
    std::string stdout_text{};
    std::string stderr_text{};
};

// ---------------------------------------------------------------------------
// OutputCapture
//   생성 시 교체, 소멸 시 복원. active() == false 이면 교체에 실패한 것이다
//   (파이썬 예외는 지워져 있음).
// ---------------------------------------------------------------------------
class OutputCapture {
public:
    OutputCapture();
    ~OutputCapture();

    OutputCapture(const OutputCapture&)            = delete;
    OutputCapture& operator=(const OutputCapture&) = delete;
    OutputCapture(OutputCapture&&)                 = delete;
    OutputCapture& operator=(OutputCapture&&)      = delete;

    [[nodiscard]] bool active() const noexcept { return active_; }

    // collect
    //   지금까지 캡처된 텍스트. 각 스트림은 limit 바이트에서 잘린다.
    [[nodiscard]] CapturedOutput collect(std::size_t limit) const;

private:
    PyRef saved_stdout_{};
    PyRef saved_stderr_{};
    PyRef buffer_stdout_{};
    PyRef buffer_stderr_{};
    bool  active_{false};
};

struct Invocation {
    PyRef          value{};
    CapturedOutput output{};
};

class ExecutionEngine {
public:
    explicit ExecutionEngine(std::size_t output_limit) noexcept
        : output_limit_(output_limit) {}

    // run
    //   source 를 filename 이름으로 컴파일해 ns 에서 실행한다.
    //   실행이 남긴 바인딩은 ns 에 그대로 남는다.
    //   실패: kSyntaxInvalid (컴파일) / kExecutionError (예외) / kInternalError (캡처 불가)
    [[nodiscard]] std::expected<CapturedOutput, GradeFailure>
    run(const std::string& source, const Namespace& ns, const char* filename) const;

    // invoke
    //   callable(*args) 를 출력 캡처 상태에서 호출한다.
    [[nodiscard]] std::expected<Invocation, GradeFailure>
    invoke(PyObject* callable, PyObject* args) const;

private:
    std::size_t output_limit_;
};

// truncate_output
//   limit 바이트 이내로 자르고 표식을 붙인다. UTF-8 문자 중간에서 자르지 않는다.
[[nodiscard]] std::string truncate_output(std::string text, std::size_t limit);
