#pragma once

// ---------------------------------------------------------------------------
// python_namespace.hpp
//
// 역할별 실행 네임스페이스 생성 (NamespaceFactory).
//
// [역할별 구성]
//   kSubmission
//     __builtins__ = submission_builtins 로 큐레이션된 새 dict
//                    + "__import__" = ImportGate 함수 (항상)
//     __name__     = "__main__"   (class 정의에 필요)
//     __source__   = 제출물 소스 텍스트
//
//   kGrader
//     __builtins__ = submission_builtins + grader_extra_builtins
//                    ("__import__" 는 실제 builtins.__import__)
//     __name__     = "__main__", __file__ = "<grader>"
//     grader_modules (기본 inspect) 를 이름 그대로 바인딩
//
// [설계 원칙]
// - 매 호출마다 새 globals dict 와 새 builtins dict 를 만든다.
//   두 역할의 네임스페이스는 절대 같은 객체를 공유하지 않는다.
// - builtins 모듈 자체(모든 primitive 를 가진 환경)에 대한 참조는
//   어느 네임스페이스에도 넣지 않는다.
// - 정책에 있지만 인터프리터에 없는 이름은 오류로 처리한다 (fail-close).
//
// [알려진 한계]
// - 파이썬 레벨 객체 그래프 탐색(len.__self__, ().__class__.__subclasses__()
//   등)으로 큐레이션 밖의 객체에 도달하는 것은 네임스페이스로 막지 못한다.
//   그렇게 얻은 open, 원본 __import__, os.* 호출은 감사 훅(import_gate.hpp)이
//   거부하고, 나머지는 프로세스 격리(rlimit, seccomp, 네트워크 네임스페이스)로
//   완화한다.
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "common/types.hpp"
#include "policy/rule.hpp"
#include "runner/import_gate.hpp"

#include <expected>
#include <string>

// ---------------------------------------------------------------------------
// Namespace
//   globals dict 하나를 소유한다. 이동 전용.
// ---------------------------------------------------------------------------
class Namespace {
public:
    Namespace(ExecutionRole role, PyRef globals) noexcept
        : role_(role), globals_(std::move(globals)) {}

    Namespace(const Namespace&)            = delete;
    Namespace& operator=(const Namespace&) = delete;
    Namespace(Namespace&&) noexcept            = default;
    Namespace& operator=(Namespace&&) noexcept = default;

    [[nodiscard]] ExecutionRole role() const noexcept { return role_; }

    // dict: borrowed reference
    [[nodiscard]] PyObject* dict() const noexcept { return globals_.get(); }

    // lookup: borrowed reference, 없으면 nullptr (예외 미설정)
    [[nodiscard]] PyObject* lookup(const char* name) const noexcept {
        return PyDict_GetItemString(globals_.get(), name);
    }

private:
    ExecutionRole role_;
    PyRef         globals_;
};

class NamespaceFactory {
public:
    NamespaceFactory(const NamespacePolicy& policy, ImportGate& gate) noexcept
        : policy_(policy), gate_(gate) {}

    // build
    //   source 는 시드(__source__) 용도로만 사용된다 (grader 는 무시).
    //   실패 시 GradeFailure{kInternalError}.
    [[nodiscard]] std::expected<Namespace, GradeFailure>
    build(ExecutionRole role, const std::string& source);

private:
    [[nodiscard]] std::expected<PyRef, GradeFailure> make_builtins(ExecutionRole role);

    const NamespacePolicy& policy_;
    ImportGate&            gate_;
};
