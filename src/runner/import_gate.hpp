#pragma once

// ---------------------------------------------------------------------------
// import_gate.hpp
//
// 제출물 네임스페이스 전용 런타임 __import__ 게이트 + 감사(audit) 훅.
//
// [설계 원칙]
// - 정적 검증기와 같은 check_import() 를 사용한다. 문자열로 조립한
//   __import__("o" + "s") 같은 동적 import 도 같은 규칙으로 거부된다.
// - 거부된 import 는 violations() 에 기록된다. 제출물이 ImportError 를
//   except 로 삼켜도 기록은 남으며, 러너는 기록이 하나라도 있으면
//   채점 호출 전체를 PolicyViolation 으로 실패시킨다 (fail-close).
// - 게이트는 C 함수(PyCFunction)로 구현되어 파이썬 레벨에서 클로저나
//   원본 __import__ 참조를 노출하지 않는다.
//
// [감사 훅]
// 큐레이션된 builtins 도 실제 C 함수이므로 len.__self__ 로 builtins 모듈
// 전체(open, 원본 __import__)에 도달할 수 있다. 네임스페이스만으로는
// 막을 수 없으므로 PySys_AddAuditHook 으로 인터프리터 수준에서 거부한다.
// - 호출 스택에 co_filename == "<submission>" 프레임이 있으면 제출물 문맥.
//   제출물 문맥의 open / os.* / shutil.* / subprocess.* / socket.* 등
//   이벤트는 PermissionError 로 거부하고 위반으로 기록한다.
// - "import" 이벤트(아직 로드되지 않은 모듈)는 check_import() 로 판정한다.
// - 게이트가 허용한 import 를 수행하는 동안에는 모듈 초기화 코드의 파일
//   접근을 허용한다. 단, 그 사이 제출물 프레임이 새로 쌓이면(meta_path
//   훅 등) 다시 거부한다.
// - 훅은 프로세스당 한 번 등록되고 제거할 수 없다. 판정은 arm() 된
//   게이트 하나가 맡으며, 무장된 게이트가 없으면 모든 이벤트를 통과시킨다.
//
// [수명]
// make_function() 이 반환한 함수 객체는 this 를 캡슐로 보유한다.
// ImportGate 는 해당 함수 객체가 호출될 수 있는 동안 살아 있어야 한다
// (러너에서는 RunnerJob 이 프로세스 수명 동안 소유).
// 소멸자는 disarm() 한다.
//
// 모든 멤버 함수는 GIL 을 보유한 상태에서 호출된다.
// ---------------------------------------------------------------------------

#include "parser/python_runtime.hpp"
#include "policy/import_rules.hpp"
#include "policy/rule.hpp"

#include <string>
#include <vector>

// 제출물 코드를 컴파일할 때 쓰는 파일 이름. 감사 훅의 문맥 판정 기준.
inline constexpr const char* kSubmissionFilename = "<submission>";

// ---------------------------------------------------------------------------
// RuntimeViolation
//   offending      : 거부된 모듈 이름 또는 감사 이벤트 이름 ("open", "os.remove")
//   exception_type : 제출물에 던진 예외 ("ImportError" | "PermissionError")
// ---------------------------------------------------------------------------
struct RuntimeViolation {
    std::string offending{};
    std::string exception_type{};
    std::string message{};
};

// submission_frame_depth
//   현재 스레드 호출 스택에서 제출물 코드 프레임의 수.
[[nodiscard]] int submission_frame_depth();

class ImportGate {
public:
    explicit ImportGate(const ValidatorPolicy& policy) noexcept;
    ~ImportGate();

    ImportGate(const ImportGate&)            = delete;
    ImportGate& operator=(const ImportGate&) = delete;
    ImportGate(ImportGate&&)                 = delete;
    ImportGate& operator=(ImportGate&&)      = delete;

    // install_audit_hook
    //   프로세스 전역 감사 훅을 (최초 호출 시 한 번) 등록한다.
    [[nodiscard]] static bool install_audit_hook();

    // arm / disarm
    //   이 게이트를 감사 훅의 판정자로 지정/해제한다.
    void arm() noexcept;
    void disarm() noexcept;

    // make_function
    //   제출물 builtins 의 "__import__" 자리에 바인딩할 함수 객체.
    //   실패 시 빈 PyRef (파이썬 예외 설정됨).
    [[nodiscard]] PyRef make_function();

    // handle
    //   __import__(name, globals=None, locals=None, fromlist=(), level=0) 구현.
    //   반환값은 new reference, 거부/오류 시 nullptr (예외 설정됨).
    [[nodiscard]] PyObject* handle(PyObject* args, PyObject* kwargs);

    // audit
    //   감사 이벤트 판정. 0 = 허용, -1 = 거부 (예외 설정됨).
    [[nodiscard]] int audit(const char* event, PyObject* args);

    [[nodiscard]] const std::vector<RuntimeViolation>& violations() const noexcept {
        return violations_;
    }

private:
    void record(std::string offending, std::string exception_type, std::string message);

    const ValidatorPolicy&        policy_;
    std::vector<RuntimeViolation> violations_{};
    int                           trusted_depth_{-1};  // 허용된 import 진행 중의 제출물 깊이
};
