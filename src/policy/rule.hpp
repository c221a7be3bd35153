#pragma once

// ---------------------------------------------------------------------------
// rule.hpp
//
// 샌드박스 정책 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/policy.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 헤더는 다른 헤더에 의존하지 않는다 (독립적).
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// - Policy 는 시작 시 한 번 생성되고 이후 변경되지 않는다. 검증기,
//   네임스페이스 빌더, 러너 모두 const-ref 로만 받는다 (전역 상태 금지).
// - 판단이 불확실하면 항상 거부 (fail-close). 이 구조체 자체는
//   판정 로직을 포함하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// ImportRule
//   모듈 하나에 대한 import 허용 규칙.
//   symbols == std::nullopt 이면 "all" (모든 심볼 허용).
//   symbols 가 빈 set 이면 `import m` 만 허용되고 `from m import x` 는 모두 거부.
// ---------------------------------------------------------------------------
struct ImportRule {
    std::optional<std::set<std::string>> symbols{};

    [[nodiscard]] bool allows_all() const noexcept { return !symbols.has_value(); }
};

// ---------------------------------------------------------------------------
// ValidatorPolicy
//   정적 검증 규칙.
//   disallowed_nodes: 파이썬 AST 노드 이름 (예: "Global", "With").
//   스코프 탈출/자원 점유 벡터만 막는 denylist 이며, 문법 allowlist 가 아니다.
// ---------------------------------------------------------------------------
struct ValidatorPolicy {
    std::set<std::string>             disallowed_nodes{"Global", "Nonlocal", "With", "AsyncWith"};
    std::map<std::string, ImportRule> allowed_imports{
        {"functools", ImportRule{std::set<std::string>{"wraps"}}},
        {"time",      ImportRule{std::set<std::string>{"sleep", "time", "perf_counter"}}},
        {"numpy",     ImportRule{}},
    };
};

// ---------------------------------------------------------------------------
// NamespacePolicy
//   역할별로 노출되는 primitive 이름 목록.
//   grader 는 submission_builtins + grader_extra_builtins 의 상위집합을 받는다.
//   submission 의 __import__ 는 항상 런타임 import 게이트로 대체된다.
// ---------------------------------------------------------------------------
struct NamespacePolicy {
    std::vector<std::string> submission_builtins{
        // 길이/집계/시퀀스
        "len", "range", "sum", "min", "max", "abs", "enumerate", "zip", "sorted",
        "all", "any", "map", "filter",
        // 타입 생성/비교
        "list", "dict", "set", "tuple", "str", "int", "float", "bool",
        "print", "isinstance", "type", "repr",
        // 클래스/데코레이터 지원용 반영(reflection)
        "getattr", "setattr", "hasattr", "__build_class__", "property",
        "classmethod", "staticmethod", "super",
        // 예외 타입 (닫힌 집합)
        "Exception", "ValueError", "TypeError", "KeyError", "IndexError",
        "AttributeError", "NameError", "ImportError",
    };
    std::vector<std::string> grader_extra_builtins{
        "__import__", "round", "reversed", "callable",
        "RuntimeError", "AssertionError", "NotImplementedError", "ZeroDivisionError",
        "ArithmeticError", "LookupError", "StopIteration",
    };
    std::vector<std::string> grader_modules{"inspect"};
    std::string              entrypoint{"grade"};
};

// ---------------------------------------------------------------------------
// SandboxLimits
//   러너 프로세스 자원 제한.
//   단계별 wall-clock 마감은 호스트가 강제한다 (SIGKILL → 프로세스 그룹).
//
//   [한계]
//   - network_isolation 은 비특권 user namespace 가 허용된 커널에서만 적용된다.
//     실패 시 경고 후 seccomp 의 socket 차단에 의존한다.
// ---------------------------------------------------------------------------
struct SandboxLimits {
    std::string   runner_path{"gradegate-runner"};
    std::string   work_dir{"/tmp"};
    std::uint32_t submission_timeout_ms{5000};
    std::uint32_t grader_timeout_ms{30000};
    std::uint32_t probe_timeout_ms{5000};
    std::uint32_t probe_call_timeout_ms{500};
    std::uint32_t memory_limit_mb{512};
    std::uint32_t output_limit_kb{256};
    std::uint32_t max_processes{0};  // 0 = 제한 없음
    bool          network_isolation{true};
    bool          seccomp{true};
};

// ---------------------------------------------------------------------------
// ProbingPolicy
//   진단 정보(프로브, 기대값 추출) 생성 여부.
// ---------------------------------------------------------------------------
struct ProbingPolicy {
    bool enabled{true};
    bool enrich_expected{true};
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   전역 설정값.
//   log_level: "trace"|"debug"|"info"|"warn"|"error"|"critical"
//   log_format: "json" | "text"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string log_level{"info"};
    std::string log_format{"json"};
};

// ---------------------------------------------------------------------------
// Policy
//   전체 정책 설정의 루트 구조체.
//   PolicyLoader::load 가 반환하는 최종 결과물.
//   러너 프로세스에는 요청 프레임에 직렬화되어 전달된다.
// ---------------------------------------------------------------------------
struct Policy {
    GlobalConfig    global{};
    ValidatorPolicy validator{};
    NamespacePolicy namespaces{};
    SandboxLimits   sandbox{};
    ProbingPolicy   probing{};
};
