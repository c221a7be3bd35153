#pragma once

// ---------------------------------------------------------------------------
// policy_validator.hpp
//
// 파이썬 소스를 파싱하고 구문 트리를 정책과 대조하여, 어떤 코드도 실행되기
// 전에 수락/거부를 결정하는 정적 검증기.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. 파싱 실패 → kSyntaxInvalid
// 2. 금지 노드 종류(Global/Nonlocal/With/AsyncWith 등) → kPolicyViolation(노드 종류)
// 3. 허용 목록에 없는 모듈 import → kPolicyViolation(모듈 이름)
// 4. 제한 집합에 없는 심볼 from-import → kPolicyViolation(모듈 이름)
// 5. 수락은 위 검사를 모두 통과했을 때만
//
// [denylist 설계]
// 금지 대상은 스코프 탈출/자원 점유 벡터뿐이다. try/except/raise/lambda/
// 속성 접근/데코레이터는 허용된다 (학습자가 관용적인 코드를 쓸 수 있어야 함).
//
// [순회 보장]
// - 모든 노드를 정확히 한 번 방문한다 (arena 선형 순회).
// - 첫 위반(전위 순서)에서 판정하므로 같은 소스는 항상 같은 판정을 받는다.
//
// [순환 의존성: 무순환 구조]
// policy_validator.hpp → parser/python_parser.hpp (단방향)
// policy_validator.hpp → rule.hpp                 (단방향)
// ---------------------------------------------------------------------------

#include <expected>
#include <optional>
#include <string_view>

#include "common/types.hpp"        // GradeFailure
#include "parser/python_parser.hpp"  // ParsedProgram, PythonParser
#include "rule.hpp"                  // Policy

// ---------------------------------------------------------------------------
// PolicyValidator
//   [스레드 안전성]
//   - validate/inspect: 읽기 전용으로 concurrent 호출 안전.
//   [수명]
//   - policy 는 참조로 보관한다. 검증기보다 오래 살아야 한다.
// ---------------------------------------------------------------------------
class PolicyValidator {
public:
    explicit PolicyValidator(const Policy& policy);

    ~PolicyValidator() = default;

    PolicyValidator(const PolicyValidator&)            = default;
    PolicyValidator& operator=(const PolicyValidator&) = delete;
    PolicyValidator(PolicyValidator&&)                 = default;
    PolicyValidator& operator=(PolicyValidator&&)      = delete;

    // validate
    //   파싱 + 정책 검사. 성공 시 ParsedProgram 을 반환한다.
    [[nodiscard]] std::expected<ParsedProgram, GradeFailure>
    validate(std::string_view source) const;

    // inspect
    //   이미 파싱된 프로그램에 대해 정책 검사만 수행한다.
    //   위반이 없으면 std::nullopt.
    [[nodiscard]] std::optional<GradeFailure> inspect(const ParsedProgram& program) const;

private:
    const Policy& policy_;
    PythonParser  parser_;
};
