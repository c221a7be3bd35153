#pragma once

// ---------------------------------------------------------------------------
// expected_extractor.hpp
//
// 정규식 패턴 기반 "기대값" 힌트 추출기 (채점 코드 텍스트 대상).
// 만점이 아닌 제출물에 "무엇이 기대되었는가"를 보여주기 위한 표시 전용 정보.
//
// [추출 패턴]
// - 대상 이름 : if\s+'(\w+)'\s+not\s+in\s+ns        (첫 매칭, 없으면 "unknown")
// - 기대값    : expected\s*=\s*(\[.*?\])
//               if\s+result\d*\s*!=\s*(\[.*?\])
//
// [설계 원칙]
// - 파서가 아니라 텍스트 패턴 매칭이다. 결과는 항상 optional/진단용이며
//   통과/실패 판정에 절대 사용하지 않는다.
// - 추출된 리터럴은 파이썬 표현식 파서로 "상수로만 이루어진 리스트"인지
//   확인한 뒤에만 채택한다 (코드 실행 없음).
// - 어떤 실패도 호출자에게 전파하지 않는다 (std::nullopt 반환).
//
// [알려진 한계 / 오귀속 가능성]
// 1. 한 채점 코드가 여러 callable 을 검사하면서 같은 `expected` 변수명을
//    재사용하면, 모든 기대값이 첫 번째 대상 이름에 귀속된다.
//    모호성을 임의로 "해결"하지 않고 그대로 둔다.
// 2. 중첩 리스트 `[[1, 2], [3]]` 는 비탐욕 매칭이 첫 `]` 에서 끝나므로
//    "[[1, 2]" 가 되어 리터럴 검증에서 버려진다 (미탐).
// 3. 여러 줄에 걸친 리터럴은 탐지하지 않는다 (`.` 은 개행 불일치).
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "parser/python_parser.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

class ExpectedValueExtractor {
public:
    ExpectedValueExtractor();
    ~ExpectedValueExtractor();

    // 복사 금지 (컴파일된 regex 재사용), 이동 허용
    ExpectedValueExtractor(const ExpectedValueExtractor&)            = delete;
    ExpectedValueExtractor& operator=(const ExpectedValueExtractor&) = delete;
    ExpectedValueExtractor(ExpectedValueExtractor&&) noexcept;
    ExpectedValueExtractor& operator=(ExpectedValueExtractor&&) noexcept;

    // extract
    //   리터럴이 하나도 없으면 std::nullopt.
    [[nodiscard]] std::optional<ExpectedValues> extract(std::string_view grader_source) const;

private:
    // 구현 파일에서 std::regex 를 포함하므로 헤더에서는 전방 선언만 사용.
    struct CompiledPattern;
    std::shared_ptr<CompiledPattern> subject_pattern_;
    std::vector<CompiledPattern>     value_patterns_;
    PythonParser                     parser_;

    [[nodiscard]] bool is_constant_list(const std::string& literal) const;
};
