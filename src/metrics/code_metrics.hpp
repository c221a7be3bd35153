#pragma once

// ---------------------------------------------------------------------------
// code_metrics.hpp
//
// 정적 코드 품질 지표 (리팩터링 단계 판정용).
//
// [설계 원칙]
// - 모든 함수는 total: 예외를 던지지 않고, 파싱 불가 소스에는 중립값을 반환한다.
//     complexity 0 / coverage 0.0 / has_* false / duplication 은 텍스트 기반이라 항상 계산
// - 코드를 실행하지 않는다 (AST 와 텍스트만 사용).
// - 상태 없음. 여러 스레드에서 동시에 호출해도 안전하다.
//
// [알려진 한계]
// - coverage 는 assert 개수 / 함수 개수 기반의 의도적으로 거친 휴리스틱이다.
//   실제 라인/분기 커버리지가 아니다.
// - complexity 는 if/for/while/except 와 불리언 연산자만 센다.
//   삼항식(IfExp), 컴프리헨션 조건, match 문은 세지 않는다.
// ---------------------------------------------------------------------------

#include "parser/python_parser.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// MetricsSummary
//   한 소스에 대한 지표 묶음. lines_of_code 는 공백이 아닌 줄 수.
// ---------------------------------------------------------------------------
struct MetricsSummary {
    int           complexity{0};
    double        coverage{0.0};
    double        duplication{0.0};
    bool          has_type_hints{false};
    bool          has_docstring{false};
    std::uint32_t lines_of_code{0};
};

// ---------------------------------------------------------------------------
// RefactorAssessment
//   applicable == false 이면 비교 대상(이전 지표)이 없어 판정하지 않았음을 뜻한다.
// ---------------------------------------------------------------------------
struct RefactorAssessment {
    bool        applicable{false};
    bool        improved{false};
    std::string reason{};
};

class CodeMetrics {
public:
    CodeMetrics()  = default;
    ~CodeMetrics() = default;

    CodeMetrics(const CodeMetrics&)            = default;
    CodeMetrics& operator=(const CodeMetrics&) = default;
    CodeMetrics(CodeMetrics&&)                 = default;
    CodeMetrics& operator=(CodeMetrics&&)      = default;

    // complexity
    //   1 + (If/For/While/ExceptHandler 개수) + Σ(BoolOp 피연산자 수 - 1)
    [[nodiscard]] int complexity(std::string_view source) const;

    // duplication
    //   100 × Σ(중복 등장 횟수 - 1) / (공백 아닌 줄 수), 최대 100.
    //   주석 줄(#)은 중복 계산에서 제외하지만 분모에는 포함된다.
    [[nodiscard]] double duplication(std::string_view source) const;

    // coverage
    //   함수 정의가 없으면 100, 아니면 min(100, 100 × assert 수 / 함수 수).
    [[nodiscard]] double coverage(std::string_view source, std::string_view test_source) const;

    [[nodiscard]] bool has_type_hints(std::string_view source) const;
    [[nodiscard]] bool has_docstring(std::string_view source) const;

    // summarize
    //   한 번만 파싱하여 모든 지표를 계산한다.
    [[nodiscard]] MetricsSummary summarize(std::string_view source,
                                           std::string_view test_source = {}) const;

    // assess_refactor
    //   리팩터링 단계 수락 규칙:
    //   통과(passed) AND (복잡도 비악화 OR docstring 존재 OR 타입 힌트 존재)
    //   previous 가 없으면 applicable = false, improved = false.
    [[nodiscard]] static RefactorAssessment assess_refactor(
        const std::optional<MetricsSummary>& previous,
        const MetricsSummary&                current,
        bool                                 passed);

private:
    PythonParser parser_;
};
