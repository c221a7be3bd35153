// ---------------------------------------------------------------------------
// code_metrics.cpp
//
// AST arena 선형 순회 기반 지표 계산.
// 파싱 실패는 중립값으로 흡수하고 debug 로그만 남긴다 (total function).
// ---------------------------------------------------------------------------

#include "metrics/code_metrics.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>
#include <map>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front())) != 0) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back())) != 0) {
        sv.remove_suffix(1);
    }
    return sv;
}

[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t start = 0;
    while (start <= text.size()) {
        const auto end = text.find('\n', start);
        if (end == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, end - start));
        start = end + 1;
    }
    return lines;
}

[[nodiscard]] bool is_function(const AstNode& node) {
    return node.kind == "FunctionDef" || node.kind == "AsyncFunctionDef";
}

[[nodiscard]] int complexity_of(const ParsedProgram& program) {
    int complexity = 1;  // 기본 경로
    for (const AstNode& node : program.nodes()) {
        if (node.kind == "If" || node.kind == "For" || node.kind == "While" ||
            node.kind == "ExceptHandler") {
            ++complexity;
        } else if (node.kind == "BoolOp") {
            const auto operands = program.children(node, "values").size();
            if (operands > 0) {
                complexity += static_cast<int>(operands) - 1;
            }
        }
    }
    return complexity;
}

[[nodiscard]] std::size_t count_kind(const ParsedProgram& program, bool (*pred)(const AstNode&)) {
    return static_cast<std::size_t>(std::count_if(
        program.nodes().begin(), program.nodes().end(), pred));
}

[[nodiscard]] double coverage_of(const ParsedProgram& program, const ParsedProgram& tests) {
    const std::size_t functions = count_kind(program, is_function);
    if (functions == 0) {
        return 100.0;
    }
    const std::size_t assertions = count_kind(
        tests, [](const AstNode& n) { return n.kind == "Assert"; });
    return std::min(100.0, 100.0 * static_cast<double>(assertions) /
                               static_cast<double>(functions));
}

[[nodiscard]] bool has_type_hints_in(const ParsedProgram& program) {
    for (const AstNode& node : program.nodes()) {
        if (node.kind == "AnnAssign") {
            return true;
        }
        if (!is_function(node)) {
            continue;
        }
        if (!program.children(node, "returns").empty()) {
            return true;
        }
        for (const AstNode* args : program.children(node, "args")) {
            for (const char* field : {"posonlyargs", "args", "vararg", "kwonlyargs", "kwarg"}) {
                for (const AstNode* arg : program.children(*args, field)) {
                    if (!program.children(*arg, "annotation").empty()) {
                        return true;
                    }
                }
            }
        }
    }
    return false;
}

// 본문 첫 문장이 비어 있지 않은 문자열 상수이면 docstring 으로 본다.
[[nodiscard]] bool has_docstring_in(const ParsedProgram& program) {
    for (const AstNode& node : program.nodes()) {
        if (!is_function(node) && node.kind != "ClassDef" && node.kind != "Module") {
            continue;
        }
        const auto body = program.children(node, "body");
        if (body.empty() || body.front()->kind != "Expr") {
            continue;
        }
        const auto values = program.children(*body.front(), "value");
        if (values.empty() || values.front()->kind != "Constant") {
            continue;
        }
        const std::string* type  = values.front()->scalar("value_type");
        const std::string* value = values.front()->scalar("value");
        if (type != nullptr && *type == "str" && value != nullptr && !trim(*value).empty()) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] std::uint32_t non_blank_lines(std::string_view source) {
    std::uint32_t count = 0;
    for (const auto line : split_lines(source)) {
        if (!trim(line).empty()) {
            ++count;
        }
    }
    return count;
}

} // namespace

int CodeMetrics::complexity(std::string_view source) const {
    const auto program = parser_.parse(source);
    if (!program) {
        spdlog::debug("code_metrics: complexity on unparsable source, returning 0");
        return 0;
    }
    return complexity_of(*program);
}

double CodeMetrics::duplication(std::string_view source) const {
    std::map<std::string_view, int> counts;
    std::uint32_t                   total = 0;
    for (const auto raw : split_lines(source)) {
        const auto line = trim(raw);
        if (line.empty()) {
            continue;
        }
        ++total;
        if (line.front() != '#') {
            ++counts[line];
        }
    }
    if (total == 0) {
        return 0.0;
    }

    int duplicates = 0;
    for (const auto& [line, count] : counts) {
        duplicates += count - 1;
    }
    return std::min(100.0, 100.0 * static_cast<double>(duplicates) / static_cast<double>(total));
}

double CodeMetrics::coverage(std::string_view source, std::string_view test_source) const {
    const auto program = parser_.parse(source);
    const auto tests   = parser_.parse(test_source);
    if (!program || !tests) {
        return 0.0;
    }
    return coverage_of(*program, *tests);
}

bool CodeMetrics::has_type_hints(std::string_view source) const {
    const auto program = parser_.parse(source);
    return program && has_type_hints_in(*program);
}

bool CodeMetrics::has_docstring(std::string_view source) const {
    const auto program = parser_.parse(source);
    return program && has_docstring_in(*program);
}

MetricsSummary CodeMetrics::summarize(std::string_view source, std::string_view test_source) const {
    MetricsSummary summary{};
    summary.duplication   = duplication(source);
    summary.lines_of_code = non_blank_lines(source);

    const auto program = parser_.parse(source);
    if (!program) {
        return summary;
    }
    summary.complexity     = complexity_of(*program);
    summary.has_type_hints = has_type_hints_in(*program);
    summary.has_docstring  = has_docstring_in(*program);

    const auto tests = parser_.parse(test_source);
    summary.coverage = tests ? coverage_of(*program, *tests) : 0.0;
    return summary;
}

RefactorAssessment CodeMetrics::assess_refactor(const std::optional<MetricsSummary>& previous,
                                                const MetricsSummary&                current,
                                                bool                                 passed) {
    RefactorAssessment result{};
    if (!previous) {
        result.reason = "no previous metrics to compare against";
        return result;
    }

    result.applicable = true;
    if (!passed) {
        result.reason = "refactored code must still pass every test";
        return result;
    }

    if (current.complexity <= previous->complexity) {
        result.improved = true;
        result.reason   = fmt::format("complexity {} -> {}", previous->complexity, current.complexity);
    } else if (current.has_docstring || current.has_type_hints) {
        result.improved = true;
        result.reason   = "documentation or type hints added";
    } else {
        result.reason = fmt::format("complexity increased {} -> {} without docstring or type hints",
                                    previous->complexity, current.complexity);
    }
    return result;
}
