// ---------------------------------------------------------------------------
// expected_extractor.cpp
//
// [CompiledPattern 구현 주의사항]
// 헤더의 vector<CompiledPattern> 는 incomplete type 이므로 소멸자를 cpp 에서
// 정의하고, std::regex 는 shared_ptr 로 보관한다.
//
// [regex 예외]
// std::regex_search 는 error_complexity / error_stack 을 던질 수 있다.
// 매우 긴 채점 코드에서 발생 가능하며, 이 경우 해당 패턴 결과만 버린다.
// ---------------------------------------------------------------------------

#include "parser/expected_extractor.hpp"

#include <regex>
#include <set>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

struct ExpectedValueExtractor::CompiledPattern {
    std::string                 source_pattern;
    std::shared_ptr<std::regex> compiled;
};

namespace {

constexpr const char* kSubjectPattern = R"(if\s+'(\w+)'\s+not\s+in\s+ns)";

constexpr const char* kValuePatterns[] = {
    R"(expected\s*=\s*(\[.*?\]))",
    R"(if\s+result\d*\s*!=\s*(\[.*?\]))",
};

// 상수 리스트 리터럴을 구성할 수 있는 노드 종류
const std::set<std::string> kLiteralKinds{
    "Expression", "List", "Tuple", "Set", "Dict", "Constant", "UnaryOp", "USub", "UAdd",
};

[[nodiscard]] std::shared_ptr<std::regex> compile_pattern(const char* pattern) {
    try {
        return std::make_shared<std::regex>(pattern, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        spdlog::warn("expected_extractor: invalid regex pattern '{}', skipping: {}", pattern, e.what());
        return nullptr;
    }
}

} // namespace

ExpectedValueExtractor::ExpectedValueExtractor() {
    subject_pattern_ = std::make_shared<CompiledPattern>(
        CompiledPattern{kSubjectPattern, compile_pattern(kSubjectPattern)});

    for (const char* p : kValuePatterns) {
        if (auto re = compile_pattern(p)) {
            value_patterns_.push_back(CompiledPattern{p, std::move(re)});
        }
    }
}

// CompiledPattern 의 완전한 정의 이후에 인스턴스화되어야 한다.
ExpectedValueExtractor::~ExpectedValueExtractor() = default;
ExpectedValueExtractor::ExpectedValueExtractor(ExpectedValueExtractor&&) noexcept = default;
ExpectedValueExtractor& ExpectedValueExtractor::operator=(ExpectedValueExtractor&&) noexcept = default;

bool ExpectedValueExtractor::is_constant_list(const std::string& literal) const {
    const auto program = parser_.parse_expression(literal);
    if (!program) {
        return false;
    }
    const auto body = program->children(program->root(), "body");
    if (body.empty() || body.front()->kind != "List") {
        return false;
    }
    for (const AstNode& node : program->nodes()) {
        if (kLiteralKinds.count(node.kind) == 0) {
            return false;
        }
    }
    return true;
}

std::optional<ExpectedValues> ExpectedValueExtractor::extract(std::string_view grader_source) const {
    const std::string text{grader_source};
    ExpectedValues    values{};

    try {
        std::smatch match;
        if (subject_pattern_ && subject_pattern_->compiled &&
            std::regex_search(text, match, *subject_pattern_->compiled)) {
            values.subject = match[1].str();
        }
    } catch (const std::regex_error& e) {
        spdlog::debug("expected_extractor: subject scan failed: {}", e.what());
    }

    for (const auto& cp : value_patterns_) {
        try {
            for (auto it = std::sregex_iterator(text.begin(), text.end(), *cp.compiled);
                 it != std::sregex_iterator(); ++it) {
                std::string literal = (*it)[1].str();
                if (is_constant_list(literal)) {
                    values.literals.push_back(std::move(literal));
                }
            }
        } catch (const std::regex_error& e) {
            spdlog::debug("expected_extractor: pattern '{}' scan failed: {}",
                          cp.source_pattern, e.what());
        }
    }

    if (values.literals.empty()) {
        return std::nullopt;
    }
    return values;
}
