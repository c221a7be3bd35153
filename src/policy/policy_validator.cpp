// ---------------------------------------------------------------------------
// policy_validator.cpp
//
// [검사 순서 (노드 하나당)]
// 1. 노드 종류가 disallowed_nodes 에 있으면 거부
// 2. Import      : alias.name 각각을 check_import(module, {}, 0)
// 3. ImportFrom  : check_import(module, [alias.name...], level)
//
// [오탐/미탐 트레이드오프]
// - getattr(__builtins__, ...) 류 동적 접근은 정적으로 잡지 않는다.
//   런타임 import 게이트와 프로세스 격리(seccomp, rlimit)가 2차 방어선이다.
// - `import numpy.linalg` 는 "numpy" 만 허용된 경우 거부된다 (정확 일치).
// ---------------------------------------------------------------------------

#include "policy/policy_validator.hpp"
#include "policy/import_rules.hpp"

#include <string>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] GradeFailure make_violation(const AstNode& node,
                                          std::string    offending,
                                          std::string    message) {
    GradeFailure failure{};
    failure.kind    = FailureKind::kPolicyViolation;
    failure.stage   = GradeState::kValidating;
    failure.detail  = std::move(offending);
    failure.message = std::move(message);
    failure.line    = node.line;
    failure.column  = node.column;
    return failure;
}

[[nodiscard]] std::vector<std::string> alias_names(const ParsedProgram& program,
                                                   const AstNode&       node) {
    std::vector<std::string> result;
    for (const AstNode* alias : program.children(node, "names")) {
        if (const std::string* name = alias->scalar("name")) {
            result.push_back(*name);
        }
    }
    return result;
}

[[nodiscard]] int parse_level(const AstNode& node) {
    const std::string* raw = node.scalar("level");
    if (raw == nullptr) {
        return 0;
    }
    try {
        return std::stoi(*raw);
    } catch (const std::exception&) {
        // 알 수 없는 level 은 상대 import 로 간주 (fail-close)
        return 1;
    }
}

} // namespace

PolicyValidator::PolicyValidator(const Policy& policy)
    : policy_(policy)
{}

std::expected<ParsedProgram, GradeFailure>
PolicyValidator::validate(std::string_view source) const {
    auto program = parser_.parse(source);
    if (!program) {
        spdlog::debug("policy_validator: syntax invalid at line {}: {}",
                      program.error().line, program.error().message);
        return std::unexpected(program.error());
    }

    if (auto violation = inspect(*program)) {
        spdlog::info("policy_validator: rejected source, kind={}, offending='{}', line={}",
                     to_string(violation->kind), violation->detail, violation->line);
        return std::unexpected(std::move(*violation));
    }
    return program;
}

std::optional<GradeFailure> PolicyValidator::inspect(const ParsedProgram& program) const {
    const ValidatorPolicy& vp = policy_.validator;

    for (const AstNode& node : program.nodes()) {
        if (vp.disallowed_nodes.count(node.kind) != 0) {
            return make_violation(node, node.kind,
                                  fmt::format("'{}' statements are not allowed", node.kind));
        }

        if (node.kind == "Import") {
            for (const auto& module : alias_names(program, node)) {
                const auto decision = check_import(vp, module, {}, 0);
                if (!decision.allowed) {
                    return make_violation(node, decision.offending, decision.reason);
                }
            }
        } else if (node.kind == "ImportFrom") {
            const std::string* module = node.scalar("module");
            const auto decision = check_import(vp, module != nullptr ? *module : std::string{},
                                               alias_names(program, node), parse_level(node));
            if (!decision.allowed) {
                return make_violation(node, decision.offending, decision.reason);
            }
        }
    }
    return std::nullopt;
}
