// ---------------------------------------------------------------------------
// policy_loader.cpp
//
// YAML 정책 파일을 로드하여 Policy 구조체로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 파싱 실패 시 부분 정책을 반환하지 않는다.
// - Fail-close: namespace.submission_builtins 가 비어있으면 std::unexpected 반환.
//   (빈 목록이면 print 조차 없는 네임스페이스가 되어 모든 제출물이 실패한다.
//    운영자 실수를 조기에 드러내기 위해 명시적 오류로 처리한다.)
// - YAML 파일 전체를 로그에 출력하지 않는다.
// - 필드 누락 시 기본값(구조체 기본값)을 적용한다.
//
// [allowed_imports 표기]
//   validator:
//     allowed_imports:
//       functools: [wraps]      # 제한 집합
//       numpy: "*"              # 모든 심볼 허용 (null 도 동일)
//
// [알려진 한계]
// - 모듈 이름은 정확히 일치해야 한다. "numpy" 허용이 "numpy.linalg" 를
//   허용하지 않는다 (fail-close 방향의 미탐 없음, 오탐 가능).
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <array>
#include <filesystem>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

namespace {

constexpr std::array<std::string_view, 6> kLogLevels{
    "trace", "debug", "info", "warn", "error", "critical"};

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 벡터를 읽는다.
// 노드가 없거나 sequence 가 아니면 빈 벡터를 반환한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 bool 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] bool read_bool(const YAML::Node& node, bool fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<bool>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 uint32_t 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        spdlog::warn("policy_loader: '{}' is not an unsigned integer, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 노드에서 string 값을 읽는다. 없으면 fallback 반환.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level  = read_string(global_node["log_level"],  cfg.log_level);
    cfg.log_format = read_string(global_node["log_format"], cfg.log_format);

    bool known = false;
    for (const auto level : kLogLevels) {
        known = known || level == cfg.log_level;
    }
    if (!known) {
        spdlog::warn("policy_loader: global.log_level '{}' is unknown, defaulting to 'info'",
                     cfg.log_level);
        cfg.log_level = "info";
    }
    if (cfg.log_format != "json" && cfg.log_format != "text") {
        spdlog::warn("policy_loader: global.log_format '{}' is not 'json' or 'text', "
                     "defaulting to 'json'", cfg.log_format);
        cfg.log_format = "json";
    }
    return cfg;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: allowed_imports 항목 하나 파싱
//   null / "*"  → 모든 심볼 허용
//   sequence    → 제한 집합
//   그 외       → 스키마 오류 (fail-close)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<ImportRule, std::string>
parse_import_rule(const std::string& module, const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return ImportRule{};
    }
    if (node.IsScalar()) {
        if (node.Scalar() == "*") {
            return ImportRule{};
        }
        return std::unexpected(fmt::format(
            "policy_loader: allowed_imports.{} must be a list of symbols or \"*\", got '{}'",
            module, node.Scalar()));
    }
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format(
            "policy_loader: allowed_imports.{} must be a list of symbols or \"*\"", module));
    }

    std::set<std::string> symbols;
    for (const auto& name : read_string_sequence(node)) {
        symbols.insert(name);
    }
    return ImportRule{std::move(symbols)};
}

[[nodiscard]] std::expected<ValidatorPolicy, std::string>
parse_validator(const YAML::Node& node) {
    ValidatorPolicy vp{};
    if (!node || !node.IsMap()) {
        return vp;
    }

    if (node["disallowed_nodes"]) {
        vp.disallowed_nodes.clear();
        for (auto& kind : read_string_sequence(node["disallowed_nodes"])) {
            vp.disallowed_nodes.insert(std::move(kind));
        }
    }

    const YAML::Node imports = node["allowed_imports"];
    if (imports) {
        if (!imports.IsMap() && !imports.IsNull()) {
            return std::unexpected(std::string{
                "policy_loader: validator.allowed_imports must be a map"});
        }
        vp.allowed_imports.clear();
        if (imports.IsMap()) {
            for (const auto& entry : imports) {
                const auto module = entry.first.as<std::string>();
                auto rule = parse_import_rule(module, entry.second);
                if (!rule) {
                    return std::unexpected(rule.error());
                }
                vp.allowed_imports.emplace(module, std::move(*rule));
            }
        }
    }
    return vp;
}

[[nodiscard]] NamespacePolicy parse_namespaces(const YAML::Node& node) {
    NamespacePolicy np{};
    if (!node || !node.IsMap()) {
        return np;
    }

    if (node["submission_builtins"]) {
        np.submission_builtins = read_string_sequence(node["submission_builtins"]);
    }
    if (node["grader_extra_builtins"]) {
        np.grader_extra_builtins = read_string_sequence(node["grader_extra_builtins"]);
    }
    if (node["grader_modules"]) {
        np.grader_modules = read_string_sequence(node["grader_modules"]);
    }
    np.entrypoint = read_string(node["entrypoint"], np.entrypoint);
    return np;
}

[[nodiscard]] SandboxLimits parse_sandbox(const YAML::Node& node) {
    SandboxLimits sl{};
    if (!node || !node.IsMap()) {
        return sl;
    }

    sl.runner_path           = read_string(node["runner_path"], sl.runner_path);
    sl.work_dir              = read_string(node["work_dir"], sl.work_dir);
    sl.submission_timeout_ms = read_uint32(node["submission_timeout_ms"], sl.submission_timeout_ms);
    sl.grader_timeout_ms     = read_uint32(node["grader_timeout_ms"], sl.grader_timeout_ms);
    sl.probe_timeout_ms      = read_uint32(node["probe_timeout_ms"], sl.probe_timeout_ms);
    sl.probe_call_timeout_ms = read_uint32(node["probe_call_timeout_ms"], sl.probe_call_timeout_ms);
    sl.memory_limit_mb       = read_uint32(node["memory_limit_mb"], sl.memory_limit_mb);
    sl.output_limit_kb       = read_uint32(node["output_limit_kb"], sl.output_limit_kb);
    sl.max_processes         = read_uint32(node["max_processes"], sl.max_processes);
    sl.network_isolation     = read_bool(node["network_isolation"], sl.network_isolation);
    sl.seccomp               = read_bool(node["seccomp"], sl.seccomp);

    if (sl.submission_timeout_ms == 0) {
        // 0 은 "제한 없음"으로 해석될 여지가 있으므로 허용하지 않는다.
        spdlog::warn("policy_loader: sandbox.submission_timeout_ms must be > 0, using 5000");
        sl.submission_timeout_ms = 5000;
    }
    return sl;
}

[[nodiscard]] ProbingPolicy parse_probing(const YAML::Node& node) {
    ProbingPolicy pp{};
    if (!node || !node.IsMap()) {
        return pp;
    }
    pp.enabled         = read_bool(node["enabled"], pp.enabled);
    pp.enrich_expected = read_bool(node["enrich_expected"], pp.enrich_expected);
    return pp;
}

void emit_string_sequence(YAML::Emitter& out, const char* key,
                          const std::vector<std::string>& values) {
    out << YAML::Key << key << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& v : values) {
        out << YAML::DoubleQuoted << v;
    }
    out << YAML::EndSeq;
}

} // namespace

// ---------------------------------------------------------------------------
// PolicyLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<Policy, std::string>
PolicyLoader::load(const std::filesystem::path& config_path) {
    // 1. 경로 정규화
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "policy_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("policy_loader: loading policy from '{}'", canonical_path.string());

    // 2. YAML 파일 로드 (yaml-cpp 예외 처리)
    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "policy_loader: cannot open file '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(),
            e.mark.line + 1,   // yaml-cpp는 0-based
            e.mark.column + 1,
            e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "policy_loader: YAML error in '{}': {}",
            canonical_path.string(), e.what()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    auto policy = from_node(root);
    if (!policy) {
        spdlog::error("{}", policy.error());
        return policy;
    }

    spdlog::info(
        "policy_loader: policy loaded successfully, "
        "disallowed_nodes={}, allowed_imports={}, submission_builtins={}",
        policy->validator.disallowed_nodes.size(),
        policy->validator.allowed_imports.size(),
        policy->namespaces.submission_builtins.size()
    );
    return policy;
}

// ---------------------------------------------------------------------------
// PolicyLoader::from_node 구현
//   섹션별 try-catch 로 yaml-cpp 타입 변환 예외를 오류 문자열로 바꾼다.
// ---------------------------------------------------------------------------
std::expected<Policy, std::string>
PolicyLoader::from_node(const YAML::Node& root) {
    if (!root || !root.IsMap()) {
        return std::unexpected(std::string{
            "policy_loader: policy document is not a valid YAML map (top-level)"});
    }

    Policy policy{};

    try {
        policy.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing 'global' section: {}", e.what()));
    }

    try {
        auto validator = parse_validator(root["validator"]);
        if (!validator) {
            return std::unexpected(validator.error());
        }
        policy.validator = std::move(*validator);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing 'validator' section: {}", e.what()));
    }

    try {
        policy.namespaces = parse_namespaces(root["namespace"]);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing 'namespace' section: {}", e.what()));
    }

    try {
        policy.sandbox = parse_sandbox(root["sandbox"]);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing 'sandbox' section: {}", e.what()));
    }

    try {
        policy.probing = parse_probing(root["probing"]);
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format(
            "policy_loader: error parsing 'probing' section: {}", e.what()));
    }

    // submission_builtins 최소 1개 검증 (fail-close)
    if (policy.namespaces.submission_builtins.empty()) {
        return std::unexpected(std::string{
            "policy_loader: namespace.submission_builtins must list at least one primitive"});
    }
    if (policy.namespaces.entrypoint.empty()) {
        return std::unexpected(std::string{
            "policy_loader: namespace.entrypoint must not be empty"});
    }

    return policy;
}

// ---------------------------------------------------------------------------
// PolicyLoader::emit 구현
// ---------------------------------------------------------------------------
void PolicyLoader::emit(YAML::Emitter& out, const Policy& policy) {
    out << YAML::BeginMap;

    out << YAML::Key << "global" << YAML::Value << YAML::BeginMap
        << YAML::Key << "log_level"  << YAML::Value << policy.global.log_level
        << YAML::Key << "log_format" << YAML::Value << policy.global.log_format
        << YAML::EndMap;

    out << YAML::Key << "validator" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "disallowed_nodes" << YAML::Value << YAML::Flow << YAML::BeginSeq;
    for (const auto& kind : policy.validator.disallowed_nodes) {
        out << YAML::DoubleQuoted << kind;
    }
    out << YAML::EndSeq;
    out << YAML::Key << "allowed_imports" << YAML::Value << YAML::BeginMap;
    for (const auto& [module, rule] : policy.validator.allowed_imports) {
        out << YAML::Key << YAML::DoubleQuoted << module << YAML::Value;
        if (rule.allows_all()) {
            out << YAML::Null;
        } else {
            out << YAML::Flow << YAML::BeginSeq;
            for (const auto& sym : *rule.symbols) {
                out << YAML::DoubleQuoted << sym;
            }
            out << YAML::EndSeq;
        }
    }
    out << YAML::EndMap;
    out << YAML::EndMap;

    out << YAML::Key << "namespace" << YAML::Value << YAML::BeginMap;
    emit_string_sequence(out, "submission_builtins", policy.namespaces.submission_builtins);
    emit_string_sequence(out, "grader_extra_builtins", policy.namespaces.grader_extra_builtins);
    emit_string_sequence(out, "grader_modules", policy.namespaces.grader_modules);
    out << YAML::Key << "entrypoint" << YAML::Value << YAML::DoubleQuoted
        << policy.namespaces.entrypoint;
    out << YAML::EndMap;

    const auto& sl = policy.sandbox;
    out << YAML::Key << "sandbox" << YAML::Value << YAML::BeginMap
        << YAML::Key << "runner_path"           << YAML::Value << YAML::DoubleQuoted << sl.runner_path
        << YAML::Key << "work_dir"              << YAML::Value << YAML::DoubleQuoted << sl.work_dir
        << YAML::Key << "submission_timeout_ms" << YAML::Value << sl.submission_timeout_ms
        << YAML::Key << "grader_timeout_ms"     << YAML::Value << sl.grader_timeout_ms
        << YAML::Key << "probe_timeout_ms"      << YAML::Value << sl.probe_timeout_ms
        << YAML::Key << "probe_call_timeout_ms" << YAML::Value << sl.probe_call_timeout_ms
        << YAML::Key << "memory_limit_mb"       << YAML::Value << sl.memory_limit_mb
        << YAML::Key << "output_limit_kb"       << YAML::Value << sl.output_limit_kb
        << YAML::Key << "max_processes"         << YAML::Value << sl.max_processes
        << YAML::Key << "network_isolation"     << YAML::Value << sl.network_isolation
        << YAML::Key << "seccomp"               << YAML::Value << sl.seccomp
        << YAML::EndMap;

    out << YAML::Key << "probing" << YAML::Value << YAML::BeginMap
        << YAML::Key << "enabled"         << YAML::Value << policy.probing.enabled
        << YAML::Key << "enrich_expected" << YAML::Value << policy.probing.enrich_expected
        << YAML::EndMap;

    out << YAML::EndMap;
}
