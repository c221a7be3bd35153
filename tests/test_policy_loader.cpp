// ---------------------------------------------------------------------------
// test_policy_loader.cpp
//
// PolicyLoader 단위 테스트.
//
// [테스트 범위]
// - 저장소의 config/policy.yaml 이 로드되고 기본값과 일치한다
// - 누락 섹션은 구조체 기본값을 적용한다
// - allowed_imports: 목록 / "*" / null 표기
// - fail-close: 파일 없음, YAML 문법 오류, 잘못된 allowed_imports,
//   빈 submission_builtins, 빈 entrypoint
// - emit → from_node 가 같은 정책을 복원한다 (러너 요청 프레임 경로)
// - 알 수 없는 log_level/log_format 은 기본값으로 대체
// ---------------------------------------------------------------------------

#include "policy/policy_loader.hpp"

#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

namespace fs = std::filesystem;

namespace {

// 임시 YAML 파일 (소멸 시 삭제)
class TempYaml {
public:
    explicit TempYaml(const std::string& content) {
        static std::atomic<int> counter{0};
        path_ = fs::temp_directory_path() /
                ("gradegate_policy_" + std::to_string(::getpid()) + "_" +
                 std::to_string(counter.fetch_add(1)) + ".yaml");
        std::ofstream out(path_);
        out << content;
    }
    ~TempYaml() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    TempYaml(const TempYaml&)            = delete;
    TempYaml& operator=(const TempYaml&) = delete;

    [[nodiscard]] const fs::path& path() const noexcept { return path_; }

private:
    fs::path path_;
};

std::expected<Policy, std::string> load_text(const std::string& yaml) {
    return PolicyLoader::from_node(YAML::Load(yaml));
}

} // namespace

// ---------------------------------------------------------------------------
// 기본 정책 파일
// ---------------------------------------------------------------------------
TEST(PolicyLoader, ShippedPolicy_LoadsWithDefaults) {
    const auto policy = PolicyLoader::load(fs::path{GRADEGATE_SOURCE_DIR} / "config/policy.yaml");
    ASSERT_TRUE(policy.has_value()) << policy.error();

    EXPECT_EQ(policy->global.log_level, "info");
    EXPECT_EQ(policy->global.log_format, "json");
    EXPECT_EQ(policy->validator.disallowed_nodes.count("Global"), 1u);
    EXPECT_EQ(policy->validator.disallowed_nodes.count("AsyncWith"), 1u);

    ASSERT_EQ(policy->validator.allowed_imports.count("numpy"), 1u);
    EXPECT_TRUE(policy->validator.allowed_imports.at("numpy").allows_all());
    ASSERT_EQ(policy->validator.allowed_imports.count("time"), 1u);
    EXPECT_EQ(policy->validator.allowed_imports.at("time").symbols->size(), 3u);

    EXPECT_EQ(policy->namespaces.entrypoint, "grade");
    EXPECT_EQ(policy->namespaces.submission_builtins,
              NamespacePolicy{}.submission_builtins);
    EXPECT_EQ(policy->namespaces.grader_extra_builtins,
              NamespacePolicy{}.grader_extra_builtins);
    EXPECT_EQ(policy->sandbox.submission_timeout_ms, 5000u);
    EXPECT_EQ(policy->sandbox.grader_timeout_ms, 30000u);
    EXPECT_TRUE(policy->probing.enabled);
}

TEST(PolicyLoader, MissingSections_UseDefaults) {
    const auto policy = load_text("global:\n  log_level: debug\n");
    ASSERT_TRUE(policy.has_value()) << policy.error();

    EXPECT_EQ(policy->global.log_level, "debug");
    EXPECT_EQ(policy->sandbox.memory_limit_mb, 512u);
    EXPECT_EQ(policy->sandbox.output_limit_kb, 256u);
    EXPECT_EQ(policy->namespaces.grader_modules, std::vector<std::string>{"inspect"});
    EXPECT_EQ(policy->validator.allowed_imports.size(), 3u);
}

TEST(PolicyLoader, AllowedImports_ListStarAndNull) {
    const auto policy = load_text(
        "validator:\n"
        "  allowed_imports:\n"
        "    math: [sqrt, floor]\n"
        "    random: \"*\"\n"
        "    collections:\n");
    ASSERT_TRUE(policy.has_value()) << policy.error();

    const auto& imports = policy->validator.allowed_imports;
    ASSERT_EQ(imports.size(), 3u);
    EXPECT_FALSE(imports.at("math").allows_all());
    EXPECT_EQ(imports.at("math").symbols->count("sqrt"), 1u);
    EXPECT_TRUE(imports.at("random").allows_all());
    EXPECT_TRUE(imports.at("collections").allows_all());
    // 목록을 주면 기본 항목은 대체된다
    EXPECT_EQ(imports.count("numpy"), 0u);
}

// ---------------------------------------------------------------------------
// fail-close
// ---------------------------------------------------------------------------
TEST(PolicyLoader, MissingFile_Fails) {
    const auto policy = PolicyLoader::load("/nonexistent/gradegate/policy.yaml");
    EXPECT_FALSE(policy.has_value());
}

TEST(PolicyLoader, SyntaxError_Fails) {
    TempYaml file{"validator: [unclosed\n"};
    const auto policy = PolicyLoader::load(file.path());
    ASSERT_FALSE(policy.has_value());
    EXPECT_NE(policy.error().find("YAML"), std::string::npos) << policy.error();
}

TEST(PolicyLoader, AllowedImportsScalar_Fails) {
    const auto policy = load_text(
        "validator:\n"
        "  allowed_imports:\n"
        "    math: sqrt\n");
    ASSERT_FALSE(policy.has_value());
    EXPECT_NE(policy.error().find("math"), std::string::npos) << policy.error();
}

TEST(PolicyLoader, EmptySubmissionBuiltins_Fails) {
    const auto policy = load_text("namespace:\n  submission_builtins: []\n");
    EXPECT_FALSE(policy.has_value());
}

TEST(PolicyLoader, EmptyEntrypoint_Fails) {
    const auto policy = load_text("namespace:\n  entrypoint: \"\"\n");
    EXPECT_FALSE(policy.has_value());
}

TEST(PolicyLoader, NonMapDocument_Fails) {
    EXPECT_FALSE(load_text("- just\n- a list\n").has_value());
}

// ---------------------------------------------------------------------------
// 경고 후 기본값
// ---------------------------------------------------------------------------
TEST(PolicyLoader, UnknownLogLevelAndFormat_FallBack) {
    const auto policy = load_text("global:\n  log_level: loud\n  log_format: xml\n");
    ASSERT_TRUE(policy.has_value()) << policy.error();
    EXPECT_EQ(policy->global.log_level, "info");
    EXPECT_EQ(policy->global.log_format, "json");
}

TEST(PolicyLoader, ZeroSubmissionTimeout_FallsBackToDefault) {
    const auto policy = load_text("sandbox:\n  submission_timeout_ms: 0\n");
    ASSERT_TRUE(policy.has_value()) << policy.error();
    EXPECT_EQ(policy->sandbox.submission_timeout_ms, 5000u);
}

// ---------------------------------------------------------------------------
// emit / from_node 대칭
// ---------------------------------------------------------------------------
TEST(PolicyLoader, Emit_IsReadBackByFromNode) {
    Policy original{};
    original.global.log_level              = "warn";
    original.validator.allowed_imports.erase("numpy");
    original.validator.allowed_imports.emplace("math", ImportRule{std::set<std::string>{"pi"}});
    original.validator.allowed_imports.emplace("random", ImportRule{});
    original.namespaces.entrypoint         = "evaluate";
    original.namespaces.grader_modules     = {"inspect", "math"};
    original.sandbox.runner_path           = "/opt/gradegate/bin/gradegate-runner";
    original.sandbox.probe_call_timeout_ms = 250;
    original.sandbox.seccomp               = false;
    original.probing.enrich_expected       = false;

    YAML::Emitter out;
    PolicyLoader::emit(out, original);
    ASSERT_TRUE(out.good()) << out.GetLastError();

    const auto restored = load_text(out.c_str());
    ASSERT_TRUE(restored.has_value()) << restored.error();

    EXPECT_EQ(restored->global.log_level, "warn");
    EXPECT_EQ(restored->validator.disallowed_nodes, original.validator.disallowed_nodes);
    ASSERT_EQ(restored->validator.allowed_imports.size(),
              original.validator.allowed_imports.size());
    EXPECT_TRUE(restored->validator.allowed_imports.at("random").allows_all());
    EXPECT_EQ(*restored->validator.allowed_imports.at("math").symbols,
              std::set<std::string>{"pi"});
    EXPECT_EQ(restored->namespaces.submission_builtins, original.namespaces.submission_builtins);
    EXPECT_EQ(restored->namespaces.entrypoint, "evaluate");
    EXPECT_EQ(restored->namespaces.grader_modules, original.namespaces.grader_modules);
    EXPECT_EQ(restored->sandbox.runner_path, original.sandbox.runner_path);
    EXPECT_EQ(restored->sandbox.probe_call_timeout_ms, 250u);
    EXPECT_FALSE(restored->sandbox.seccomp);
    EXPECT_FALSE(restored->probing.enrich_expected);
}
