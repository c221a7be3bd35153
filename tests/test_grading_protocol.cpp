// ---------------------------------------------------------------------------
// test_grading_protocol.cpp
//
// GradingProtocol 통합 테스트 (검증 → 러너 프로세스 → 해석).
//
// [테스트 범위]
// - 정상 채점: 상태 전이 순서, 점수/피드백/출력, 진단 정보
// - 검증 단계 실패 (문법 / 금지 노드 / 금지 import): 러너를 띄우지 않는다
// - 제출물 런타임 오류, 채점 함수 예외 (Invoking 단계)
// - 제출물 / 채점 단계 시간 초과 → kTimeoutExceeded
// - 계약 위반: entrypoint 없음, dict 아닌 반환
// - __import__ 직접 호출로 우회한 런타임 import → kPolicyViolation
// - len.__self__ 로 얻은 실제 builtins 의 open / __import__ → 감사 훅이 거부
// - 동일 동작 두 제출물의 지표 비교 (리팩터링 판정)
// - 점수 정규화: 상한/하한 clamp, 음수 max_score
// - 기대값 보강: 만점 미만일 때만
// - 프로브 단계 만료: 결과 유지 + probes_complete = false
// - normalize 단위 검사
// ---------------------------------------------------------------------------

#include "grading/grading_protocol.hpp"
#include "metrics/code_metrics.hpp"
#include "parser/python_runtime.hpp"

#include <gtest/gtest.h>

#include <cerrno>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

class GradingProtocolTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        const auto init = PythonRuntime::initialize(InterpreterMode::kHost);
        ASSERT_TRUE(init.has_value()) << init.error();
    }

    void SetUp() override {
        policy_.sandbox.runner_path           = GRADEGATE_RUNNER_PATH;
        policy_.sandbox.submission_timeout_ms = 3000;
        policy_.sandbox.grader_timeout_ms     = 3000;
        policy_.sandbox.probe_timeout_ms      = 3000;
        policy_.sandbox.probe_call_timeout_ms = 200;
    }

    [[nodiscard]] std::expected<GradeResult, GradeFailure> grade(const std::string& submission,
                                                                 const std::string& grader) {
        const GradingProtocol protocol{policy_};
        trace_ = GradeTrace{};
        return protocol.grade(submission, grader, &trace_);
    }

    Policy     policy_{};
    GradeTrace trace_{};
};

constexpr const char* kSubmission =
    "def double(xs):\n"
    "    return [x * 2 for x in xs]\n"
    "print('module loaded')\n";

std::string grader_returning(const std::string& mapping) {
    return "def grade(ns):\n    return " + mapping + "\n";
}

const std::vector<GradeState> kSuccessPath{
    GradeState::kValidating,  GradeState::kExecutingSubmission, GradeState::kExecutingGrader,
    GradeState::kInvoking,    GradeState::kNormalizing,         GradeState::kDone,
};

} // namespace

// ---------------------------------------------------------------------------
// 정상 경로
// ---------------------------------------------------------------------------
TEST_F(GradingProtocolTest, FullMarks_SuccessPath) {
    const auto result = grade(kSubmission,
        "def grade(ns):\n"
        "    ok = ns['double']([1, 2, 3]) == [2, 4, 6]\n"
        "    return {'score': 100 if ok else 0, 'max_score': 100, 'feedback': 'All tests passed'}\n");
    ASSERT_TRUE(result.has_value()) << result.error().detail;

    EXPECT_EQ(result->score, 100);
    EXPECT_EQ(result->max_score, 100);
    EXPECT_EQ(result->feedback, "All tests passed");
    EXPECT_EQ(result->stdout_text, "module loaded\n");
    EXPECT_EQ(trace_.states, kSuccessPath);
    EXPECT_TRUE(trace_.sandbox_launched);

    ASSERT_TRUE(result->diagnostics.has_value());
    EXPECT_TRUE(result->diagnostics->probes_complete);
    ASSERT_EQ(result->diagnostics->probes.size(), 1u);
    EXPECT_EQ(result->diagnostics->probes[0].name, "double");
    EXPECT_FALSE(result->diagnostics->expected.has_value());

    // 러너는 회수되어 있다
    EXPECT_EQ(::kill(trace_.runner_pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(GradingProtocolTest, ProbingDisabled_NoDiagnostics) {
    policy_.probing.enabled = false;
    const auto result = grade(kSubmission, grader_returning("{'score': 100}"));
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_FALSE(result->diagnostics.has_value());
}

TEST_F(GradingProtocolTest, MissingKeys_UseDefaults) {
    policy_.probing.enabled = false;
    const auto result = grade(kSubmission, grader_returning("{}"));
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->score, 0);
    EXPECT_EQ(result->max_score, 100);
    EXPECT_TRUE(result->feedback.empty());
}

TEST_F(GradingProtocolTest, ComprehensionSubmission_FullMarks) {
    const auto result = grade(
        "def even_squares(nums): return [n*n for n in nums if n%2==0]\n",
        "def grade(ns):\n"
        "    ok = ns['even_squares']([1, 2, 3, 4]) == [4, 16]\n"
        "    return {'score': 100 if ok else 0}\n");
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->score, 100);
    EXPECT_EQ(result->max_score, 100);
}

// ---------------------------------------------------------------------------
// 검증 단계 실패: 러너 미실행
// ---------------------------------------------------------------------------
TEST_F(GradingProtocolTest, SyntaxError_NoLaunch) {
    const auto result = grade("def broken(:\n    pass\n", grader_returning("{'score': 100}"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kSyntaxInvalid);
    EXPECT_EQ(result.error().stage, GradeState::kValidating);
    EXPECT_EQ(result.error().line, 1);
    EXPECT_FALSE(trace_.sandbox_launched);
    EXPECT_EQ(trace_.states, (std::vector<GradeState>{GradeState::kValidating, GradeState::kFailed}));
}

TEST_F(GradingProtocolTest, DisallowedNode_NoLaunch) {
    const auto result = grade("def f():\n    global g\n", grader_returning("{'score': 100}"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kPolicyViolation);
    EXPECT_EQ(result.error().detail, "Global");
    EXPECT_FALSE(trace_.sandbox_launched);
}

TEST_F(GradingProtocolTest, DisallowedImport_NoLaunch) {
    const auto result = grade("import os\n", grader_returning("{'score': 100}"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kPolicyViolation);
    EXPECT_EQ(result.error().detail, "os");
    EXPECT_FALSE(trace_.sandbox_launched);
}

TEST_F(GradingProtocolTest, DisallowedImportWithUse_RejectedBeforeExecution) {
    const auto result = grade("import os\ndef f(): return os.listdir('.')\n",
                              grader_returning("{'score': 100}"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kPolicyViolation);
    EXPECT_EQ(result.error().stage, GradeState::kValidating);
    EXPECT_EQ(result.error().detail, "os");
    EXPECT_FALSE(trace_.sandbox_launched);
    EXPECT_EQ(trace_.states, (std::vector<GradeState>{GradeState::kValidating, GradeState::kFailed}));
}

// ---------------------------------------------------------------------------
// 실행 단계 실패
// ---------------------------------------------------------------------------
TEST_F(GradingProtocolTest, SubmissionRuntimeError) {
    const auto result = grade("print('start')\nitems = [1, 2]\nitems[5]\n",
                              grader_returning("{'score': 100}"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kExecutionError);
    EXPECT_EQ(result.error().stage, GradeState::kExecutingSubmission);
    EXPECT_EQ(result.error().exception_type, "IndexError");
    EXPECT_EQ(result.error().stdout_text, "start\n");
    EXPECT_FALSE(result.error().trace.empty());
    EXPECT_EQ(trace_.states, (std::vector<GradeState>{
        GradeState::kValidating, GradeState::kExecutingSubmission, GradeState::kFailed}));
}

TEST_F(GradingProtocolTest, GraderException_DuringInvoke) {
    const auto result = grade(kSubmission,
                              "def grade(ns):\n    raise RuntimeError('grader bug')\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kExecutionError);
    EXPECT_EQ(result.error().stage, GradeState::kInvoking);
    EXPECT_EQ(result.error().detail, "RuntimeError: grader bug");
    ASSERT_GE(trace_.states.size(), 2u);
    EXPECT_EQ(trace_.states[trace_.states.size() - 2], GradeState::kInvoking);
    EXPECT_EQ(trace_.states.back(), GradeState::kFailed);
}

TEST_F(GradingProtocolTest, SubmissionTimeout) {
    policy_.sandbox.submission_timeout_ms = 300;
    const auto result = grade("while True:\n    pass\n", grader_returning("{'score': 100}"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kTimeoutExceeded);
    EXPECT_EQ(result.error().stage, GradeState::kExecutingSubmission);
    EXPECT_EQ(result.error().detail, "submission execution exceeded 300 ms");

    // 프로세스 그룹 종료 후 회수까지 끝나 있다
    EXPECT_TRUE(trace_.sandbox_launched);
    EXPECT_EQ(::kill(trace_.runner_pid, 0), -1);
    EXPECT_EQ(errno, ESRCH);
}

TEST_F(GradingProtocolTest, GraderTimeout) {
    policy_.sandbox.grader_timeout_ms = 300;
    const auto result = grade(kSubmission,
                              "def grade(ns):\n    while True:\n        pass\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kTimeoutExceeded);
    EXPECT_EQ(result.error().stage, GradeState::kExecutingGrader);
    EXPECT_EQ(result.error().detail, "grader execution exceeded 300 ms");
}

// ---------------------------------------------------------------------------
// 계약 위반 / 런타임 정책 위반
// ---------------------------------------------------------------------------
TEST_F(GradingProtocolTest, MissingEntrypoint_IsContractViolation) {
    const auto result = grade(kSubmission, "def check(ns):\n    return {'score': 1}\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kContractViolation);
    EXPECT_EQ(result.error().detail, "Grader must define grade(user_ns) -> dict");
}

TEST_F(GradingProtocolTest, NonDictReturn_IsContractViolation) {
    const auto result = grade(kSubmission, grader_returning("100"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kContractViolation);
    EXPECT_EQ(result.error().detail, "grade() must return a dict, got int");
}

TEST_F(GradingProtocolTest, DynamicImportDuringInvoke_IsPolicyViolation) {
    const auto result = grade(
        "def where():\n    return __import__('os').getcwd()\n",
        "def grade(ns):\n    ns['where']()\n    return {'score': 100}\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kPolicyViolation);
    EXPECT_EQ(result.error().stage, GradeState::kInvoking);
    EXPECT_EQ(result.error().detail, "os");
}

TEST_F(GradingProtocolTest, BuiltinsModuleOpen_IsPolicyViolation) {
    const auto result = grade(
        "def host():\n    return len.__self__.open('/etc/hostname').read()\n",
        "def grade(ns):\n    return {'score': 100, 'feedback': ns['host']()}\n");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kPolicyViolation);
    EXPECT_EQ(result.error().stage, GradeState::kInvoking);
    EXPECT_EQ(result.error().detail, "open");
    EXPECT_EQ(result.error().exception_type, "PermissionError");
}

TEST_F(GradingProtocolTest, BuiltinsModuleImport_CannotRemoveHostFile) {
    const fs::path target = fs::temp_directory_path()
        / ("gradegate_keep_" + std::to_string(::getpid()) + ".txt");
    {
        std::ofstream out(target);
        out << "keep me\n";
    }
    ASSERT_TRUE(fs::exists(target));

    // 제출물이 except 로 삼켜도 위반 기록은 남는다
    const auto result = grade(
        "os = len.__self__.__import__('os')\n"
        "try:\n"
        "    os.unlink('" + target.string() + "')\n"
        "except Exception:\n"
        "    pass\n",
        grader_returning("{'score': 100}"));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().kind, FailureKind::kPolicyViolation);
    EXPECT_EQ(result.error().stage, GradeState::kExecutingSubmission);
    // os 가 이미 로드되어 있으면 호출 이벤트, 아니면 import 이벤트에서 막힌다
    EXPECT_TRUE(result.error().detail == "os.remove" || result.error().detail == "os")
        << result.error().detail;
    EXPECT_TRUE(fs::exists(target));

    std::error_code ec;
    fs::remove(target, ec);
}

TEST_F(GradingProtocolTest, GraderFileAccess_IsUnaffected) {
    policy_.probing.enabled = false;
    const auto result = grade(kSubmission,
        "import os\n"
        "def grade(ns):\n"
        "    return {'score': 100 if os.path.isdir(os.getcwd()) else 0}\n");
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->score, 100);
}

// ---------------------------------------------------------------------------
// 리팩터링: 같은 동작, 문서화만 추가된 두 제출물
// ---------------------------------------------------------------------------
TEST_F(GradingProtocolTest, DocumentedRefactor_GradedAndImproved) {
    policy_.probing.enabled = false;
    const std::string first  = "def add(a, b):\n    return a + b\n";
    const std::string second =
        "def add(a: int, b: int) -> int:\n"
        "    \"\"\"Return the sum of a and b.\"\"\"\n"
        "    return a + b\n";
    const std::string grader =
        "def grade(ns):\n"
        "    ok = ns['add'](2, 3) == 5 and ns['add'](-1, 1) == 0\n"
        "    return {'score': 100 if ok else 0}\n";

    const auto first_result = grade(first, grader);
    ASSERT_TRUE(first_result.has_value()) << first_result.error().detail;
    EXPECT_EQ(first_result->score, 100);
    const auto second_result = grade(second, grader);
    ASSERT_TRUE(second_result.has_value()) << second_result.error().detail;
    EXPECT_EQ(second_result->score, 100);

    const CodeMetrics    metrics;
    const MetricsSummary before = metrics.summarize(first);
    const MetricsSummary after  = metrics.summarize(second);
    EXPECT_FALSE(before.has_type_hints);
    EXPECT_FALSE(before.has_docstring);
    EXPECT_TRUE(after.has_type_hints);
    EXPECT_TRUE(after.has_docstring);

    const RefactorAssessment improved = CodeMetrics::assess_refactor(
        before, after, second_result->score == second_result->max_score);
    EXPECT_TRUE(improved.applicable);
    EXPECT_TRUE(improved.improved);

    const RefactorAssessment alone = CodeMetrics::assess_refactor(
        std::nullopt, before, first_result->score == first_result->max_score);
    EXPECT_FALSE(alone.applicable);
    EXPECT_FALSE(alone.improved);
}

// ---------------------------------------------------------------------------
// 정규화 / 보강
// ---------------------------------------------------------------------------
TEST_F(GradingProtocolTest, ScoreAboveMax_IsClamped) {
    policy_.probing.enabled = false;
    const auto result = grade(kSubmission, grader_returning("{'score': 150, 'max_score': 100}"));
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->score, 100);
    EXPECT_EQ(result->max_score, 100);
}

TEST_F(GradingProtocolTest, NumericStrings_AreConverted) {
    policy_.probing.enabled = false;
    const auto result = grade(kSubmission,
                              grader_returning("{'score': '7', 'max_score': 10.9, 'feedback': None}"));
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->score, 7);
    EXPECT_EQ(result->max_score, 10);
    EXPECT_EQ(result->feedback, "None");
}

TEST_F(GradingProtocolTest, PartialScore_EnrichesExpected) {
    const auto result = grade(kSubmission,
        "def grade(ns):\n"
        "    if 'double' not in ns:\n"
        "        return {'score': 0}\n"
        "    expected = [2, 4, 7]\n"
        "    if ns['double']([1, 2, 3]) != expected:\n"
        "        return {'score': 50, 'feedback': 'mismatch'}\n"
        "    return {'score': 100}\n");
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->score, 50);
    ASSERT_TRUE(result->diagnostics.has_value());
    ASSERT_TRUE(result->diagnostics->expected.has_value());
    EXPECT_EQ(result->diagnostics->expected->subject, "double");
    EXPECT_EQ(result->diagnostics->expected->literals, std::vector<std::string>{"[2, 4, 7]"});
}

TEST_F(GradingProtocolTest, ProbePhaseExpiry_KeepsResult) {
    policy_.sandbox.probe_timeout_ms      = 300;
    policy_.sandbox.probe_call_timeout_ms = 2000;
    const auto result = grade("def spin(*args):\n    while True:\n        pass\n",
                              grader_returning("{'score': 100}"));
    ASSERT_TRUE(result.has_value()) << result.error().detail;
    EXPECT_EQ(result->score, 100);
    ASSERT_TRUE(result->diagnostics.has_value());
    EXPECT_FALSE(result->diagnostics->probes_complete);
    EXPECT_EQ(trace_.states, kSuccessPath);
}

// ---------------------------------------------------------------------------
// normalize
// ---------------------------------------------------------------------------
TEST(GradeNormalize, ClampsIntoRange) {
    EXPECT_EQ(GradingProtocol::normalize(RawGrade{150, 100, "", "", ""}).score, 100);
    EXPECT_EQ(GradingProtocol::normalize(RawGrade{-5, 100, "", "", ""}).score, 0);
    EXPECT_EQ(GradingProtocol::normalize(RawGrade{42, 100, "", "", ""}).score, 42);
}

TEST(GradeNormalize, NegativeMaxScoreFloorsAtZero) {
    const GradeResult r = GradingProtocol::normalize(RawGrade{10, -10, "fb", "out", "err"});
    EXPECT_EQ(r.max_score, 0);
    EXPECT_EQ(r.score, 0);
    EXPECT_EQ(r.feedback, "fb");
    EXPECT_EQ(r.stdout_text, "out");
    EXPECT_EQ(r.stderr_text, "err");
}

TEST(GradeNormalize, SaturatedValues) {
    constexpr auto kMax = std::numeric_limits<std::int64_t>::max();
    constexpr auto kMin = std::numeric_limits<std::int64_t>::min();
    EXPECT_EQ(GradingProtocol::normalize(RawGrade{kMax, kMax, "", "", ""}).score, kMax);
    EXPECT_EQ(GradingProtocol::normalize(RawGrade{kMin, 100, "", "", ""}).score, 0);
    EXPECT_FALSE(GradingProtocol::normalize(RawGrade{}).diagnostics.has_value());
}
