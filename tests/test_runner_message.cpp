// ---------------------------------------------------------------------------
// test_runner_message.cpp
//
// 프레임 코덱 + 호스트 ↔ 러너 메시지 직렬화 단위 테스트.
//
// [테스트 범위]
// - encode_le4 / decode_le4 바이트 순서
// - read_frame / write_frame (pipe): 정상, EOF, 잘린 헤더/바디, 길이 0/초과
// - 요청 프레임: 정책 + 소스 (제어 문자, 따옴표, 개행 포함) 복원
// - 이벤트 프레임: submission_done / failure / result / diagnostics
// - 신뢰하지 않는 입력: 알 수 없는 이벤트, 알 수 없는 실패 종류,
//   score 누락, 맵이 아닌 문서
// ---------------------------------------------------------------------------

#include "protocol/frame.hpp"
#include "protocol/runner_message.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include <unistd.h>

namespace {

// pipe 양 끝 (소멸 시 닫음)
class Pipe {
public:
    Pipe() {
        int fds[2] = {-1, -1};
        if (::pipe(fds) == 0) {
            read_fd_  = fds[0];
            write_fd_ = fds[1];
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&)            = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int read_fd() const noexcept { return read_fd_; }
    [[nodiscard]] int write_fd() const noexcept { return write_fd_; }

    void write_raw(const std::string& bytes) const {
        ASSERT_EQ(::write(write_fd_, bytes.data(), bytes.size()),
                  static_cast<ssize_t>(bytes.size()));
    }

    void close_write() {
        if (write_fd_ >= 0) {
            ::close(write_fd_);
            write_fd_ = -1;
        }
    }

private:
    void close_read() {
        if (read_fd_ >= 0) {
            ::close(read_fd_);
            read_fd_ = -1;
        }
    }

    int read_fd_{-1};
    int write_fd_{-1};
};

std::string header(std::uint32_t len) {
    const auto hdr = encode_le4(len);
    return std::string(reinterpret_cast<const char*>(hdr.data()), hdr.size());
}

RunnerEvent round_trip(const RunnerEvent& event) {
    auto decoded = decode_event(encode_event(event));
    EXPECT_TRUE(decoded.has_value()) << decoded.error();
    return decoded.value_or(RunnerEvent{});
}

} // namespace

// ---------------------------------------------------------------------------
// 프레임
// ---------------------------------------------------------------------------
TEST(Frame, Le4_ByteOrder) {
    const auto bytes = encode_le4(0x12345678u);
    EXPECT_EQ(bytes[0], 0x78);
    EXPECT_EQ(bytes[1], 0x56);
    EXPECT_EQ(bytes[2], 0x34);
    EXPECT_EQ(bytes[3], 0x12);
    EXPECT_EQ(decode_le4(bytes), 0x12345678u);
}

TEST(Frame, EncodeFrame_PrefixesLength) {
    const std::string frame = encode_frame("abc");
    ASSERT_EQ(frame.size(), 7u);
    EXPECT_EQ(frame.substr(0, 4), header(3));
    EXPECT_EQ(frame.substr(4), "abc");
}

TEST(Frame, WriteThenRead_ThenEof) {
    Pipe pipe;
    ASSERT_GE(pipe.read_fd(), 0);
    ASSERT_TRUE(write_frame(pipe.write_fd(), "first").has_value());
    ASSERT_TRUE(write_frame(pipe.write_fd(), "second").has_value());
    pipe.close_write();

    const auto first = read_frame(pipe.read_fd(), 1024);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(*first, "first");

    const auto second = read_frame(pipe.read_fd(), 1024);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*second, "second");

    const auto eof = read_frame(pipe.read_fd(), 1024);
    ASSERT_FALSE(eof.has_value());
    EXPECT_EQ(eof.error(), FrameError::kEof);
}

TEST(Frame, TruncatedHeader) {
    Pipe pipe;
    pipe.write_raw(std::string{"\x05\x00", 2});
    pipe.close_write();
    const auto frame = read_frame(pipe.read_fd(), 1024);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), FrameError::kTruncated);
}

TEST(Frame, TruncatedBody) {
    Pipe pipe;
    pipe.write_raw(header(10) + "abc");
    pipe.close_write();
    const auto frame = read_frame(pipe.read_fd(), 1024);
    ASSERT_FALSE(frame.has_value());
    EXPECT_EQ(frame.error(), FrameError::kTruncated);
}

TEST(Frame, OversizedAndZeroLength_AreRejected) {
    {
        Pipe pipe;
        pipe.write_raw(header(2048));
        const auto frame = read_frame(pipe.read_fd(), 1024);
        ASSERT_FALSE(frame.has_value());
        EXPECT_EQ(frame.error(), FrameError::kTooLarge);
    }
    {
        Pipe pipe;
        pipe.write_raw(header(0));
        const auto frame = read_frame(pipe.read_fd(), 1024);
        ASSERT_FALSE(frame.has_value());
        EXPECT_EQ(frame.error(), FrameError::kTooLarge);
    }
}

TEST(Frame, WriteEmptyBody_IsRejected) {
    Pipe pipe;
    const auto written = write_frame(pipe.write_fd(), "");
    ASSERT_FALSE(written.has_value());
    EXPECT_EQ(written.error(), FrameError::kTooLarge);
}

// ---------------------------------------------------------------------------
// 요청
// ---------------------------------------------------------------------------
TEST(RunnerMessage, Request_PreservesPolicyAndSources) {
    RunnerRequest request{};
    request.policy.namespaces.entrypoint      = "evaluate";
    request.policy.sandbox.output_limit_kb    = 64;
    request.policy.probing.enabled            = false;
    request.policy.validator.allowed_imports.erase("numpy");
    request.submission = "def f():\n\treturn \"quoted\" + 'x'  # : [ ] {\n";
    request.grader     = std::string{"s = '\x01'\n"} + "print('é')\n";

    const auto decoded = decode_request(encode_request(request));
    ASSERT_TRUE(decoded.has_value()) << decoded.error();
    EXPECT_EQ(decoded->submission, request.submission);
    EXPECT_EQ(decoded->grader, request.grader);
    EXPECT_EQ(decoded->policy.namespaces.entrypoint, "evaluate");
    EXPECT_EQ(decoded->policy.sandbox.output_limit_kb, 64u);
    EXPECT_FALSE(decoded->policy.probing.enabled);
    EXPECT_EQ(decoded->policy.validator.allowed_imports.count("numpy"), 0u);
}

TEST(RunnerMessage, Request_EmptySourcesSurvive) {
    const auto decoded = decode_request(encode_request(RunnerRequest{}));
    ASSERT_TRUE(decoded.has_value()) << decoded.error();
    EXPECT_TRUE(decoded->submission.empty());
    EXPECT_TRUE(decoded->grader.empty());
}

TEST(RunnerMessage, Request_Malformed) {
    EXPECT_FALSE(decode_request("[1, 2").has_value());
    EXPECT_FALSE(decode_request("- a\n- b\n").has_value());
}

// ---------------------------------------------------------------------------
// 이벤트
// ---------------------------------------------------------------------------
TEST(RunnerMessage, SubmissionDoneEvent) {
    RunnerEvent event{};
    event.type = RunnerEventType::kSubmissionDone;
    EXPECT_EQ(round_trip(event).type, RunnerEventType::kSubmissionDone);
}

TEST(RunnerMessage, FailureEvent_AllFields) {
    GradeFailure failure{};
    failure.kind           = FailureKind::kExecutionError;
    failure.stage          = GradeState::kExecutingSubmission;
    failure.detail         = "ZeroDivisionError: division by zero";
    failure.exception_type = "ZeroDivisionError";
    failure.message        = "division by zero";
    failure.trace          = {"  File \"<submission>\", line 2, in <module>", "    1 / 0"};
    failure.stdout_text    = "before\n";
    failure.stderr_text    = "warn: x\n";
    failure.line           = 2;
    failure.column         = 5;

    RunnerEvent event{};
    event.type    = RunnerEventType::kFailure;
    event.failure = failure;

    const auto decoded = round_trip(event);
    ASSERT_EQ(decoded.type, RunnerEventType::kFailure);
    ASSERT_TRUE(decoded.failure.has_value());
    EXPECT_EQ(decoded.failure->kind, FailureKind::kExecutionError);
    EXPECT_EQ(decoded.failure->stage, GradeState::kExecutingSubmission);
    EXPECT_EQ(decoded.failure->detail, failure.detail);
    EXPECT_EQ(decoded.failure->exception_type, "ZeroDivisionError");
    EXPECT_EQ(decoded.failure->trace, failure.trace);
    EXPECT_EQ(decoded.failure->stdout_text, "before\n");
    EXPECT_EQ(decoded.failure->stderr_text, "warn: x\n");
    EXPECT_EQ(decoded.failure->line, 2);
    EXPECT_EQ(decoded.failure->column, 5);
}

TEST(RunnerMessage, ResultEvent_KeepsUnclampedScore) {
    RunnerEvent event{};
    event.type  = RunnerEventType::kResult;
    event.grade = RawGrade{250, 100, "great: {ok}", "out\n", ""};

    const auto decoded = round_trip(event);
    ASSERT_EQ(decoded.type, RunnerEventType::kResult);
    ASSERT_TRUE(decoded.grade.has_value());
    EXPECT_EQ(decoded.grade->score, 250);
    EXPECT_EQ(decoded.grade->max_score, 100);
    EXPECT_EQ(decoded.grade->feedback, "great: {ok}");
    EXPECT_EQ(decoded.grade->stdout_text, "out\n");
}

TEST(RunnerMessage, DiagnosticsEvent) {
    Diagnostics diag{};
    diag.probes.push_back(ProbeResult{"double", "[1, 2, 3]", "[2, 4, 6]", "list", 1, true, ""});
    diag.probes.push_back(ProbeResult{"broken", "", "", "", 3, false, "TypeError: nope"});
    diag.classes.push_back(ClassInfo{"Stack", {"pop", "push"}});
    diag.variables.push_back(VariableInfo{"LIMIT", "int", "10"});

    RunnerEvent event{};
    event.type        = RunnerEventType::kDiagnostics;
    event.diagnostics = diag;

    const auto decoded = round_trip(event);
    ASSERT_EQ(decoded.type, RunnerEventType::kDiagnostics);
    ASSERT_TRUE(decoded.diagnostics.has_value());
    ASSERT_EQ(decoded.diagnostics->probes.size(), 2u);
    EXPECT_EQ(decoded.diagnostics->probes[0].return_value, "[2, 4, 6]");
    EXPECT_TRUE(decoded.diagnostics->probes[0].succeeded);
    EXPECT_EQ(decoded.diagnostics->probes[1].attempts, 3);
    EXPECT_FALSE(decoded.diagnostics->probes[1].succeeded);
    EXPECT_EQ(decoded.diagnostics->probes[1].last_error, "TypeError: nope");
    ASSERT_EQ(decoded.diagnostics->classes.size(), 1u);
    EXPECT_EQ(decoded.diagnostics->classes[0].methods, (std::vector<std::string>{"pop", "push"}));
    ASSERT_EQ(decoded.diagnostics->variables.size(), 1u);
    EXPECT_EQ(decoded.diagnostics->variables[0].value, "10");
}

TEST(RunnerMessage, UntrustedEvents_AreRejected) {
    EXPECT_FALSE(decode_event("event: launch_missiles\n").has_value());
    EXPECT_FALSE(decode_event("event: failure\nfailure:\n  kind: meltdown\n").has_value());
    EXPECT_FALSE(decode_event("event: failure\n").has_value());
    EXPECT_FALSE(decode_event("event: result\nmax_score: 10\n").has_value());
    EXPECT_FALSE(decode_event("event: result\nscore: lots\nmax_score: 10\n").has_value());
    EXPECT_FALSE(decode_event("just a scalar").has_value());
}
