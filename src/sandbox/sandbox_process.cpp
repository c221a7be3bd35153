#include "sandbox/sandbox_process.hpp"
#include "protocol/frame.hpp"

#include <array>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <mutex>
#include <string_view>
#include <utility>

#include <fcntl.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/posix/stream_descriptor.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

namespace asio = boost::asio;

namespace {

using stream_descriptor = asio::posix::stream_descriptor;
using Budgets           = std::array<std::chrono::milliseconds, 3>;

constexpr std::size_t kLogTailLimit = 4096;
constexpr int         kChildSetupFailed = 126;
constexpr int         kChildExecFailed  = 127;

// ---------------------------------------------------------------------------
// UniqueFd
//   파일 디스크립터 하나를 소유한다.
// ---------------------------------------------------------------------------
class UniqueFd {
public:
    UniqueFd() noexcept = default;
    explicit UniqueFd(int fd) noexcept : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(const UniqueFd&)            = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.release();
        }
        return *this;
    }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] int release() noexcept {
        const int fd = fd_;
        fd_          = -1;
        return fd;
    }
    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct PipePair {
    UniqueFd read_end{};
    UniqueFd write_end{};
};

[[nodiscard]] std::expected<PipePair, std::string> make_pipe() {
    int fds[2]{-1, -1};
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return std::unexpected(std::string{"pipe2 failed: "} + std::strerror(errno));
    }
    return PipePair{UniqueFd{fds[0]}, UniqueFd{fds[1]}};
}

// ---------------------------------------------------------------------------
// ChildPlan
//   fork 후 자식이 사용할 모든 값. fork 전에 완성한다
//   (자식에서는 메모리 할당을 하지 않는다).
// ---------------------------------------------------------------------------
struct ChildPlan {
    std::string              runner_path{};
    std::string              work_dir{};
    std::vector<std::string> env_storage{};
    std::vector<char*>       argv{};
    std::vector<char*>       envp{};
    rlim_t                   address_space{0};
    rlim_t                   cpu_seconds{0};
    rlim_t                   max_processes{0};
    int                      max_fd{1024};
};

[[nodiscard]] ChildPlan make_plan(const SandboxLimits& limits) {
    ChildPlan plan{};
    plan.runner_path = limits.runner_path;
    plan.work_dir    = limits.work_dir;
    plan.env_storage = {
        "PATH=/usr/local/bin:/usr/bin:/bin",
        "LANG=C.UTF-8",
        "PYTHONDONTWRITEBYTECODE=1",
        "PYTHONNOUSERSITE=1",
        "OPENBLAS_NUM_THREADS=1",
        "OMP_NUM_THREADS=1",
    };
    plan.argv.push_back(plan.runner_path.data());
    plan.argv.push_back(nullptr);
    for (auto& entry : plan.env_storage) {
        plan.envp.push_back(entry.data());
    }
    plan.envp.push_back(nullptr);

    plan.address_space = static_cast<rlim_t>(limits.memory_limit_mb) * 1024u * 1024u;
    const std::uint64_t total_ms = static_cast<std::uint64_t>(limits.submission_timeout_ms)
                                 + limits.grader_timeout_ms + limits.probe_timeout_ms;
    plan.cpu_seconds   = static_cast<rlim_t>((total_ms + 999u) / 1000u + 1u);
    plan.max_processes = static_cast<rlim_t>(limits.max_processes);

    const long open_max = ::sysconf(_SC_OPEN_MAX);
    plan.max_fd = open_max > 0 && open_max < 65536 ? static_cast<int>(open_max) : 65536;
    return plan;
}

void set_limit(int resource, rlim_t value) noexcept {
    rlimit rl{};
    rl.rlim_cur = value;
    rl.rlim_max = value;
    if (::setrlimit(resource, &rl) != 0) {
        ::_exit(kChildSetupFailed);
    }
}

void close_from(int first, int max_fd) noexcept {
#ifdef SYS_close_range
    if (::syscall(SYS_close_range, static_cast<unsigned>(first), ~0U, 0U) == 0) {
        return;
    }
#endif
    for (int fd = first; fd < max_fd; ++fd) {
        ::close(fd);
    }
}

// exec_child
//   fork 직후 자식에서만 호출된다. async-signal-safe 호출만 사용한다.
[[noreturn]] void exec_child(const ChildPlan& plan, int stdin_fd, int log_fd,
                             int event_fd, pid_t parent) noexcept {
    ::setpgid(0, 0);
    if (::prctl(PR_SET_PDEATHSIG, SIGKILL) != 0 || ::getppid() != parent) {
        ::_exit(kChildSetupFailed);
    }

    sigset_t none;
    sigemptyset(&none);
    ::sigprocmask(SIG_SETMASK, &none, nullptr);

    // 0..3 으로 옮기기 전에 원본을 10 이상으로 올려 서로 덮어쓰지 않게 한다.
    const int in  = ::fcntl(stdin_fd, F_DUPFD, 10);
    const int log = ::fcntl(log_fd, F_DUPFD, 10);
    const int evt = ::fcntl(event_fd, F_DUPFD, 10);
    if (in < 0 || log < 0 || evt < 0
        || ::dup2(in, STDIN_FILENO) < 0
        || ::dup2(log, STDOUT_FILENO) < 0
        || ::dup2(log, STDERR_FILENO) < 0
        || ::dup2(evt, 3) < 0) {
        ::_exit(kChildSetupFailed);
    }
    close_from(4, plan.max_fd);

    set_limit(RLIMIT_AS, plan.address_space);
    set_limit(RLIMIT_CPU, plan.cpu_seconds);
    set_limit(RLIMIT_FSIZE, 0);
    set_limit(RLIMIT_CORE, 0);
    if (plan.max_processes > 0) {
        set_limit(RLIMIT_NPROC, plan.max_processes);
    }

    if (::prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0) != 0 || ::chdir(plan.work_dir.c_str()) != 0) {
        ::_exit(kChildSetupFailed);
    }

    ::execve(plan.runner_path.c_str(), plan.argv.data(), plan.envp.data());
    ::_exit(kChildExecFailed);
}

// ---------------------------------------------------------------------------
// ChildReaper
//   소멸 시 프로세스 그룹을 SIGKILL 하고 waitpid 로 회수한다.
//   reap() 을 먼저 호출하면 그 결과(status)를 돌려받는다.
// ---------------------------------------------------------------------------
class ChildReaper {
public:
    explicit ChildReaper(pid_t pid) noexcept : pid_(pid) {}
    ~ChildReaper() { (void)reap(); }

    ChildReaper(const ChildReaper&)            = delete;
    ChildReaper& operator=(const ChildReaper&) = delete;

    int reap() noexcept {
        if (reaped_) {
            return status_;
        }
        ::kill(-pid_, SIGKILL);
        while (::waitpid(pid_, &status_, 0) < 0) {
            if (errno != EINTR) {
                spdlog::error("[sandbox] waitpid({}) failed: {}", pid_, std::strerror(errno));
                break;
            }
        }
        reaped_ = true;
        return status_;
    }

private:
    pid_t pid_;
    int   status_{0};
    bool  reaped_{false};
};

// ---------------------------------------------------------------------------
// RunState
//   한 실행의 코루틴들이 공유하는 상태. 지역 io_context 하나에서만
//   접근되므로 동기화가 필요 없다.
// ---------------------------------------------------------------------------
struct RunState {
    pid_t                       pid{-1};
    SandboxPhase                phase{SandboxPhase::kSubmission};
    bool                        verdict{false};
    bool                        diagnostics{false};
    bool                        finished{false};
    std::optional<SandboxPhase> expired{};
    std::vector<RunnerEvent>    events{};
    std::string                 protocol_error{};
    std::string                 log_tail{};
};

void rearm(asio::steady_timer& timer, RunState& st, SandboxPhase next, const Budgets& budgets) {
    st.phase = next;
    timer.expires_after(budgets[static_cast<std::size_t>(next)]);
}

// accept_event
//   순서 규칙 검사 + 단계 전환. 위반 시 오류 문자열.
[[nodiscard]] std::string accept_event(RunState& st, RunnerEvent event,
                                       asio::steady_timer& timer, const Budgets& budgets) {
    switch (event.type) {
        case RunnerEventType::kSubmissionDone:
            if (st.phase != SandboxPhase::kSubmission || st.verdict) {
                return "unexpected submission_done event";
            }
            rearm(timer, st, SandboxPhase::kGrader, budgets);
            break;
        case RunnerEventType::kFailure:
            if (st.verdict) {
                return "unexpected failure event";
            }
            st.verdict = true;
            break;
        case RunnerEventType::kResult:
            if (st.phase != SandboxPhase::kGrader || st.verdict || !event.grade) {
                return "unexpected result event";
            }
            st.verdict = true;
            rearm(timer, st, SandboxPhase::kProbe, budgets);
            break;
        case RunnerEventType::kDiagnostics:
            if (st.phase != SandboxPhase::kProbe || st.diagnostics) {
                return "unexpected diagnostics event";
            }
            st.diagnostics = true;
            break;
    }
    st.events.push_back(std::move(event));
    return {};
}

asio::awaitable<void> write_request(stream_descriptor& pipe, const std::string& frame, pid_t pid) {
    boost::system::error_code ec;
    co_await asio::async_write(pipe, asio::buffer(frame),
                               asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        spdlog::warn("[sandbox] pid={} request write failed: {}", pid, ec.message());
    }
    boost::system::error_code close_ec;
    pipe.close(close_ec);
}

asio::awaitable<void> read_events(stream_descriptor& pipe, asio::steady_timer& timer,
                                  RunState& st, const Budgets& budgets) {
    for (;;) {
        std::array<std::uint8_t, 4> hdr{};
        boost::system::error_code ec;
        const std::size_t hdr_n = co_await asio::async_read(
            pipe, asio::buffer(hdr), asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if ((ec != asio::error::eof || hdr_n != 0) && !st.expired) {
                st.protocol_error = "truncated event frame header: " + ec.message();
            }
            break;
        }

        const std::uint32_t len = decode_le4(hdr);
        if (len == 0 || len > kMaxRunnerFrameSize) {
            st.protocol_error = fmt::format("invalid event frame length {}", len);
            break;
        }

        std::string body(len, '\0');
        co_await asio::async_read(pipe, asio::buffer(body),
                                  asio::redirect_error(asio::use_awaitable, ec));
        if (ec) {
            if (!st.expired) {
                st.protocol_error = "truncated event frame body: " + ec.message();
            }
            break;
        }

        auto event = decode_event(body);
        if (!event) {
            st.protocol_error = event.error();
            break;
        }
        if (auto err = accept_event(st, std::move(*event), timer, budgets); !err.empty()) {
            st.protocol_error = std::move(err);
            break;
        }
    }

    // 스트림이 끝나면 러너는 더 보낼 것이 없다. 그룹을 정리해 로그 파이프도 닫히게 한다.
    st.finished = true;
    ::kill(-st.pid, SIGKILL);
    timer.cancel();
}

void forward_log_line(pid_t pid, std::string_view line) {
    if (line.empty()) {
        return;
    }
    if (line.find("[error]") != std::string_view::npos
        || line.find("[critical]") != std::string_view::npos) {
        spdlog::error("[sandbox] pid={} {}", pid, line);
    } else if (line.find("[warning]") != std::string_view::npos) {
        spdlog::warn("[sandbox] pid={} {}", pid, line);
    } else {
        spdlog::debug("[sandbox] pid={} {}", pid, line);
    }
}

asio::awaitable<void> drain_log(stream_descriptor& pipe, RunState& st) {
    std::array<char, 4096> buf{};
    std::string partial;
    for (;;) {
        boost::system::error_code ec;
        const std::size_t n = co_await pipe.async_read_some(
            asio::buffer(buf), asio::redirect_error(asio::use_awaitable, ec));
        if (n > 0) {
            partial.append(buf.data(), n);
            st.log_tail.append(buf.data(), n);
            if (st.log_tail.size() > kLogTailLimit) {
                st.log_tail.erase(0, st.log_tail.size() - kLogTailLimit);
            }
            std::size_t pos = 0;
            while ((pos = partial.find('\n')) != std::string::npos) {
                forward_log_line(st.pid, std::string_view{partial}.substr(0, pos));
                partial.erase(0, pos + 1);
            }
        }
        if (ec) {
            break;
        }
    }
    forward_log_line(st.pid, partial);
}

asio::awaitable<void> watchdog(asio::steady_timer& timer, RunState& st) {
    for (;;) {
        if (st.finished) {
            co_return;
        }
        boost::system::error_code ec;
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        if (st.finished) {
            co_return;
        }
        // 단계 전환으로 다시 걸린 경우
        if (ec == asio::error::operation_aborted
            || timer.expiry() > asio::steady_timer::clock_type::now()) {
            continue;
        }
        st.expired = st.phase;
        spdlog::warn("[sandbox] pid={} {} phase deadline exceeded, killing process group",
                     st.pid, to_string(st.phase));
        ::kill(-st.pid, SIGKILL);
        co_return;
    }
}

[[nodiscard]] GradeFailure infra_failure(std::string detail) {
    GradeFailure f{};
    f.kind   = FailureKind::kInternalError;
    f.stage  = GradeState::kExecutingSubmission;
    f.detail = std::move(detail);
    return f;
}

} // namespace

std::string_view to_string(SandboxPhase phase) noexcept {
    switch (phase) {
        case SandboxPhase::kSubmission: return "submission";
        case SandboxPhase::kGrader:     return "grader";
        case SandboxPhase::kProbe:      return "probe";
    }
    return "submission";
}

std::chrono::milliseconds SandboxProcess::budget(SandboxPhase phase) const noexcept {
    switch (phase) {
        case SandboxPhase::kSubmission: return std::chrono::milliseconds{limits_.submission_timeout_ms};
        case SandboxPhase::kGrader:     return std::chrono::milliseconds{limits_.grader_timeout_ms};
        case SandboxPhase::kProbe:      return std::chrono::milliseconds{limits_.probe_timeout_ms};
    }
    return std::chrono::milliseconds{limits_.submission_timeout_ms};
}

std::expected<SandboxTranscript, GradeFailure>
SandboxProcess::run(const RunnerRequest& request) const {
    // 러너가 먼저 죽은 파이프에 쓰면 EPIPE 로 받는다 (프로세스 종료 대신).
    static std::once_flag sigpipe_once;
    std::call_once(sigpipe_once, [] { ::signal(SIGPIPE, SIG_IGN); });

    const std::string body = encode_request(request);
    if (body.size() > kMaxRunnerFrameSize) {
        return std::unexpected(infra_failure("sandbox: request exceeds frame size limit"));
    }
    const std::string frame = encode_frame(body);

    auto in_pipe  = make_pipe();
    auto evt_pipe = make_pipe();
    auto log_pipe = make_pipe();
    if (!in_pipe || !evt_pipe || !log_pipe) {
        return std::unexpected(infra_failure(
            "sandbox: " + (!in_pipe ? in_pipe.error() : !evt_pipe ? evt_pipe.error() : log_pipe.error())));
    }

    const ChildPlan plan   = make_plan(limits_);
    const pid_t     parent = ::getpid();
    const auto      start  = std::chrono::steady_clock::now();

    const pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(infra_failure(std::string{"sandbox: fork failed: "} + std::strerror(errno)));
    }
    if (pid == 0) {
        exec_child(plan, in_pipe->read_end.get(), log_pipe->write_end.get(),
                   evt_pipe->write_end.get(), parent);
    }

    // 부모: 자식 쪽 끝을 닫아야 EOF 를 관찰할 수 있다.
    ::setpgid(pid, pid);
    in_pipe->read_end.reset();
    evt_pipe->write_end.reset();
    log_pipe->write_end.reset();

    ChildReaper reaper{pid};
    spdlog::debug("[sandbox] runner started pid={} path={}", pid, limits_.runner_path);

    const Budgets budgets{budget(SandboxPhase::kSubmission), budget(SandboxPhase::kGrader),
                          budget(SandboxPhase::kProbe)};
    RunState st{};
    st.pid = pid;

    try {
        asio::io_context   ioc{1};
        stream_descriptor  in_sd{ioc, in_pipe->write_end.release()};
        stream_descriptor  evt_sd{ioc, evt_pipe->read_end.release()};
        stream_descriptor  log_sd{ioc, log_pipe->read_end.release()};
        asio::steady_timer timer{ioc};
        timer.expires_after(budgets[0]);

        asio::co_spawn(ioc, write_request(in_sd, frame, pid), asio::detached);
        asio::co_spawn(ioc, read_events(evt_sd, timer, st, budgets), asio::detached);
        asio::co_spawn(ioc, drain_log(log_sd, st), asio::detached);
        asio::co_spawn(ioc, watchdog(timer, st), asio::detached);
        ioc.run();
    } catch (const boost::system::system_error& e) {
        spdlog::error("[sandbox] pid={} I/O setup failed: {}", pid, e.what());
        return std::unexpected(infra_failure(std::string{"sandbox: "} + e.what()));
    }

    const int status = reaper.reap();

    SandboxTranscript transcript{};
    transcript.pid            = pid;
    transcript.events         = std::move(st.events);
    transcript.expired_phase  = st.expired;
    transcript.protocol_error = std::move(st.protocol_error);
    transcript.log_tail       = std::move(st.log_tail);
    transcript.elapsed        = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    if (WIFEXITED(status)) {
        transcript.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        transcript.term_signal = WTERMSIG(status);
    }

    spdlog::debug("[sandbox] runner pid={} done: events={} exit={} signal={} elapsed={}ms",
                  pid, transcript.events.size(), transcript.exit_code,
                  transcript.term_signal, transcript.elapsed.count());
    return transcript;
}
