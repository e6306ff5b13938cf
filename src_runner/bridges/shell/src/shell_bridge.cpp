#include "ea_gherkin/shell_bridge.hpp"
#include "ea_gherkin/errors.hpp"
#include "ea_gherkin/interpreter_locator.hpp"
#include "ea_gherkin/logging.hpp"
#include "ea_gherkin/text.hpp"

#include <array>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ea::gherkin::shell_bridge {

namespace {

constexpr int kTimeoutExitCode = 124;
constexpr int kSignalExitBase = 128;

std::string errno_text(int error) {
    return std::strerror(error);
}

/// Owns one file descriptor.
class Fd {
public:
    Fd() = default;
    explicit Fd(int fd) : fd_(fd) {}
    Fd(const Fd&) = delete;
    Fd& operator=(const Fd&) = delete;
    Fd(Fd&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}
    Fd& operator=(Fd&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }
    ~Fd() { reset(); }

    [[nodiscard]] int get() const noexcept { return fd_; }
    [[nodiscard]] bool valid() const noexcept { return fd_ >= 0; }

    void reset() noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

private:
    int fd_{-1};
};

struct Pipe {
    Fd read;
    Fd write;
};

Pipe make_pipe() {
    std::array<int, 2> fds{};
    if (::pipe2(fds.data(), O_CLOEXEC) != 0) {
        throw LaunchError("Unable to create pipe: " + errno_text(errno));
    }
    return Pipe{Fd{fds[0]}, Fd{fds[1]}};
}

bool is_step_variable(std::string_view entry) {
    const std::string_view capture_prefix{kCaptureVariablePrefix};
    const std::string previous = std::string{kPreviousOutputVariable} + "=";
    return entry.substr(0, capture_prefix.size()) == capture_prefix ||
           entry.substr(0, previous.size()) == previous;
}

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return kSignalExitBase + WTERMSIG(status);
    }
    return -1;
}

int wait_for(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return decode_status(status);
}

/// Reaps `pid` if it exits before `deadline`. Returns nullopt when the deadline passed first.
template <typename TimePoint>
std::optional<int> wait_until(pid_t pid, TimePoint deadline) {
    constexpr int kPollIntervalMs = 10;
    for (;;) {
        int status = 0;
        const pid_t reaped = ::waitpid(pid, &status, WNOHANG);
        if (reaped == pid) {
            return decode_status(status);
        }
        if (reaped < 0 && errno != EINTR) {
            return -1;
        }
        if (TimePoint::clock::now() >= deadline) {
            return std::nullopt;
        }
        (void)::poll(nullptr, 0, kPollIntervalMs);
    }
}

/// Reads what is available on `fd` into `out`. Returns false once the stream is finished.
bool drain(Fd& fd, std::string& out, std::string& fault) {
    std::array<char, 4096> buffer{};
    const ssize_t n = ::read(fd.get(), buffer.data(), buffer.size());
    if (n > 0) {
        out.append(buffer.data(), static_cast<std::size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    if (n < 0) {
        fault = errno_text(errno);
    }
    fd.reset();
    return false;
}

}  // namespace

Session::Session(Config cfg) : cfg_(std::move(cfg)) {}

Session::Session(const InterpreterLocator& locator, int timeout_sec)
    : cfg_{.interpreter = locator.locate(), .timeout_sec = timeout_sec} {}

std::vector<std::string> Session::build_environment(const StepInvocation& invocation,
                                                    bool inherit_environment) {
    std::vector<std::string> env;
    if (inherit_environment && environ != nullptr) {
        for (char** entry = environ; *entry != nullptr; ++entry) {
            if (!is_step_variable(*entry)) {
                env.emplace_back(*entry);
            }
        }
    }
    for (std::size_t i = 0; i < invocation.captures.size(); ++i) {
        env.push_back(std::string{kCaptureVariablePrefix} + std::to_string(i + 1) + "=" +
                      invocation.captures[i]);
    }
    env.push_back(std::string{kPreviousOutputVariable} + "=" + invocation.previous_output);
    return env;
}

StepInvocationResult Session::execute(const StepInvocation& invocation) {
    auto log = logging::get();

    if (text::trim_copy(invocation.script).empty()) {
        return StepInvocationResult{.exit_code = 1, .stderr_text = "Empty script content"};
    }

    auto env = build_environment(invocation, cfg_.inherit_environment);
    if (log->should_log(spdlog::level::debug)) {
        log->debug("--- Variables passed to '{}' ---", invocation.label);
        for (std::size_t i = 0; i < invocation.captures.size(); ++i) {
            log->debug("  {}{}={}", kCaptureVariablePrefix, i + 1, invocation.captures[i]);
        }
        log->debug("  {}={}", kPreviousOutputVariable, invocation.previous_output);
        log->debug("--- Using interpreter: {} ---", cfg_.interpreter.string());
        log->debug("--- Executing script ---\n{}", invocation.script);
    }

    // Everything the child touches is prepared before fork().
    const std::string interpreter = cfg_.interpreter.string();
    std::vector<std::string> args{interpreter, "-c", invocation.script};
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    std::vector<char*> envp;
    for (auto& entry : env) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    Fd dev_null{::open("/dev/null", O_RDONLY | O_CLOEXEC)};
    if (!dev_null.valid()) {
        throw LaunchError("Unable to open /dev/null: " + errno_text(errno));
    }
    Pipe out = make_pipe();
    Pipe err = make_pipe();
    Pipe exec_status = make_pipe();

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw LaunchError("Unable to fork command interpreter: " + errno_text(errno));
    }
    if (pid == 0) {
        if (::dup2(dev_null.get(), STDIN_FILENO) < 0 || ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
            ::dup2(err.write.get(), STDERR_FILENO) < 0) {
            const int error = errno;
            (void)!::write(exec_status.write.get(), &error, sizeof(error));
            ::_exit(127);
        }
        ::execve(argv[0], argv.data(), envp.data());
        const int error = errno;
        (void)!::write(exec_status.write.get(), &error, sizeof(error));
        ::_exit(127);
    }

    out.write.reset();
    err.write.reset();
    exec_status.write.reset();
    dev_null.reset();

    // The status pipe is close-on-exec: EOF means execve() succeeded.
    int child_errno = 0;
    ssize_t status_bytes = 0;
    do {
        status_bytes = ::read(exec_status.read.get(), &child_errno, sizeof(child_errno));
    } while (status_bytes < 0 && errno == EINTR);
    if (status_bytes == static_cast<ssize_t>(sizeof(child_errno))) {
        (void)wait_for(pid);
        throw LaunchError("Failed to launch command interpreter " + interpreter + ": " +
                          errno_text(child_errno));
    }

    StepInvocationResult result;
    std::string fault;
    bool timed_out = false;

    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(cfg_.timeout_sec);

    while (out.read.valid() || err.read.valid()) {
        std::array<pollfd, 2> fds{};
        nfds_t count = 0;
        if (out.read.valid()) fds[count++] = pollfd{out.read.get(), POLLIN, 0};
        if (err.read.valid()) fds[count++] = pollfd{err.read.get(), POLLIN, 0};

        int wait_ms = -1;
        if (cfg_.timeout_sec > 0) {
            const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }

        const int ready = ::poll(fds.data(), count, wait_ms);
        if (ready < 0) {
            if (errno == EINTR) continue;
            fault = errno_text(errno);
            break;
        }
        if (ready == 0) {
            timed_out = true;
            ::kill(pid, SIGKILL);
            break;
        }
        for (nfds_t i = 0; i < count; ++i) {
            if (fds[i].revents == 0) continue;
            if (fds[i].fd == out.read.get()) {
                (void)drain(out.read, result.stdout_text, fault);
            } else {
                (void)drain(err.read, result.stderr_text, fault);
            }
        }
    }
    out.read.reset();
    err.read.reset();

    // A child may close its pipes and keep running; the deadline still applies.
    std::optional<int> reaped;
    if (!timed_out && cfg_.timeout_sec > 0) {
        reaped = wait_until(pid, deadline);
        if (!reaped) {
            timed_out = true;
            ::kill(pid, SIGKILL);
        }
    }
    const int exit_code = reaped ? *reaped : wait_for(pid);
    result.exit_code = exit_code < 0 ? 1 : exit_code;

    if (timed_out) {
        result.exit_code = kTimeoutExitCode;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text.push_back('\n');
        }
        result.stderr_text += "Script execution timed out after " + std::to_string(cfg_.timeout_sec) +
                              " seconds";
    }
    if (!fault.empty()) {
        result.capture_failed = true;
        if (!result.stderr_text.empty() && result.stderr_text.back() != '\n') {
            result.stderr_text.push_back('\n');
        }
        result.stderr_text += "output capture failed: " + fault;
    }

    log->debug("--- Result of '{}' (exit code: {}) ---", invocation.label, result.exit_code);
    if (!text::trim_copy(result.stdout_text).empty()) log->debug("  stdout:\n{}", result.stdout_text);
    if (!text::trim_copy(result.stderr_text).empty()) log->debug("  stderr:\n{}", result.stderr_text);
    return result;
}

}  // namespace ea::gherkin::shell_bridge
