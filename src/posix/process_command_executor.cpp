#include "process_command_executor.hpp"
#include "../errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace emu {

namespace {

constexpr int kPollSliceMs = 50;
constexpr auto kTerminateGrace = std::chrono::milliseconds(500);

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

std::string describe(const CommandSpec& spec) {
    std::string text = spec.program;
    for (const auto& arg : spec.args) {
        text += ' ';
        text += arg;
    }
    return text;
}

std::vector<char*> make_argv(const CommandSpec& spec) {
    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.program.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

// pipe() with both ends close-on-exec (pipe2 is not available everywhere)
bool make_pipe(int fds[2]) {
    if (::pipe(fds) != 0) return false;
    ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
    ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
    return true;
}

// Reads whatever is available; returns false on EOF or error
bool drain(int fd, std::string& out) {
    char buffer[4096];
    const ssize_t n = ::read(fd, buffer, sizeof(buffer));
    if (n > 0) {
        out.append(buffer, static_cast<size_t>(n));
        return true;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) {
        return true;
    }
    return false;
}

} // namespace

ProcessCommandExecutor::ChildProcess::~ChildProcess() {
    close_fd(stdin_fd);
    close_fd(stdout_fd);
    close_fd(stderr_fd);
    if (pid > 0) {
        terminate();
    }
}

int ProcessCommandExecutor::ChildProcess::wait() {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            pid = -1;
            return -1;
        }
    }
    pid = -1;

    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

void ProcessCommandExecutor::ChildProcess::terminate() {
    if (pid <= 0) return;

    ::kill(pid, SIGTERM);

    const auto deadline = std::chrono::steady_clock::now() + kTerminateGrace;
    while (std::chrono::steady_clock::now() < deadline) {
        int status = 0;
        const pid_t result = ::waitpid(pid, &status, WNOHANG);
        if (result == pid || (result < 0 && errno != EINTR)) {
            pid = -1;
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    ::kill(pid, SIGKILL);
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    pid = -1;
}

void ProcessCommandExecutor::ChildProcess::close_stdin() {
    close_fd(stdin_fd);
}

void ProcessCommandExecutor::launch(const CommandSpec& spec, ChildProcess& child) {
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // Reports execvp failure back to the parent

    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe) || !make_pipe(exec_pipe)) {
        const std::string reason = std::strerror(errno);
        close_all();
        throw DeviceError(ErrorKind::CommandFailed, "pipe() failed: " + reason);
    }

    // Built before fork: the child may only make async-signal-safe calls
    auto argv = make_argv(spec);

    const pid_t pid = ::fork();
    if (pid < 0) {
        const std::string reason = std::strerror(errno);
        close_all();
        throw DeviceError(ErrorKind::CommandFailed, "fork() failed: " + reason);
    }

    if (pid == 0) {
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvp(argv[0], argv.data());

        const int error = errno;
        [[maybe_unused]] const ssize_t ignored = ::write(exec_pipe[1], &error, sizeof(error));
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    child.pid = pid;
    child.stdin_fd = in_pipe[1];
    child.stdout_fd = out_pipe[0];
    child.stderr_fd = err_pipe[0];

    // EOF here means exec succeeded (the CLOEXEC end was closed)
    int exec_error = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &exec_error, sizeof(exec_error));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        child.wait();
        throw DeviceError(ErrorKind::ToolNotFound,
                          "Cannot execute " + spec.program + ": " + std::strerror(exec_error));
    }
}

void ProcessCommandExecutor::write_stdin(ChildProcess& child, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        const ssize_t n = ::write(child.stdin_fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            break;  // Child closed its stdin
        }
        written += static_cast<size_t>(n);
    }
    child.close_stdin();
}

CommandResult ProcessCommandExecutor::run(const CommandSpec& spec, const CancellationToken& token) {
    spdlog::debug("[Exec] {}", describe(spec));

    ChildProcess child;
    launch(spec, child);
    write_stdin(child, spec.stdin_data);

    CommandResult result;
    const auto started = std::chrono::steady_clock::now();
    bool out_open = true;
    bool err_open = true;

    while (out_open || err_open) {
        if (token.is_cancelled()) {
            child.terminate();
            throw TaskCancelled();
        }
        if (spec.timeout.count() > 0 && std::chrono::steady_clock::now() - started > spec.timeout) {
            child.terminate();
            throw DeviceError(ErrorKind::CommandFailed, "Command timed out: " + describe(spec));
        }

        pollfd fds[2] = {
            {out_open ? child.stdout_fd : -1, POLLIN, 0},
            {err_open ? child.stderr_fd : -1, POLLIN, 0},
        };
        const int ready = ::poll(fds, 2, kPollSliceMs);
        if (ready < 0 && errno != EINTR) {
            child.terminate();
            throw DeviceError(ErrorKind::CommandFailed, "poll() failed: " + std::string(std::strerror(errno)));
        }
        if (ready <= 0) continue;

        if (out_open && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            out_open = drain(child.stdout_fd, result.stdout_text);
        }
        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain(child.stderr_fd, result.stderr_text);
        }
    }

    result.exit_code = child.wait();
    spdlog::trace("[Exec] exit {} ({} bytes)", result.exit_code, result.stdout_text.size());
    return result;
}

void ProcessCommandExecutor::stream(const CommandSpec& spec,
                                    const std::function<void(const std::string&)>& on_line,
                                    const CancellationToken& token) {
    spdlog::debug("[Exec] stream {}", describe(spec));

    ChildProcess child;
    launch(spec, child);
    write_stdin(child, spec.stdin_data);

    std::string pending;
    std::string discarded_stderr;
    bool out_open = true;
    bool err_open = true;

    while (out_open) {
        if (token.is_cancelled()) {
            child.terminate();
            throw TaskCancelled();
        }

        pollfd fds[2] = {
            {child.stdout_fd, POLLIN, 0},
            {err_open ? child.stderr_fd : -1, POLLIN, 0},
        };
        const int ready = ::poll(fds, 2, kPollSliceMs);
        if (ready <= 0) continue;

        if (fds[0].revents & (POLLIN | POLLHUP | POLLERR)) {
            out_open = drain(child.stdout_fd, pending);

            size_t start = 0;
            for (size_t nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
                std::string line = pending.substr(start, nl - start);
                if (!line.empty() && line.back() == '\r') line.pop_back();
                on_line(line);
                start = nl + 1;
            }
            pending.erase(0, start);
        }
        if (err_open && (fds[1].revents & (POLLIN | POLLHUP | POLLERR))) {
            err_open = drain(child.stderr_fd, discarded_stderr);
            discarded_stderr.clear();
        }
    }

    if (!pending.empty()) {
        on_line(pending);
    }
    child.wait();
}

void ProcessCommandExecutor::spawn_detached(const CommandSpec& spec) {
    if (spec.program.find('/') != std::string::npos && ::access(spec.program.c_str(), X_OK) != 0) {
        throw DeviceError(ErrorKind::ToolNotFound, "Cannot execute " + spec.program);
    }

    spdlog::debug("[Exec] detached {}", describe(spec));

    auto argv = make_argv(spec);

    // Double fork so the grandchild is re-parented and never becomes our zombie
    const pid_t pid = ::fork();
    if (pid < 0) {
        throw DeviceError(ErrorKind::CommandFailed, "fork() failed: " + std::string(std::strerror(errno)));
    }

    if (pid == 0) {
        if (::fork() != 0) {
            ::_exit(0);
        }
        ::setsid();
        const int devnull = ::open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::dup2(devnull, STDOUT_FILENO);
            ::dup2(devnull, STDERR_FILENO);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
}

} // namespace emu
