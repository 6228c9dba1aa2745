/**
 * @file process_runner.cpp
 * @brief ProcessRunner built on posix_spawnp, pipes and poll().
 */

#include "executor/process_runner.hpp"

#include "core/file_util.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <spawn.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

extern char** environ;

namespace cloudlet {

namespace {

constexpr int kPollSliceMs = 20;
constexpr int kSpawnAttempts = 5;
constexpr size_t kReadChunk = 64 * 1024;
constexpr size_t kMaxStderrBytes = 64 * 1024;

struct Pipe {
    UniqueFd read;
    UniqueFd write;
};

bool make_pipe(Pipe& p) {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return false;
    p.read.reset(fds[0]);
    p.write.reset(fds[1]);
    return true;
}

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/// write() with SIGPIPE blocked for this thread, so a child that exits
/// without reading its input yields EPIPE instead of killing the host.
ssize_t write_without_sigpipe(int fd, const uint8_t* data, size_t size) {
    sigset_t pipe_set;
    sigset_t old_set;
    sigemptyset(&pipe_set);
    sigaddset(&pipe_set, SIGPIPE);
    pthread_sigmask(SIG_BLOCK, &pipe_set, &old_set);

    ssize_t n = ::write(fd, data, size);
    int saved_errno = errno;

    if (n < 0 && saved_errno == EPIPE) {
        timespec zero{0, 0};
        while (sigtimedwait(&pipe_set, nullptr, &zero) > 0) {}
    }
    pthread_sigmask(SIG_SETMASK, &old_set, nullptr);
    errno = saved_errno;
    return n;
}

/// Read what is available; returns false once the pipe reached EOF or failed.
bool drain(int fd, std::string& sink, size_t limit, bool& truncated) {
    char buf[kReadChunk];
    while (true) {
        ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t room = sink.size() < limit ? limit - sink.size() : 0;
            size_t take = std::min(room, static_cast<size_t>(n));
            sink.append(buf, take);
            if (take < static_cast<size_t>(n)) truncated = true;
            continue;
        }
        if (n == 0) return false;
        if (errno == EINTR) continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

void kill_group_and_reap(pid_t pid, int& status) {
    ::kill(-pid, SIGKILL);
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

}  // namespace

std::filesystem::path find_executable(const std::string& program) {
    if (program.empty()) return {};
    if (program.find('/') != std::string::npos) {
        return ::access(program.c_str(), X_OK) == 0 ? std::filesystem::path{program}
                                                   : std::filesystem::path{};
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env != nullptr ? path_env : "/usr/local/bin:/usr/bin:/bin";

    size_t start = 0;
    while (start <= search.size()) {
        size_t end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        std::string dir = search.substr(start, end - start);
        if (dir.empty()) dir = ".";

        auto candidate = std::filesystem::path{dir} / program;
        struct stat st{};
        if (::stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode)
            && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
        start = end + 1;
    }
    return {};
}

ProcessRunner::ProcessRunner(uint64_t max_output_bytes)
    : max_output_bytes_(max_output_bytes) {}

ProcessOutcome ProcessRunner::run(const ProcessSpec& spec,
                                  SteadyTime deadline,
                                  std::stop_token stop) const {
    ProcessOutcome outcome;

    if (spec.argv.empty()) {
        outcome.error = "empty argv";
        return outcome;
    }
    if (stop.stop_requested()) {
        outcome.status = ProcessStatus::Cancelled;
        return outcome;
    }

    Pipe in_pipe;
    Pipe out_pipe;
    Pipe err_pipe;
    if (!make_pipe(in_pipe) || !make_pipe(out_pipe) || !make_pipe(err_pipe)) {
        outcome.error = errno_message("pipe2");
        return outcome;
    }

    // ── Spawn ────────────────────────────────
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, in_pipe.read.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, out_pipe.write.get(), STDOUT_FILENO);
    posix_spawn_file_actions_adddup2(&actions, err_pipe.write.get(), STDERR_FILENO);
    if (!spec.working_dir.empty()) {
        posix_spawn_file_actions_addchdir_np(&actions, spec.working_dir.c_str());
    }

    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t empty_mask;
    sigset_t default_signals;
    sigemptyset(&empty_mask);
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    sigaddset(&default_signals, SIGINT);
    sigaddset(&default_signals, SIGTERM);
    posix_spawnattr_setsigmask(&attr, &empty_mask);
    posix_spawnattr_setsigdefault(&attr, &default_signals);
    posix_spawnattr_setpgroup(&attr, 0);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP | POSIX_SPAWN_SETSIGMASK
                                    | POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> argv;
    argv.reserve(spec.argv.size() + 1);
    for (const auto& arg : spec.argv) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (char** e = environ; e != nullptr && *e != nullptr; ++e) envp.push_back(*e);
    for (const auto& extra : spec.extra_env) envp.push_back(const_cast<char*>(extra.c_str()));
    envp.push_back(nullptr);

    pid_t pid = -1;
    int spawn_rc = 0;
    for (int attempt = 0; attempt < kSpawnAttempts; ++attempt) {
        spawn_rc = ::posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), envp.data());
        // A freshly written executable can still be open in a concurrently forked child
        if (spawn_rc != ETXTBSY) break;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    posix_spawn_file_actions_destroy(&actions);
    posix_spawnattr_destroy(&attr);

    if (spawn_rc != 0) {
        outcome.error = "spawn " + spec.argv[0] + ": " + std::strerror(spawn_rc);
        return outcome;
    }

    // Parent keeps only its ends
    in_pipe.read.reset();
    out_pipe.write.reset();
    err_pipe.write.reset();
    set_nonblocking(in_pipe.write.get());
    set_nonblocking(out_pipe.read.get());
    set_nonblocking(err_pipe.read.get());

    size_t stdin_written = 0;
    if (spec.stdin_data.empty()) in_pipe.write.reset();

    std::string stdout_buf;
    std::string stderr_buf;
    bool stdout_open = true;
    bool stderr_open = true;
    bool stderr_truncated = false;
    int status = 0;

    // ── Supervise ────────────────────────────
    while (true) {
        if (stop.stop_requested()) {
            kill_group_and_reap(pid, status);
            outcome.status = ProcessStatus::Cancelled;
            break;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            kill_group_and_reap(pid, status);
            outcome.status = ProcessStatus::TimedOut;
            break;
        }

        pollfd fds[3];
        nfds_t nfds = 0;
        int in_idx = -1;
        int out_idx = -1;
        int err_idx = -1;
        if (in_pipe.write) {
            in_idx = static_cast<int>(nfds);
            fds[nfds++] = pollfd{in_pipe.write.get(), POLLOUT, 0};
        }
        if (stdout_open) {
            out_idx = static_cast<int>(nfds);
            fds[nfds++] = pollfd{out_pipe.read.get(), POLLIN, 0};
        }
        if (stderr_open) {
            err_idx = static_cast<int>(nfds);
            fds[nfds++] = pollfd{err_pipe.read.get(), POLLIN, 0};
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int slice = static_cast<int>(std::min<int64_t>(remaining.count() + 1, kPollSliceMs));
        int ready = ::poll(nfds > 0 ? fds : nullptr, nfds, slice);
        if (ready < 0 && errno != EINTR) {
            kill_group_and_reap(pid, status);
            outcome.status = ProcessStatus::SpawnFailed;
            outcome.error = errno_message("poll");
            break;
        }

        if (ready > 0) {
            if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
                ssize_t n = write_without_sigpipe(in_pipe.write.get(),
                                                  spec.stdin_data.data() + stdin_written,
                                                  spec.stdin_data.size() - stdin_written);
                if (n > 0) stdin_written += static_cast<size_t>(n);
                bool broken = n < 0 && errno != EAGAIN && errno != EINTR;
                if (broken || stdin_written == spec.stdin_data.size()) in_pipe.write.reset();
            }
            if (out_idx >= 0 && (fds[out_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
                stdout_open = drain(out_pipe.read.get(), stdout_buf,
                                    static_cast<size_t>(max_output_bytes_),
                                    outcome.output_truncated);
            }
            if (err_idx >= 0 && (fds[err_idx].revents & (POLLIN | POLLHUP | POLLERR))) {
                stderr_open = drain(err_pipe.read.get(), stderr_buf, kMaxStderrBytes,
                                    stderr_truncated);
            }
        }

        pid_t waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            // Collect output still buffered in the pipes; grandchildren may keep them open
            if (stdout_open) {
                drain(out_pipe.read.get(), stdout_buf, static_cast<size_t>(max_output_bytes_),
                      outcome.output_truncated);
            }
            if (stderr_open) {
                drain(err_pipe.read.get(), stderr_buf, kMaxStderrBytes, stderr_truncated);
            }
            if (WIFEXITED(status)) {
                outcome.status = ProcessStatus::Exited;
                outcome.exit_code = WEXITSTATUS(status);
            } else {
                outcome.status = ProcessStatus::Signaled;
                outcome.signal = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
            }
            break;
        }
        if (waited < 0 && errno != EINTR) {
            outcome.status = ProcessStatus::SpawnFailed;
            outcome.error = errno_message("waitpid");
            break;
        }
    }

    outcome.stdout_data.assign(stdout_buf.begin(), stdout_buf.end());
    outcome.stderr_text = std::move(stderr_buf);
    return outcome;
}

}  // namespace cloudlet
