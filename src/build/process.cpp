//! # Child Process Runner
//!
//! fork/execv with both output pipes drained through `poll()`. The child
//! side only uses async-signal-safe calls: argv is prepared before fork.

#include "simdbuild/build/process.hpp"

#include "simdbuild/log/log.hpp"

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <mutex>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

namespace simdbuild::build {

// ============================================================================
// Child Registry
// ============================================================================
//
// Lock-free so the signal handler can walk it.

namespace {

constexpr size_t MAX_TRACKED_CHILDREN = 256;

std::array<std::atomic<pid_t>, MAX_TRACKED_CHILDREN> g_children{};

bool register_child(pid_t pid) {
    for (auto& slot : g_children) {
        pid_t expected = 0;
        if (slot.compare_exchange_strong(expected, pid)) {
            return true;
        }
    }
    return false;
}

void unregister_child(pid_t pid) {
    for (auto& slot : g_children) {
        pid_t expected = pid;
        if (slot.compare_exchange_strong(expected, 0)) {
            return;
        }
    }
}

extern "C" void terminate_children_and_reraise(int sig) {
    for (auto& slot : g_children) {
        pid_t pid = slot.load();
        if (pid > 0) {
            kill(pid, SIGTERM);
        }
    }
    signal(sig, SIG_DFL);
    raise(sig);
}

bool is_executable_file(const fs::path& p) {
    struct stat st;
    if (stat(p.c_str(), &st) != 0) {
        return false;
    }
    return S_ISREG(st.st_mode) && access(p.c_str(), X_OK) == 0;
}

} // namespace

void install_interrupt_handlers() {
    static std::once_flag once;
    std::call_once(once, [] {
        struct sigaction action {};
        action.sa_handler = terminate_children_and_reraise;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
    });
}

auto live_child_count() -> size_t {
    size_t n = 0;
    for (const auto& slot : g_children) {
        if (slot.load() > 0) {
            ++n;
        }
    }
    return n;
}

// ============================================================================
// Executable Lookup
// ============================================================================

auto find_executable(std::string_view name, const std::vector<fs::path>& search_dirs)
    -> std::optional<fs::path> {
    if (name.empty()) {
        return std::nullopt;
    }
    fs::path candidate(name);
    if (name.find('/') != std::string_view::npos) {
        if (is_executable_file(candidate)) {
            return candidate;
        }
        return std::nullopt;
    }
    for (const auto& dir : search_dirs) {
        auto full = dir / candidate;
        if (is_executable_file(full)) {
            return full;
        }
    }
    return std::nullopt;
}

auto format_command(const fs::path& exe, const std::vector<std::string>& args) -> std::string {
    std::string out = exe.string();
    for (const auto& a : args) {
        out += ' ';
        if (a.find(' ') != std::string::npos) {
            out += '"' + a + '"';
        } else {
            out += a;
        }
    }
    return out;
}

// ============================================================================
// Process Execution
// ============================================================================

auto run_process(const fs::path& exe, const std::vector<std::string>& args, const fs::path& cwd)
    -> ProcessResult {
    using Clock = std::chrono::steady_clock;
    auto start = Clock::now();

    ProcessResult result;

    std::string exe_str = exe.string();
    std::string cwd_str = cwd.string();
    std::vector<char*> c_args;
    c_args.push_back(const_cast<char*>(exe_str.c_str()));
    for (const auto& a : args) {
        c_args.push_back(const_cast<char*>(a.c_str()));
    }
    c_args.push_back(nullptr);

    int stdout_pipe[2];
    int stderr_pipe[2];
    if (pipe2(stdout_pipe, O_CLOEXEC) != 0) {
        result.stderr_output = "Failed to create pipes";
        return result;
    }
    if (pipe2(stderr_pipe, O_CLOEXEC) != 0) {
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        result.stderr_output = "Failed to create pipes";
        return result;
    }

    SIMDBUILD_LOG_DEBUG("process", "exec " << format_command(exe, args));

    // Interrupts stay blocked until the child is registered, so the handler
    // never misses a child that is already running.
    sigset_t interrupts;
    sigset_t previous_mask;
    sigemptyset(&interrupts);
    sigaddset(&interrupts, SIGINT);
    sigaddset(&interrupts, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &interrupts, &previous_mask);

    pid_t pid = fork();
    if (pid < 0) {
        pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
        result.stderr_output = "Failed to fork";
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        signal(SIGINT, SIG_DFL);
        signal(SIGTERM, SIG_DFL);
        pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        if (!cwd_str.empty() && chdir(cwd_str.c_str()) != 0) {
            _exit(EXEC_FAILED_EXIT_CODE);
        }
        execv(exe_str.c_str(), c_args.data());
        _exit(EXEC_FAILED_EXIT_CODE);
    }

    bool tracked = register_child(pid);
    pthread_sigmask(SIG_SETMASK, &previous_mask, nullptr);
    if (!tracked) {
        SIMDBUILD_LOG_DEBUG("process", "child table full, pid " << pid << " is not tracked");
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);

    std::array<pollfd, 2> fds{};
    fds[0] = {stdout_pipe[0], POLLIN, 0};
    fds[1] = {stderr_pipe[0], POLLIN, 0};
    std::string* sinks[2] = {&result.stdout_output, &result.stderr_output};
    int open_fds = 2;
    char buf[4096];

    while (open_fds > 0) {
        int ready = poll(fds.data(), fds.size(), -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (size_t i = 0; i < fds.size(); ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = read(fds[i].fd, buf, sizeof(buf));
            if (n > 0) {
                sinks[i]->append(buf, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                close(fds[i].fd);
                fds[i].fd = -1;
                --open_fds;
            }
        }
    }
    for (auto& fd : fds) {
        if (fd.fd >= 0) {
            close(fd.fd);
        }
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
    if (tracked) {
        unregister_child(pid);
    }

    result.launched = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        if (result.exit_code == EXEC_FAILED_EXIT_CODE && result.stdout_output.empty() &&
            result.stderr_output.empty()) {
            result.launched = false;
            result.stderr_output = "Failed to execute " + exe_str;
        }
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = -1;
    }

    result.duration_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start).count();
    return result;
}

} // namespace simdbuild::build
