//! # Subprocess Execution
//!
//! fork + execve with three pipes: stdout, stderr, and a close-on-exec status
//! pipe through which the child reports a failed `chdir`/`execve` errno. EOF on
//! the status pipe means the exec succeeded. The child's stdin is /dev/null.
//!
//! Everything the child needs (argv, envp, resolved path) is built before the
//! fork; the child only calls async-signal-safe functions.

#include "harness/process.hpp"

#include "log/log.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <poll.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace fwtest::harness {

// ============================================================================
// Environment Helpers
// ============================================================================

Environment inherited_environment() {
    Environment env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }
        env.emplace(kv.substr(0, eq), kv.substr(eq + 1));
    }
    return env;
}

Environment merge_environment(Environment base, const Environment& delta) {
    for (const auto& [key, value] : delta) {
        base[key] = value;
    }
    return base;
}

std::string format_command(const std::string& executable, const std::vector<std::string>& args) {
    std::string cmd = executable;
    for (const auto& arg : args) {
        cmd += ' ';
        if (arg.empty() || arg.find_first_of(" \t\"'") != std::string::npos) {
            cmd += '"' + arg + '"';
        } else {
            cmd += arg;
        }
    }
    return cmd;
}

// ============================================================================
// Launch Helpers
// ============================================================================

namespace {

bool is_executable_file(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

/// Resolves a bare program name against the PATH the child will see.
/// Names containing a slash are used as given.
std::string resolve_executable(const std::string& executable, const Environment& env) {
    if (executable.find('/') != std::string::npos) {
        return executable;
    }

    std::string search_path;
    auto it = env.find("PATH");
    if (it != env.end()) {
        search_path = it->second;
    } else if (const char* parent_path = std::getenv("PATH")) {
        search_path = parent_path;
    }

    size_t pos = 0;
    while (pos <= search_path.size()) {
        size_t colon = search_path.find(':', pos);
        if (colon == std::string::npos) {
            colon = search_path.size();
        }
        std::string dir = search_path.substr(pos, colon - pos);
        std::string candidate = (dir.empty() ? std::string(".") : dir) + "/" + executable;
        if (is_executable_file(candidate)) {
            return candidate;
        }
        pos = colon + 1;
    }
    return {};
}

/// Held from descriptor creation until fork returns, so no sibling thread forks
/// while a new descriptor still lacks FD_CLOEXEC (macOS has no pipe2).
std::mutex spawn_mutex;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool make_cloexec_pipe(int fds[2]) {
    if (::pipe(fds) != 0) {
        return false;
    }
    if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) != 0 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) != 0) {
        int err = errno;
        close_fd(fds[0]);
        close_fd(fds[1]);
        errno = err;
        return false;
    }
    return true;
}

/// Child side after fork. Never returns.
[[noreturn]] void exec_child(const char* path, char* const argv[], char* const envp[],
                             const char* working_dir, int stdin_fd, int stdout_fd,
                             int stderr_fd, int status_fd) {
    if (working_dir != nullptr && ::chdir(working_dir) != 0) {
        int err = errno;
        (void)!::write(status_fd, &err, sizeof(err));
        ::_exit(127);
    }

    ::dup2(stdin_fd, STDIN_FILENO);
    ::dup2(stdout_fd, STDOUT_FILENO);
    ::dup2(stderr_fd, STDERR_FILENO);

    ::execve(path, argv, envp);

    int err = errno;
    (void)!::write(status_fd, &err, sizeof(err));
    ::_exit(127);
}

/// Drains stdout and stderr concurrently until both reach EOF, so a child
/// filling one pipe can never block on the other.
void drain_pipes(int stdout_fd, int stderr_fd, std::string& out, std::string& err) {
    struct pollfd fds[2] = {{stdout_fd, POLLIN, 0}, {stderr_fd, POLLIN, 0}};
    std::string* sinks[2] = {&out, &err};
    int open_count = 2;
    char buffer[4096];

    while (open_count > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n > 0) {
                sinks[i]->append(buffer, static_cast<size_t>(n));
            } else if (n == 0 || errno != EINTR) {
                fds[i].fd = -1;
                --open_count;
            }
        }
    }
}

int decode_wait_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

} // namespace

// ============================================================================
// SubprocessRunner
// ============================================================================

Result<ProcessResult, HarnessError> SubprocessRunner::run(const std::string& executable,
                                                          const std::vector<std::string>& args,
                                                          const fs::path& working_dir,
                                                          const Environment& env) {
    std::string command = format_command(executable, args);
    FWTEST_LOG_DEBUG("process", "spawn: " << command
                                          << (working_dir.empty()
                                                  ? std::string()
                                                  : " (cwd " + working_dir.string() + ")"));

    std::string path = resolve_executable(executable, env);
    if (path.empty()) {
        return HarnessError::make(ErrorKind::ProcessLaunch,
                                  "Executable not found: " + executable);
    }

    // argv / envp storage lives until waitpid returns
    std::vector<std::string> argv_storage;
    argv_storage.reserve(args.size() + 1);
    argv_storage.push_back(executable);
    argv_storage.insert(argv_storage.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& a : argv_storage) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    env_storage.reserve(env.size());
    for (const auto& [key, value] : env) {
        env_storage.push_back(key + "=" + value);
    }
    std::vector<char*> envp;
    for (auto& e : env_storage) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    std::string cwd = working_dir.string();

    // Children get no input: stdin is /dev/null
    int stdin_fd = -1;
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    auto close_all = [&] {
        close_fd(stdin_fd);
        for (int* p : {stdout_pipe, stderr_pipe, status_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    pid_t pid;
    {
        std::lock_guard<std::mutex> lock(spawn_mutex);

        stdin_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
        if (stdin_fd < 0) {
            int err = errno;
            return HarnessError::make(ErrorKind::ProcessLaunch,
                                      "Cannot open /dev/null for " + executable + ": " +
                                          std::strerror(err));
        }
        if (!make_cloexec_pipe(stdout_pipe) || !make_cloexec_pipe(stderr_pipe) ||
            !make_cloexec_pipe(status_pipe)) {
            int err = errno;
            close_all();
            return HarnessError::make(ErrorKind::ProcessLaunch,
                                      "Failed to create pipes for " + executable + ": " +
                                          std::strerror(err));
        }

        pid = ::fork();
        if (pid < 0) {
            int err = errno;
            close_all();
            return HarnessError::make(ErrorKind::ProcessLaunch, "Failed to fork for " + executable +
                                                                    ": " + std::strerror(err));
        }

        if (pid == 0) {
            exec_child(path.c_str(), argv.data(), envp.data(),
                       cwd.empty() ? nullptr : cwd.c_str(), stdin_fd, stdout_pipe[1],
                       stderr_pipe[1], status_pipe[1]);
        }
    }

    close_fd(stdin_fd);
    close_fd(stdout_pipe[1]);
    close_fd(stderr_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t status_read;
    do {
        status_read = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (status_read < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    ProcessResult result;
    drain_pipes(stdout_pipe[0], stderr_pipe[0], result.stdout_text, result.stderr_text);
    close_fd(stdout_pipe[0]);
    close_fd(stderr_pipe[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return HarnessError::make(ErrorKind::ProcessLaunch,
                                      "waitpid failed for " + executable + ": " +
                                          std::strerror(errno));
        }
    }

    if (status_read == static_cast<ssize_t>(sizeof(child_errno))) {
        return HarnessError::make(ErrorKind::ProcessLaunch,
                                  "Cannot launch " + command + ": " + std::strerror(child_errno));
    }

    result.exit_code = decode_wait_status(status);
    FWTEST_LOG_TRACE("process", executable << " exited with " << result.exit_code);
    return result;
}

} // namespace fwtest::harness
