#include "platform/linux/posix_process_runner.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <poll.h>
#include <sstream>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void close_pipe(int (&p)[2]) {
    close_fd(p[0]);
    close_fd(p[1]);
}

} // namespace

PosixProcessRunner::PosixProcessRunner(std::chrono::milliseconds kill_grace)
    : kill_grace_(kill_grace) {}

std::expected<ProcessResult, std::string>
PosixProcessRunner::run(const std::vector<std::string>& argv, const ProcessOptions& options) {
    if (argv.empty()) {
        return std::unexpected("empty command line");
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) < 0 || ::pipe2(err_pipe, O_CLOEXEC) < 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) < 0) {
        int e = errno;
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        return std::unexpected(std::string("pipe() failed: ") + std::strerror(e));
    }

    // Everything the child touches is prepared before fork().
    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);
    std::string cwd = options.cwd.string();

    pid_t pid = ::fork();
    if (pid < 0) {
        int e = errno;
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        close_pipe(exec_pipe);
        return std::unexpected(std::string("fork() failed: ") + std::strerror(e));
    }

    if (pid == 0) {
        // Callers may block SIGINT/SIGTERM for a signal thread; the child
        // must stay killable by SIGTERM.
        sigset_t none;
        sigemptyset(&none);
        ::sigprocmask(SIG_SETMASK, &none, nullptr);
        ::setpgid(0, 0);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) < 0) {
            int e = errno;
            (void)!::write(exec_pipe[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::execvp(args[0], args.data());
        int e = errno;
        (void)!::write(exec_pipe[1], &e, sizeof(e));
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // EOF on the exec pipe means execvp() succeeded (CLOEXEC closed it).
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        close_pipe(out_pipe);
        close_pipe(err_pipe);
        while (::waitpid(pid, nullptr, 0) < 0 && errno == EINTR) {}
        return std::unexpected(std::format("failed to execute {}: {}",
                                           argv[0], std::strerror(child_errno)));
    }

    ProcessResult result;
    int fds[2] = {out_pipe[0], err_pipe[0]};
    std::string* sinks[2] = {&result.out, &result.err};

    bool reaped = false;
    int status = 0;
    bool term_sent = false;
    bool kill_sent = false;
    auto term_time = std::chrono::steady_clock::now();

    while (true) {
        pollfd pfds[2];
        int slots[2];
        nfds_t count = 0;
        for (int i = 0; i < 2; ++i) {
            if (fds[i] < 0) continue;
            pfds[count] = pollfd{fds[i], POLLIN, 0};
            slots[count] = i;
            ++count;
        }

        if (count > 0) {
            int rc = ::poll(pfds, count, 50);
            if (rc < 0 && errno != EINTR) break;
            for (nfds_t k = 0; rc > 0 && k < count; ++k) {
                if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) continue;
                char buf[4096];
                ssize_t r = ::read(pfds[k].fd, buf, sizeof(buf));
                if (r > 0) {
                    sinks[slots[k]]->append(buf, static_cast<size_t>(r));
                } else if (r == 0 || (errno != EINTR && errno != EAGAIN)) {
                    close_fd(fds[slots[k]]);
                }
            }
        } else {
            pid_t w = ::waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                reaped = true;
                break;
            }
            if (w < 0 && errno != EINTR) break;
            std::this_thread::sleep_for(20ms);
        }

        auto now = std::chrono::steady_clock::now();
        if (!term_sent) {
            if (options.stop.stop_requested()) {
                result.cancelled = true;
            } else if (options.deadline && now >= *options.deadline) {
                result.timed_out = true;
            }
            if (result.interrupted()) {
                ::kill(-pid, SIGTERM);
                term_sent = true;
                term_time = now;
            }
        } else if (!kill_sent && now - term_time >= kill_grace_) {
            ::kill(-pid, SIGKILL);
            kill_sent = true;
        } else if (kill_sent && now - term_time >= 2 * kill_grace_ + 1s) {
            // A detached grandchild is still holding the pipes open.
            break;
        }
    }

    close_fd(fds[0]);
    close_fd(fds[1]);

    if (!reaped) {
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno == EINTR) continue;
            return std::unexpected(std::string("waitpid() failed: ") + std::strerror(errno));
        }
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

std::optional<fs::path> find_executable(const std::string& name, const std::string& search_path) {
    if (name.empty()) return std::nullopt;

    auto is_executable = [](const fs::path& p) {
        std::error_code ec;
        return fs::is_regular_file(p, ec) && ::access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return fs::path(name);
        return std::nullopt;
    }

    std::string path = search_path;
    if (path.empty()) {
        const char* env = std::getenv("PATH");
        path = env ? env : "/usr/local/bin:/usr/bin:/bin";
    }

    std::stringstream ss(path);
    std::string dir;
    while (std::getline(ss, dir, ':')) {
        if (dir.empty()) dir = ".";
        auto candidate = fs::path(dir) / name;
        if (is_executable(candidate)) return candidate;
    }
    return std::nullopt;
}
