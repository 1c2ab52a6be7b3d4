#include "prism/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace prism {

static void set_rlimit(int resource, rlim_t value) {
    struct rlimit rl;
    rl.rlim_cur = value;
    rl.rlim_max = value;
    (void)setrlimit(resource, &rl);
}

// Drains whatever is readable from fd into out, honoring the byte cap.
static void drain(int fd, std::string& out, const ProcLimits& lim, ProcResult* res) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n <= 0) break;
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        size_t take = std::min(can, static_cast<size_t>(n));
        if (take < static_cast<size_t>(n)) res->output_truncated = true;
        out.append(buf, buf + take);
    }
}

[[noreturn]] static void exec_child(const std::vector<std::string>& argv, const std::string& cwd,
                                    const ProcLimits& lim, int out_fd) {
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(out_fd, STDERR_FILENO);

    // isolate process group so timeout can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

    if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

    unsetenv("LD_PRELOAD");
    unsetenv("LD_LIBRARY_PATH");

    if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);

    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, static_cast<rlim_t>(lim.rlimit_cpu_sec));
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, static_cast<rlim_t>(lim.rlimit_as_mb) * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, static_cast<rlim_t>(lim.rlimit_fsize_mb) * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, static_cast<rlim_t>(lim.rlimit_nofile));

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    execvp(cargv[0], cargv.data());
    _exit(127);
}

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int pipefd[2];
    if (pipe(pipefd) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    int flags = fcntl(pipefd[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }
    if (pid == 0) {
        close(pipefd[0]);
        exec_child(argv, cwd, lim, pipefd[1]);
    }

    (void)setpgid(pid, pid);
    close(pipefd[1]);

    const auto start = std::chrono::steady_clock::now();
    std::string out;
    int status = 0;

    while (true) {
        drain(pipefd[0], out, lim, res);

        if (waitpid(pid, &status, WNOHANG) == pid) break;

        int elapsed_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count());
        if (lim.timeout_ms > 0 && elapsed_ms > lim.timeout_ms) {
            res->timed_out = true;
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            break;
        }

        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        int slice = 50;
        if (lim.timeout_ms > 0) slice = std::max(1, std::min(slice, lim.timeout_ms - elapsed_ms));
        (void)poll(&pfd, 1, slice);
    }

    drain(pipefd[0], out, lim, res);
    close(pipefd[0]);

    res->output = std::move(out);
    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

} // namespace prism
