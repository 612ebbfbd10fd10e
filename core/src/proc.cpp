#include "conjure/proc.h"
#include "conjure/config.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace conjure {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            if (c == '\'') { st = SQ; have_token = true; continue; }
            if (c == '"') { st = DQ; esc = false; have_token = true; continue; }
            cur.push_back(c);
            have_token = true;
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

std::vector<std::string> proc_wrapped_argv(const std::vector<std::string>& argv) {
    if (!env_true("CONJURE_PROC_WRAPPER_ENABLE")) return argv;
    const char* w = std::getenv("CONJURE_PROC_WRAPPER");
    if (!w) return argv;
    auto toks = split_argv_quoted(w);
    if (toks.empty()) return argv;
    toks.insert(toks.end(), argv.begin(), argv.end());
    return toks;
}

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

void proc_child_isolate(const ProcLimits& lim) {
    // own process group so a timeout can kill the whole subtree
    (void)setpgid(0, 0);
    (void)umask(077);

    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) (void)close(fd);

    unsetenv("LD_PRELOAD");

#ifdef __linux__
    if (lim.no_new_privs) (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
    (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

    if (lim.rlimit_cpu_sec > 0) set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec);
    if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_fsize_mb > 0) set_rlimit(RLIMIT_FSIZE, (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL);
    if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
}

static bool proc_run_impl(const std::vector<std::string>& argv,
                          const std::string& cwd,
                          const std::string* stdin_data,
                          const ProcLimits& lim,
                          ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }
    const std::vector<std::string> eff_argv = proc_wrapped_argv(argv);

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    int in_pipe[2] = {-1, -1};
    if (stdin_data && pipe(in_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

    std::vector<char*> cargv;
    cargv.reserve(eff_argv.size() + 1);
    for (const auto& s : eff_argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        if (in_pipe[0] >= 0) { close(in_pipe[0]); close(in_pipe[1]); }
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child
        if (in_pipe[0] >= 0) {
            (void)dup2(in_pipe[0], STDIN_FILENO);
        } else {
            int devnull = open("/dev/null", O_RDONLY);
            if (devnull >= 0) (void)dup2(devnull, STDIN_FILENO);
        }
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        if (lim.merge_stderr) {
            (void)dup2(out_pipe[1], STDERR_FILENO);
        } else {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) (void)dup2(devnull, STDERR_FILENO);
        }

        proc_child_isolate(lim);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);

        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);

    int in_fd = -1;
    if (in_pipe[0] >= 0) {
        close(in_pipe[0]);
        in_fd = in_pipe[1];
        if (stdin_data->empty()) {
            close(in_fd);
            in_fd = -1;
        } else {
            int fl = fcntl(in_fd, F_GETFL, 0);
            if (fl >= 0) (void)fcntl(in_fd, F_SETFL, fl | O_NONBLOCK);
        }
    }
    size_t write_off = 0;

    auto start = std::chrono::steady_clock::now();
    std::string out;
    out.reserve(std::min<size_t>(lim.stdout_max_bytes, 64 * 1024));

    auto append_out = [&](const char* buf, ssize_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        size_t take = std::min(can, (size_t)n);
        if (take < (size_t)n) res->output_truncated = true;
        out.append(buf, buf + take);
    };
    auto drain = [&]() {
        char buf[4096];
        while (true) {
            ssize_t n = read(out_pipe[0], buf, sizeof(buf));
            if (n > 0) { append_out(buf, n); continue; }
            if (n == -1 && errno == EINTR) continue;
            break;
        }
    };

    bool child_exited = false;
    int status = 0;

    // Interleaved stdin write + output read so large payloads cannot deadlock.
    while (true) {
        struct pollfd fds[2];
        nfds_t nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = (int)nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            nfds++;
        }
        const int out_idx = (int)nfds;
        fds[nfds].fd = out_pipe[0];
        fds[nfds].events = POLLIN;
        nfds++;

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            slice = std::min(slice, remaining);
        }

        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data->size()) {
                ssize_t n = write(in_fd, stdin_data->data() + write_off, stdin_data->size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data->size();  // child closed its stdin
                break;
            }
            if (write_off >= stdin_data->size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) drain();

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    drain();
    close(out_pipe[0]);

    res->output = std::move(out);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }
    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;
    return true;
}

bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res) {
    return proc_run_impl(argv, cwd, nullptr, lim, res);
}

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res) {
    return proc_run_impl(argv, cwd, &stdin_data, lim, res);
}

} // namespace conjure
