#include "conjure/worker_executor.h"
#include "conjure/errors.h"
#include "conjure/hash.h"
#include "conjure/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace conjure {

namespace {

// Waits up to ms for pid to exit. True when reaped.
bool wait_exit(pid_t pid, int ms) {
    const auto t0 = std::chrono::steady_clock::now();
    while (true) {
        int st = 0;
        pid_t w = ::waitpid(pid, &st, WNOHANG);
        if (w == pid || (w < 0 && errno == ECHILD)) return true;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - t0).count();
        if (elapsed >= ms) return false;
        ::usleep(10000);
    }
}

} // namespace

SubprocessWorkerExecutor::SubprocessWorkerExecutor(std::string worker_bin, std::vector<std::string> extra_args)
    : worker_bin_(std::move(worker_bin)), extra_args_(std::move(extra_args)) {}

SubprocessWorkerExecutor::~SubprocessWorkerExecutor() { shutdown(); }

bool SubprocessWorkerExecutor::start(const std::string& env_dir, std::string* err) {
    shutdown();

    int in_pipe[2], out_pipe[2];
    if (::pipe(in_pipe) != 0) {
        if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }
    if (::pipe(out_pipe) != 0) {
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        if (err) *err = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    std::vector<std::string> argv = proc_wrapped_argv([&] {
        std::vector<std::string> a{worker_bin_, "--serve"};
        a.insert(a.end(), extra_args_.begin(), extra_args_.end());
        return a;
    }());
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    pid_t child = ::fork();
    if (child < 0) {
        ::close(in_pipe[0]); ::close(in_pipe[1]);
        ::close(out_pipe[0]); ::close(out_pipe[1]);
        if (err) *err = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (child == 0) {
        // stdin/stdout are the channel; stderr stays for diagnostics
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);

        // long-lived process: no CPU limit
        ProcLimits lim;
        lim.rlimit_cpu_sec = 0;
        proc_child_isolate(lim);
        if (!env_dir.empty()) ::setenv("CONJURE_WORKER_ENV_DIR", env_dir.c_str(), 1);

        ::execvp(cargv[0], cargv.data());
        ::_exit(127);
    }

    // parent
    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    to_child_ = in_pipe[1];
    from_child_ = out_pipe[0];
    pid_ = child;
    ::setpgid(child, child);  // mirror the child's setpgid

    int flags = ::fcntl(from_child_, F_GETFL, 0);
    if (flags >= 0) ::fcntl(from_child_, F_SETFL, flags | O_NONBLOCK);
    pending_.clear();
    return true;
}

bool SubprocessWorkerExecutor::alive() {
    if (pid_ <= 0) return false;
    int st = 0;
    pid_t w = ::waitpid(pid_, &st, WNOHANG);
    if (w == pid_) {
        pid_ = -1;
        close_fds();
        return false;
    }
    return true;
}

std::string SubprocessWorkerExecutor::read_line(int timeout_ms) {
    const auto t0 = std::chrono::steady_clock::now();
    while (true) {
        auto nl = pending_.find('\n');
        if (nl != std::string::npos) {
            std::string line = pending_.substr(0, nl);
            pending_.erase(0, nl + 1);
            return line;
        }

        char buf[8192];
        ssize_t n = ::read(from_child_, buf, sizeof(buf));
        if (n > 0) {
            if (pending_.size() + (size_t)n > MAX_RESPONSE_BYTES) {
                throw Error("worker_crash", "worker response exceeds " + std::to_string(MAX_RESPONSE_BYTES) + " bytes");
            }
            pending_.append(buf, (size_t)n);
            continue;
        }
        if (n == 0) throw Error("worker_crash", "worker exited without response");
        if (n == -1 && errno == EINTR) continue;
        if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            int elapsed = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - t0).count();
            if (timeout_ms > 0 && elapsed >= timeout_ms) {
                throw Error("timeout", "worker timed out after " + std::to_string(timeout_ms) + "ms");
            }
            struct pollfd pfd;
            pfd.fd = from_child_;
            pfd.events = POLLIN;
            pfd.revents = 0;
            int remain = timeout_ms > 0 ? timeout_ms - elapsed : 1000;
            ::poll(&pfd, 1, std::min(remain, 100));
            continue;
        }
        throw Error("worker_crash", std::string("worker pipe failure: ") + std::strerror(errno));
    }
}

WorkerResponse SubprocessWorkerExecutor::execute(const WorkerRequest& req_in, int timeout_ms) {
    if (!alive()) throw Error("worker_crash", "worker is not running");

    WorkerRequest req = req_in;
    if (req.call_id.empty()) req.call_id = hash::random_hex(8);

    std::string line = encode_worker_request(req) + "\n";
    size_t off = 0;
    while (off < line.size()) {
        ssize_t n = ::write(to_child_, line.data() + off, line.size() - off);
        if (n > 0) { off += (size_t)n; continue; }
        if (n == -1 && errno == EINTR) continue;
        throw Error("worker_crash", std::string("worker pipe failure: ") + std::strerror(errno));
    }

    const std::string resp_line = read_line(timeout_ms);
    WorkerResponse resp;
    std::string err;
    if (!decode_worker_response(resp_line, &resp, &err)) {
        throw Error("worker_crash", "worker returned invalid JSON: " + err);
    }
    if (resp.call_id != req.call_id) throw Error("worker_crash", "worker returned mismatched call_id");
    if (resp.worker_pid == 0) resp.worker_pid = (int64_t)pid_;
    return resp;
}

void SubprocessWorkerExecutor::close_fds() {
    if (to_child_ >= 0) { ::close(to_child_); to_child_ = -1; }
    if (from_child_ >= 0) { ::close(from_child_); from_child_ = -1; }
    pending_.clear();
}

void SubprocessWorkerExecutor::shutdown() {
    if (to_child_ >= 0) {
        ssize_t wr = ::write(to_child_, "\n", 1);  // graceful shutdown request
        (void)wr;
        ::close(to_child_);
        to_child_ = -1;
    }
    if (pid_ > 0) {
        if (!wait_exit(pid_, 1000)) {
            ::killpg(pid_, SIGTERM);
            if (!wait_exit(pid_, 1000)) {
                ::killpg(pid_, SIGKILL);
                int st = 0;
                ::waitpid(pid_, &st, 0);
            }
        }
        pid_ = -1;
    }
    close_fds();
}

} // namespace conjure
