#pragma once

#include <string>
#include <vector>

namespace conjure {

struct ProcLimits {
    int timeout_ms{2000};
    size_t stdout_max_bytes{1024 * 1024};

    int rlimit_cpu_sec{0};          // 0 = unlimited
    size_t rlimit_as_mb{0};         // virtual memory MB, 0 = unlimited
    size_t rlimit_fsize_mb{64};     // max file size MB
    int rlimit_nofile{256};         // max open fds

    bool no_new_privs{true};

    // false: stderr goes to /dev/null and output holds stdout only.
    bool merge_stderr{true};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout (+stderr when merged)
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is executable), capture its output, enforce timeout
// and rlimits. The child gets its own process group; a timeout kills the group.
// Returns true if the process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

// Same, feeding stdin_data to the child (interleaved with output reads).
// The process must ignore SIGPIPE so a child that exits early reads as EPIPE.
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// CONJURE_PROC_WRAPPER (e.g. bwrap/firejail argv) prepended to argv when
// CONJURE_PROC_WRAPPER_ENABLE is set.
std::vector<std::string> proc_wrapped_argv(const std::vector<std::string>& argv);

// Applies the child-side isolation (setpgid, umask, fd cleanup, loader env
// scrub, no_new_privs, PDEATHSIG, rlimits). Call between fork and exec.
void proc_child_isolate(const ProcLimits& lim);

// Split a command string into argv tokens. Supports single/double quotes and
// backslash escaping inside double quotes. Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace conjure
