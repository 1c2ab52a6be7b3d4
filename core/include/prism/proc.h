#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace prism {

struct ProcLimits {
    int timeout_ms{5000};
    size_t stdout_max_bytes{64 * 1024};

    int rlimit_cpu_sec{5};          // CPU time seconds
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{10};     // max file size MB
    int rlimit_nofile{64};          // max open fds

    bool no_new_privs{true};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output; // stdout+stderr merged
    std::string error;  // internal runner error, not child stderr
};

// Run a process (argv[0] is executable), capture stdout+stderr (merged),
// enforce timeout and rlimits (POSIX best-effort). Returns true if process started.
bool proc_run_capture(const std::vector<std::string>& argv,
                      const std::string& cwd,
                      const ProcLimits& lim,
                      ProcResult* res);

} // namespace prism
