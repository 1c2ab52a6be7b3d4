#pragma once

// Governed operations for plugin code.
//
// Every function here asks the active InterceptionEngine for a decision
// before touching the filesystem, the network or the process table, and
// throws prism::AuthorizationDenied without side effects when denied.
// Called outside any PluginScope they behave like the plain primitives.

#include "prism/proc.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace prism::sdk {

// mode: r, w, a, r+, w+, a+ with an optional 'b'. Throws std::invalid_argument
// for other modes and std::runtime_error if the file cannot be opened.
std::fstream open_file(const std::filesystem::path& path, const std::string& mode);

std::string read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const std::string& data, bool append = false);

// Throws std::filesystem::filesystem_error on I/O failure.
void rename_file(const std::filesystem::path& from, const std::filesystem::path& to);
void remove_file(const std::filesystem::path& path);

// Connected TCP socket; the caller owns (and must close) the descriptor.
int connect_tcp(const std::string& host, int port);

// Runs argv under rlimits with merged stdout/stderr capture.
ProcResult run_process(const std::vector<std::string>& argv,
                       const std::string& cwd = "",
                       const ProcLimits& lim = ProcLimits{});

} // namespace prism::sdk
