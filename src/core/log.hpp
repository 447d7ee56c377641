#pragma once

#include <string>
#include <core/types.hpp>

// Debug log: timestamped lines appended to a file, shared by all worker threads.
// Default path is <temp>/fanout_debug.log.

std::string fanout_log_path();

// Redirect the log to path. An empty path restores the default.
void set_log_file(const std::string& path);

// Also echo every log line to stderr.
void set_log_verbose(bool verbose);

void fanout_log(const std::string& msg);

// Log a finished remote command (truncated output).
void fanout_log_exec(const std::string& host, const std::string& cmd, const SSHResult& r);
