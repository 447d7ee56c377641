#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/host.hpp>
#include <core/types.hpp>
#include <dispatch/aggregator.hpp>
#include <dispatch/cancel.hpp>

enum class OutputMode {
    BUFFERED,   // keep full stdout/stderr in each Call outcome
    STREAMED,   // hand chunks to on_output as they arrive, keep nothing
};

using OutputCallback = std::function<void(const std::string& host, StreamKind stream,
                                          const char* data, size_t len)>;

// Batch configuration. Built once by the caller and read-only for the
// lifetime of the batch; every worker shares the same instance.
struct Options {
    // ── Batch ──
    int concurrency = DEFAULT_CONCURRENCY;
    std::chrono::milliseconds timeout{DEFAULT_TIMEOUT_SECS * 1000};             // 0 = no deadline
    std::chrono::milliseconds connect_timeout{DEFAULT_CONNECT_TIMEOUT_SECS * 1000};
    CancelToken cancel;                     // cancel() aborts the whole batch
    ProgressCallback on_finished;           // once per host, serialized

    // ── Session ──
    std::string user;                       // empty = local login name
    int port = DEFAULT_SSH_PORT;
    std::optional<std::string> key_path;
    std::optional<std::string> password;
    bool use_agent = true;
    bool strict_host_keys = false;
    std::string known_hosts;

    // ── Call ──
    OutputMode output = OutputMode::BUFFERED;
    OutputCallback on_output;               // required for STREAMED
    std::string input;                      // sent to every command's stdin
    std::string outdir;                     // per-host stdout files
    std::string errdir;                     // per-host stderr files

    // ── Copy / Slurp ──
    bool recursive = false;
    bool create_dirs = true;
    std::string local_name;                 // slurp: name under each host directory
};

// Reject options no batch can run with. Empty string when valid.
std::string validate_options(const Options& options);

// Hosts must be non-empty and every entry must name a host.
std::string validate_hosts(const std::vector<HostSpec>& hosts);

// Batch options seeded from a loaded config. Callbacks, cancellation and
// per-operation fields are left at their defaults.
Options options_from_config(const Config& config);
