#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "constants.hpp"
#include "host.hpp"
#include "types.hpp"

namespace fs = std::filesystem;

// Values under `defaults:` in the config file.
struct ConfigDefaults {
    std::string user;
    int port = DEFAULT_SSH_PORT;
    int concurrency = DEFAULT_CONCURRENCY;
    int timeout = DEFAULT_TIMEOUT_SECS;                  // seconds, 0 = none
    int connect_timeout = DEFAULT_CONNECT_TIMEOUT_SECS;  // seconds
    std::optional<std::string> key;
    bool strict_host_keys = false;
    std::string known_hosts;
    std::string outdir;
    std::string errdir;
};

class Config {
public:
    // Load ~/.fanout/config.yaml, or path. A missing file yields the defaults.
    static Result<Config> load();
    static Result<Config> load(const fs::path& path);

    // Parse YAML text directly.
    static Result<Config> parse(const std::string& yaml);

    // Overlay FANOUT_HOSTS, FANOUT_USER, FANOUT_PAR, FANOUT_TIMEOUT,
    // FANOUT_OUTDIR, FANOUT_ERRDIR, FANOUT_VERBOSE and FANOUT_LOG.
    Result<void> apply_env();

    const ConfigDefaults& defaults() const { return defaults_; }
    const std::vector<HostSpec>& hosts() const { return hosts_; }
    const std::string& log_file() const { return log_file_; }
    bool verbose() const { return verbose_; }

public:
    Config() = default;

private:
    ConfigDefaults defaults_;
    std::vector<HostSpec> hosts_;
    std::string log_file_;
    bool verbose_ = false;
};

fs::path get_config_dir();
fs::path get_config_path();
