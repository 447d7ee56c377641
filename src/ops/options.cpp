#include "options.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <filesystem>

std::string validate_options(const Options& options) {
    if (options.concurrency < 1) {
        return fmt::format("concurrency must be at least 1 (got {})", options.concurrency);
    }
    if (options.timeout.count() < 0) {
        return "timeout must not be negative";
    }
    if (options.connect_timeout.count() < 0) {
        return "connect timeout must not be negative";
    }
    if (options.port < 1 || options.port > 65535) {
        return fmt::format("invalid port {}", options.port);
    }
    if (options.output == OutputMode::STREAMED && !options.on_output) {
        return "streamed output needs an output callback";
    }
    if (!options.local_name.empty() && std::filesystem::path(options.local_name).is_absolute()) {
        return fmt::format("local name must be relative: {}", options.local_name);
    }
    return "";
}

std::string validate_hosts(const std::vector<HostSpec>& hosts) {
    if (hosts.empty()) return "no hosts given";
    for (const auto& h : hosts) {
        if (h.host.empty()) {
            return fmt::format("invalid host entry '{}'", h.entry);
        }
        if (h.port && (*h.port < 1 || *h.port > 65535)) {
            return fmt::format("invalid port in host entry '{}'", h.entry);
        }
    }
    return "";
}

Options options_from_config(const Config& config) {
    const ConfigDefaults& defaults = config.defaults();
    Options options;
    options.user = defaults.user;
    options.port = defaults.port;
    options.concurrency = defaults.concurrency;
    options.timeout = std::chrono::seconds(defaults.timeout);
    options.connect_timeout = std::chrono::seconds(defaults.connect_timeout);
    if (defaults.key) options.key_path = expand_tilde(*defaults.key);
    options.strict_host_keys = defaults.strict_host_keys;
    options.known_hosts = defaults.known_hosts.empty() ? "" : expand_tilde(defaults.known_hosts);
    options.outdir = expand_tilde(defaults.outdir);
    options.errdir = expand_tilde(defaults.errdir);
    return options;
}
