#include "config.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

static bool truthy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

// A present key must convert; YAML::BadConversion propagates to the caller.
template <typename T>
static T get(const YAML::Node& node, const char* key, T fallback) {
    const YAML::Node value = node[key];
    if (!value || value.IsNull()) return fallback;
    return value.as<T>();
}

static ConfigDefaults parse_defaults(const YAML::Node& node) {
    ConfigDefaults d;
    if (!node || node.IsNull()) return d;
    if (!node.IsMap()) throw std::runtime_error("defaults must be a mapping");

    d.user = get<std::string>(node, "user", "");
    d.port = get<int>(node, "port", DEFAULT_SSH_PORT);
    d.concurrency = get<int>(node, "concurrency", DEFAULT_CONCURRENCY);
    d.timeout = get<int>(node, "timeout", DEFAULT_TIMEOUT_SECS);
    d.connect_timeout = get<int>(node, "connect_timeout", DEFAULT_CONNECT_TIMEOUT_SECS);
    std::string key = get<std::string>(node, "key", "");
    if (!key.empty()) d.key = key;
    d.strict_host_keys = get<bool>(node, "strict_host_keys", false);
    d.known_hosts = get<std::string>(node, "known_hosts", "");
    d.outdir = get<std::string>(node, "outdir", "");
    d.errdir = get<std::string>(node, "errdir", "");
    return d;
}

static Result<std::vector<HostSpec>> parse_hosts(const YAML::Node& node) {
    using R = Result<std::vector<HostSpec>>;
    std::vector<HostSpec> hosts;
    if (!node || node.IsNull()) return R::Ok(hosts);

    if (node.IsScalar()) {
        return parse_host_string(node.as<std::string>());
    }
    if (!node.IsSequence()) {
        return R::Err("hosts must be a list of host entries");
    }
    for (const auto& item : node) {
        auto parsed = parse_host(item.as<std::string>());
        if (parsed.is_err()) return R::Err(parsed.error);
        hosts.push_back(parsed.value);
    }
    return R::Ok(hosts);
}

Result<Config> Config::parse(const std::string& yaml) {
    try {
        YAML::Node root = YAML::Load(yaml);
        Config config;
        if (!root || root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap()) return Result<Config>::Err("config must be a mapping");

        config.defaults_ = parse_defaults(root["defaults"]);

        auto hosts = parse_hosts(root["hosts"]);
        if (hosts.is_err()) return Result<Config>::Err("Bad hosts in config: " + hosts.error);
        config.hosts_ = hosts.value;

        config.log_file_ = expand_tilde(get<std::string>(root, "log_file", ""));
        config.verbose_ = get<bool>(root, "verbose", false);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load() {
    return load(get_config_path());
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Cannot read config " + path.string());
    }
    std::stringstream buf;
    buf << in.rdbuf();

    auto config = parse(buf.str());
    if (config.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), config.error));
    }
    return config;
}

Result<void> Config::apply_env() {
    auto env = [](const char* name) -> std::optional<std::string> {
        const char* v = std::getenv(name);
        if (!v) return std::nullopt;
        return std::string(v);
    };

    if (auto v = env("FANOUT_HOSTS")) {
        auto hosts = parse_host_string(*v);
        if (hosts.is_err()) return Result<void>::Err("FANOUT_HOSTS: " + hosts.error);
        hosts_ = hosts.value;
    }
    if (auto v = env("FANOUT_USER")) {
        defaults_.user = *v;
    }
    if (auto v = env("FANOUT_PAR")) {
        int par = safe_stoi(*v, -1);
        if (par < 1) return Result<void>::Err("FANOUT_PAR must be a positive integer: " + *v);
        defaults_.concurrency = par;
    }
    if (auto v = env("FANOUT_TIMEOUT")) {
        int timeout = safe_stoi(*v, -1);
        if (timeout < 0) return Result<void>::Err("FANOUT_TIMEOUT must be a number of seconds: " + *v);
        defaults_.timeout = timeout;
    }
    if (auto v = env("FANOUT_OUTDIR")) {
        defaults_.outdir = *v;
    }
    if (auto v = env("FANOUT_ERRDIR")) {
        defaults_.errdir = *v;
    }
    if (auto v = env("FANOUT_VERBOSE")) {
        verbose_ = truthy(*v);
    }
    if (auto v = env("FANOUT_LOG")) {
        log_file_ = expand_tilde(*v);
    }
    return Result<void>::Ok();
}
