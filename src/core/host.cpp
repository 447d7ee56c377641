#include "host.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

HostSpec::HostSpec(const char* e) : HostSpec(std::string(e)) {}

HostSpec::HostSpec(const std::string& e) {
    auto parsed = parse_host(e);
    if (parsed.is_ok()) {
        *this = std::move(parsed.value);
    } else {
        // Unparseable entries still get a slot; connecting will fail for them.
        entry = e;
        host = e;
    }
}

std::string HostSpec::pretty() const {
    std::string out = user ? *user + "@" + host : host;
    if (port) out += ":" + std::to_string(*port);
    return out;
}

static Result<int> parse_port(const std::string& s, const std::string& entry) {
    int port = safe_stoi(s, -1);
    if (port < 1 || port > 65535) {
        return Result<int>::Err(fmt::format("Bad port in host entry \"{}\"", entry));
    }
    return Result<int>::Ok(port);
}

Result<HostSpec> parse_host(const std::string& entry) {
    HostSpec spec;
    spec.entry = entry;

    std::string rest = entry;
    auto at = rest.find('@');
    if (at != std::string::npos) {
        spec.user = rest.substr(0, at);
        rest = rest.substr(at + 1);
        if (spec.user->empty()) {
            return Result<HostSpec>::Err(fmt::format("Empty user in host entry \"{}\"", entry));
        }
    }

    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos) {
            return Result<HostSpec>::Err(fmt::format("Unterminated '[' in host entry \"{}\"", entry));
        }
        spec.host = rest.substr(1, close - 1);
        std::string tail = rest.substr(close + 1);
        if (!tail.empty()) {
            if (tail[0] != ':') {
                return Result<HostSpec>::Err(fmt::format("Bad host entry \"{}\"", entry));
            }
            auto port = parse_port(tail.substr(1), entry);
            if (port.is_err()) return Result<HostSpec>::Err(port.error);
            spec.port = port.value;
        }
    } else {
        auto colon = rest.rfind(':');
        // More than one colon without brackets is a bare IPv6 address.
        if (colon != std::string::npos && rest.find(':') == colon) {
            auto port = parse_port(rest.substr(colon + 1), entry);
            if (port.is_err()) return Result<HostSpec>::Err(port.error);
            spec.port = port.value;
            rest = rest.substr(0, colon);
        }
        spec.host = rest;
    }

    if (spec.host.empty()) {
        return Result<HostSpec>::Err(fmt::format("Empty host name in \"{}\"", entry));
    }
    return Result<HostSpec>::Ok(std::move(spec));
}

Result<HostSpec> parse_host_entry(const std::string& line) {
    std::istringstream in(line);
    std::vector<std::string> fields;
    std::string field;
    while (in >> field) fields.push_back(field);

    if (fields.empty() || fields.size() > 2) {
        return Result<HostSpec>::Err(fmt::format(
            "Bad line: \"{}\". Format should be [user@]host[:port] [user]", line));
    }

    auto spec = parse_host(fields[0]);
    if (spec.is_err()) return spec;

    if (fields.size() == 2) {
        if (spec.value.user) {
            return Result<HostSpec>::Err(fmt::format("User specified twice in line: \"{}\"", line));
        }
        spec.value.user = fields[1];
    }
    return spec;
}

Result<std::vector<HostSpec>> parse_host_string(const std::string& hosts) {
    std::istringstream in(hosts);
    std::vector<HostSpec> out;
    std::string entry;
    while (in >> entry) {
        auto spec = parse_host(entry);
        if (spec.is_err()) return Result<std::vector<HostSpec>>::Err(spec.error);
        out.push_back(std::move(spec.value));
    }
    return Result<std::vector<HostSpec>>::Ok(std::move(out));
}

Result<std::vector<HostSpec>> read_host_file(const fs::path& path, StatusCallback warn) {
    std::ifstream in(path);
    if (!in) {
        return Result<std::vector<HostSpec>>::Err("Cannot read host file: " + path.string());
    }

    std::vector<HostSpec> out;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        auto spec = parse_host_entry(line);
        if (spec.is_err()) {
            if (warn) warn(fmt::format("{}:{}: {}", path.string(), lineno, spec.error));
            continue;
        }
        out.push_back(std::move(spec.value));
    }
    return Result<std::vector<HostSpec>>::Ok(std::move(out));
}

Result<std::vector<HostSpec>> read_host_files(const std::vector<fs::path>& paths,
                                              StatusCallback warn) {
    std::vector<HostSpec> out;
    for (const auto& p : paths) {
        auto hosts = read_host_file(p, warn);
        if (hosts.is_err()) return hosts;
        out.insert(out.end(), hosts.value.begin(), hosts.value.end());
    }
    return Result<std::vector<HostSpec>>::Ok(std::move(out));
}
