#pragma once

#include <optional>
#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

// One target host. `entry` is the string as the caller supplied it; the
// remaining fields are what was parsed out of it (or set programmatically).
struct HostSpec {
    std::string entry;
    std::string host;
    std::optional<int> port;
    std::optional<std::string> user;
    std::optional<std::string> key_path;

    HostSpec() = default;
    // Implicit so plain host strings can be passed where hosts are expected.
    HostSpec(const char* e);
    HostSpec(const std::string& e);

    // user@host:port, omitting parts that are not set
    std::string pretty() const;
};

// Parse "[user@]host[:port]". IPv6 literals take the "[addr]:port" form.
Result<HostSpec> parse_host(const std::string& entry);

// Parse one host file line: "[user@]host[:port] [user]".
Result<HostSpec> parse_host_entry(const std::string& line);

// Parse a whitespace separated list of "[user@]host[:port]" entries.
Result<std::vector<HostSpec>> parse_host_string(const std::string& hosts);

// Read a host file. Blank lines and lines starting with '#' are skipped;
// malformed lines are reported through warn and skipped.
Result<std::vector<HostSpec>> read_host_file(const std::filesystem::path& path,
                                             StatusCallback warn = nullptr);
Result<std::vector<HostSpec>> read_host_files(const std::vector<std::filesystem::path>& paths,
                                              StatusCallback warn = nullptr);
