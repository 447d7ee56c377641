#pragma once

#include <string>
#include <ctime>

// Local login name from the environment (USER, then LOGNAME). Empty if neither is set.
std::string local_username();

// Wall clock time of day as HH:MM:SS.
std::string now_clock();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Expand a leading "~/" to the user's home directory.
std::string expand_tilde(const std::string& path);

// Replace every "{host}" in tpl with host.
std::string expand_host_template(const std::string& tpl, const std::string& host);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
