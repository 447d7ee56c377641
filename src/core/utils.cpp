#include "utils.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

std::string local_username() {
    const char* user = std::getenv("USER");
    if (!user || !*user) user = std::getenv("LOGNAME");
    return user ? std::string(user) : std::string();
}

std::string now_clock() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[16];
    std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string expand_tilde(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.size() >= 2 && path[0] == '~' && path[1] == '/') {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

std::string expand_host_template(const std::string& tpl, const std::string& host) {
    const std::string placeholder = HOST_PLACEHOLDER;
    std::string out;
    out.reserve(tpl.size());
    size_t pos = 0;
    while (true) {
        size_t hit = tpl.find(placeholder, pos);
        if (hit == std::string::npos) {
            out.append(tpl, pos, std::string::npos);
            break;
        }
        out.append(tpl, pos, hit - pos);
        out += host;
        pos = hit + placeholder.size();
    }
    return out;
}
