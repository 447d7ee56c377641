#include "log.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
std::string g_log_path;
std::atomic<bool> g_verbose{false};

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

} // namespace

std::string fanout_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_path.empty()) {
        g_log_path = (platform::temp_dir() / DEFAULT_LOG_NAME).string();
    }
    return g_log_path;
}

void set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_log_path = path;
}

void set_log_verbose(bool verbose) {
    g_verbose = verbose;
}

void fanout_log(const std::string& msg) {
    std::string path = fanout_log_path();
    std::string line = fmt::format("[{}] {}", timestamp(), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_verbose) {
        std::cerr << line << "\n";
    }
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << line << "\n";
}

void fanout_log_exec(const std::string& host, const std::string& cmd, const SSHResult& r) {
    fanout_log(fmt::format("{} CMD: {}", host, cmd));
    fanout_log(fmt::format("{} exit={} stdout({})={}", host, r.exit_code,
                           r.stdout_data.size(), r.stdout_data.substr(0, 500)));
    if (!r.stderr_data.empty())
        fanout_log(fmt::format("{} stderr={}", host, r.stderr_data.substr(0, 500)));
}
