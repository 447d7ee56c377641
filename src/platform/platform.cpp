#include "platform.hpp"
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <thread>
#include <chrono>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <windows.h>
#else
#  include <csignal>
#  include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace platform {

fs::path home_dir() {
#ifdef _WIN32
    const char* home = std::getenv("USERPROFILE");
    if (!home) home = std::getenv("HOME");
#else
    const char* home = std::getenv("HOME");
#endif
    if (!home) return temp_dir();
    return fs::path(home);
}

fs::path temp_dir() {
    return fs::temp_directory_path();
}

// ── Interrupt handling ───────────────────────────────────────
// The signal handler only bumps a counter; a watcher thread invokes the
// registered handler so it may take locks and log.

namespace {

std::atomic<int> g_interrupts{0};
std::atomic<bool> g_watch{false};
std::mutex g_handler_mutex;
std::function<void()> g_handler;
std::thread g_watcher;

#ifdef _WIN32
BOOL WINAPI console_handler(DWORD type) {
    if (type == CTRL_C_EVENT || type == CTRL_BREAK_EVENT) {
        g_interrupts.fetch_add(1);
        return TRUE;
    }
    return FALSE;
}
#else
void sigint_handler(int) {
    g_interrupts.fetch_add(1);
}
#endif

void watch_loop() {
    int seen = g_interrupts.load();
    while (g_watch.load()) {
        int now = g_interrupts.load();
        if (now != seen) {
            seen = now;
            std::function<void()> handler;
            {
                std::lock_guard<std::mutex> lock(g_handler_mutex);
                handler = g_handler;
            }
            if (handler) handler();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

} // namespace

void on_interrupt(std::function<void()> handler) {
    {
        std::lock_guard<std::mutex> lock(g_handler_mutex);
        g_handler = std::move(handler);
    }
    if (g_watch.exchange(true)) return;

#ifdef _WIN32
    SetConsoleCtrlHandler(console_handler, TRUE);
#else
    struct sigaction sa {};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
#endif
    g_watcher = std::thread(watch_loop);
}

void remove_interrupt() {
    if (!g_watch.exchange(false)) return;
#ifdef _WIN32
    SetConsoleCtrlHandler(console_handler, FALSE);
#else
    std::signal(SIGINT, SIG_DFL);
#endif
    if (g_watcher.joinable()) g_watcher.join();
    std::lock_guard<std::mutex> lock(g_handler_mutex);
    g_handler = nullptr;
}

} // namespace platform
