#include "cancel.hpp"
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <utility>
#include <vector>

struct CancelToken::State {
    std::atomic<bool> cancelled{false};
    std::mutex mutex;
    std::condition_variable idle;
    std::vector<std::pair<uint64_t, Hook>> hooks;
    uint64_t next_id = 1;
    uint64_t running_id = 0;          // hook currently executing, 0 if none
    std::thread::id runner;
};

CancelToken::CancelToken() : state_(std::make_shared<State>()) {}

void CancelToken::cancel() {
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);
    if (s.cancelled.exchange(true)) return;
    s.runner = std::this_thread::get_id();

    // Hooks run without the lock so they may call back into the token.
    // unsubscribe() waits on running_id to avoid returning mid-hook.
    while (!s.hooks.empty()) {
        auto entry = std::move(s.hooks.front());
        s.hooks.erase(s.hooks.begin());
        s.running_id = entry.first;
        lock.unlock();
        entry.second();
        lock.lock();
        s.running_id = 0;
        s.idle.notify_all();
    }
}

bool CancelToken::cancelled() const {
    return state_->cancelled.load();
}

uint64_t CancelToken::subscribe(Hook hook) {
    auto& s = *state_;
    {
        std::lock_guard<std::mutex> lock(s.mutex);
        if (!s.cancelled) {
            uint64_t id = s.next_id++;
            s.hooks.emplace_back(id, std::move(hook));
            return id;
        }
    }
    hook();
    return 0;
}

void CancelToken::unsubscribe(uint64_t id) {
    if (id == 0) return;
    auto& s = *state_;
    std::unique_lock<std::mutex> lock(s.mutex);
    for (auto it = s.hooks.begin(); it != s.hooks.end(); ++it) {
        if (it->first == id) {
            s.hooks.erase(it);
            return;
        }
    }
    if (s.runner == std::this_thread::get_id()) return;
    s.idle.wait(lock, [&] { return s.running_id != id; });
}
