#pragma once

#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <core/log.hpp>
#include <core/types.hpp>
#include <fmt/format.h>
#include "host_result.hpp"
#include "task.hpp"

// One host's entry has just been committed.
struct ProgressEvent {
    size_t n = 0;                       // completion ordinal, 1-based
    size_t total = 0;
    std::string host;                   // result key
    bool ok = false;
    ErrorKind kind = ErrorKind::EXECUTION;   // valid when !ok
    std::string error;                  // HostError::what() when !ok
    const SSHResult* output = nullptr;  // Call outcome, valid during the callback
    std::string path;                   // Copy/Slurp outcome
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

inline void describe_outcome(ProgressEvent& event, const SSHResult& outcome) {
    event.output = &outcome;
}

inline void describe_outcome(ProgressEvent& event, const std::string& outcome) {
    event.path = outcome;
}

// Collects per-host results as workers finish. Each slot is written once;
// the slot lock is held for a single insert only. Progress callbacks are
// serialized and see completion ordinals in order. They may run on the
// pool's watchdog thread and must not block.
template <typename T>
class ResultAggregator {
public:
    explicit ResultAggregator(const std::vector<Task>& tasks, ProgressCallback progress = nullptr)
        : tasks_(tasks), slots_(tasks.size()), progress_(std::move(progress)) {}

    // False if the slot was already filled; the late result is dropped.
    bool insert(size_t index, HostResult<T> result) {
        std::unique_lock<std::mutex> progress_lock(progress_mutex_, std::defer_lock);
        if (progress_) progress_lock.lock();

        size_t n;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (index >= slots_.size() || slots_[index]) return false;
            slots_[index].emplace(std::move(result));
            n = ++filled_;
        }

        if (progress_) {
            const HostResult<T>& stored = *slots_[index];
            ProgressEvent event;
            event.n = n;
            event.total = slots_.size();
            event.host = tasks_[index].key;
            event.ok = stored.is_ok();
            if (stored.is_ok()) {
                describe_outcome(event, stored.value());
            } else {
                event.kind = stored.kind();
                event.error = stored.error().what();
            }
            // The result is already stored; a failing callback only loses
            // its own output.
            try {
                progress_(event);
            } catch (const std::exception& e) {
                fanout_log(fmt::format("progress callback failed for {}: {}", event.host, e.what()));
            } catch (...) {
                fanout_log(fmt::format("progress callback failed for {}: non-standard exception",
                                       event.host));
            }
        }
        return true;
    }

    size_t filled() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return filled_;
    }

    // Build the final map. Hosts that never reported are recorded as
    // cancelled, so the map always has one entry per task.
    BatchResult<T> finish() {
        std::lock_guard<std::mutex> lock(mutex_);
        BatchResult<T> out;
        for (size_t i = 0; i < slots_.size(); ++i) {
            const std::string& key = tasks_[i].key;
            if (slots_[i]) {
                out.emplace(key, std::move(*slots_[i]));
            } else {
                out.emplace(key, HostResult<T>::Err(
                    HostError{key, ErrorKind::CANCELLED, "never started", ""}));
            }
        }
        slots_.clear();
        return out;
    }

private:
    const std::vector<Task>& tasks_;
    std::vector<std::optional<HostResult<T>>> slots_;
    size_t filled_ = 0;
    mutable std::mutex mutex_;      // guards slots_ and filled_
    std::mutex progress_mutex_;     // serializes progress_ calls
    ProgressCallback progress_;
};
