#include "worker_pool.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

using Clock = std::chrono::steady_clock;

// ── TaskContext ──────────────────────────────────────────────

namespace {

// A timeout too large to add to started is the same as none.
bool fits_deadline(Clock::time_point started, std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) return false;
    auto room = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::time_point::max() - started);
    return timeout < room;
}

} // namespace

TaskContext::TaskContext(Clock::time_point started, std::chrono::milliseconds timeout)
    : started_(started),
      deadline_(fits_deadline(started, timeout) ? started + timeout : Clock::time_point::max()),
      has_deadline_(fits_deadline(started, timeout)) {
}

bool TaskContext::commit() {
    State expected = State::RUNNING;
    return state_.compare_exchange_strong(expected, State::COMMITTED);
}

bool TaskContext::abort() {
    State expected = State::RUNNING;
    return state_.compare_exchange_strong(expected, State::ABORTED);
}

std::chrono::milliseconds TaskContext::elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
}

// ── WorkerPool ───────────────────────────────────────────────

WorkerPool::WorkerPool(PoolOptions options)
    : options_(std::move(options)) {
    if (options_.concurrency < 1) options_.concurrency = 1;
}

WorkerPool::~WorkerPool() = default;

void WorkerPool::run(size_t count, const Work& work, const Abort& on_abort) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.clear();
        running_.clear();
        contexts_.clear();
        contexts_.resize(count);
        for (size_t i = 0; i < count; ++i) pending_.push_back(i);
        cancel_requested_ = false;
        cancel_handled_ = false;
        stop_ = false;
        active_ = 0;
        peak_active_ = 0;
    }
    if (count == 0) return;

    uint64_t hook = options_.cancel.subscribe([this] {
        std::lock_guard<std::mutex> lock(mutex_);
        cancel_requested_ = true;
        cv_.notify_all();
    });

    std::thread watchdog(&WorkerPool::watchdog_loop, this, std::cref(on_abort));

    size_t nworkers = std::min(count, static_cast<size_t>(options_.concurrency));
    std::vector<std::thread> workers;
    workers.reserve(nworkers);
    for (size_t i = 0; i < nworkers; ++i) {
        workers.emplace_back(&WorkerPool::worker_loop, this, std::cref(work), std::cref(on_abort));
    }
    for (auto& t : workers) t.join();

    options_.cancel.unsubscribe(hook);

    // Workers stop picking up tasks once the batch is cancelled; anything
    // still pending was never started.
    for (size_t index : drain_pending()) {
        on_abort(index, ErrorKind::CANCELLED, "batch cancelled before this host started");
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        cv_.notify_all();
    }
    watchdog.join();

    fanout_log(fmt::format("pool: {} tasks done, peak concurrency {}/{}",
                           count, peak_active_.load(), options_.concurrency));
}

std::deque<size_t> WorkerPool::drain_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::deque<size_t> dropped;
    dropped.swap(pending_);
    return dropped;
}

void WorkerPool::worker_loop(const Work& work, const Abort& on_abort) {
    while (true) {
        size_t index;
        TaskContext* ctx;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pending_.empty() || cancel_requested_) return;
            index = pending_.front();
            pending_.pop_front();

            contexts_[index] = std::make_unique<TaskContext>(Clock::now(), options_.timeout);
            ctx = contexts_[index].get();
            running_.insert(index);
            ++active_;
            peak_active_ = std::max(peak_active_.load(), active_);
            cv_.notify_all();
        }

        execute(index, *ctx, work, on_abort);

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_.erase(index);
            --active_;
        }
    }
}

void WorkerPool::execute(size_t index, TaskContext& ctx, const Work& work, const Abort& on_abort) {
    try {
        work(index, ctx);
    } catch (const std::exception& e) {
        if (ctx.commit()) {
            on_abort(index, ErrorKind::EXECUTION, fmt::format("unexpected failure: {}", e.what()));
        }
        return;
    } catch (...) {
        if (ctx.commit()) {
            on_abort(index, ErrorKind::EXECUTION, "unexpected failure (non-standard exception)");
        }
        return;
    }

    // Every task ends with exactly one recorded result.
    if (ctx.commit()) {
        on_abort(index, ErrorKind::EXECUTION, "task ended without a result");
    }
}

void WorkerPool::cancel_batch(std::unique_lock<std::mutex>& lock, const Abort& on_abort) {
    cancel_handled_ = true;
    std::deque<size_t> dropped;
    dropped.swap(pending_);
    std::vector<std::pair<size_t, TaskContext*>> inflight;
    for (size_t index : running_) {
        inflight.emplace_back(index, contexts_[index].get());
    }
    lock.unlock();

    fanout_log(fmt::format("pool: batch cancelled, {} pending dropped, {} in flight",
                           dropped.size(), inflight.size()));
    for (size_t index : dropped) {
        on_abort(index, ErrorKind::CANCELLED, "batch cancelled before this host started");
    }
    for (auto& [index, ctx] : inflight) {
        if (ctx->abort()) {
            ctx->token().cancel();
            on_abort(index, ErrorKind::CANCELLED, "batch cancelled while running");
        }
    }

    lock.lock();
}

void WorkerPool::watchdog_loop(const Abort& on_abort) {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!stop_) {
        if (cancel_requested_ && !cancel_handled_) {
            cancel_batch(lock, on_abort);
            continue;
        }

        auto now = Clock::now();
        auto next = Clock::time_point::max();
        std::vector<std::pair<size_t, TaskContext*>> expired;
        for (size_t index : running_) {
            TaskContext* ctx = contexts_[index].get();
            if (!ctx->has_deadline_ || ctx->fired_) continue;
            if (now >= ctx->deadline_) {
                ctx->fired_ = true;
                expired.emplace_back(index, ctx);
            } else {
                next = std::min(next, ctx->deadline_);
            }
        }

        if (!expired.empty()) {
            lock.unlock();
            for (auto& [index, ctx] : expired) {
                // A task that committed just before the deadline keeps its result.
                if (!ctx->abort()) continue;
                ctx->token().cancel();
                auto limit = options_.timeout.count();
                fanout_log(fmt::format("pool: task {} timed out after {}ms", index, limit));
                on_abort(index, ErrorKind::TIMEOUT,
                         fmt::format("timed out after {:.1f}s", static_cast<double>(limit) / 1000.0));
            }
            lock.lock();
            continue;
        }

        if (next == Clock::time_point::max()) {
            cv_.wait_for(lock, std::chrono::milliseconds(WATCHDOG_IDLE_MS));
        } else {
            cv_.wait_until(lock, next);
        }
    }
}
