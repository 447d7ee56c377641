#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <core/constants.hpp>
#include "cancel.hpp"
#include "error.hpp"

struct PoolOptions {
    int concurrency = DEFAULT_CONCURRENCY;
    std::chrono::milliseconds timeout{0};   // per task, 0 = no deadline
    CancelToken cancel;                     // batch-level abort
};

// Execution context owned by exactly one running task.
//
// The task's result is recorded by whichever side claims it first: the
// worker through commit() when the action returns, or the pool when the
// deadline passes or the batch is cancelled. The loser's result is dropped.
class TaskContext {
public:
    TaskContext(std::chrono::steady_clock::time_point started,
                std::chrono::milliseconds timeout);

    // Fired on timeout or batch cancellation. Actions hand it to the SSH
    // capability so blocking calls return promptly.
    CancelToken& token() { return token_; }

    // Claim the right to record a result. True at most once per task.
    bool commit();

    std::chrono::steady_clock::time_point started() const { return started_; }
    std::chrono::milliseconds elapsed() const;

private:
    friend class WorkerPool;

    enum class State { RUNNING, COMMITTED, ABORTED };

    bool abort();

    CancelToken token_;
    std::atomic<State> state_{State::RUNNING};
    std::chrono::steady_clock::time_point started_;
    std::chrono::steady_clock::time_point deadline_;
    bool has_deadline_;
    bool fired_ = false;    // guarded by WorkerPool::mutex_
};

// Bounded dispatcher: runs `count` tasks with at most `concurrency` of them
// active at once. Pending tasks start in index order as slots free up.
class WorkerPool {
public:
    using Work = std::function<void(size_t index, TaskContext& ctx)>;
    using Abort = std::function<void(size_t index, ErrorKind kind, const std::string& message)>;

    explicit WorkerPool(PoolOptions options);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Blocks until every task has ended. work() must call ctx.commit()
    // before recording its result; on_abort() records results the pool
    // decides itself (timeout, cancellation, escaped exceptions) and may be
    // called from the watchdog thread.
    void run(size_t count, const Work& work, const Abort& on_abort);

    // Highest number of simultaneously active tasks seen by the last run().
    int peak_active() const { return peak_active_; }

private:
    void worker_loop(const Work& work, const Abort& on_abort);
    void watchdog_loop(const Abort& on_abort);
    void execute(size_t index, TaskContext& ctx, const Work& work, const Abort& on_abort);
    void cancel_batch(std::unique_lock<std::mutex>& lock, const Abort& on_abort);
    std::deque<size_t> drain_pending();

    PoolOptions options_;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<size_t> pending_;
    std::set<size_t> running_;
    std::vector<std::unique_ptr<TaskContext>> contexts_;
    bool cancel_requested_ = false;
    bool cancel_handled_ = false;
    bool stop_ = false;
    int active_ = 0;
    std::atomic<int> peak_active_{0};
};
