#pragma once

#include <functional>
#include <string>
#include <vector>
#include <core/log.hpp>
#include <fmt/format.h>
#include "aggregator.hpp"
#include "worker_pool.hpp"

// Per-host action. Runs on a worker thread; ctx.token() fires when the
// task times out or the batch is cancelled.
template <typename T>
using HostAction = std::function<HostResult<T>(const Task& task, TaskContext& ctx)>;

// Run action for every task under the pool's cap and deadline, and collect
// exactly one result per task.
template <typename T>
BatchResult<T> dispatch(const std::vector<Task>& tasks, PoolOptions pool_options,
                        const HostAction<T>& action, ProgressCallback progress = nullptr) {
    ResultAggregator<T> results(tasks, std::move(progress));
    WorkerPool pool(std::move(pool_options));

    pool.run(tasks.size(),
        [&](size_t index, TaskContext& ctx) {
            const Task& task = tasks[index];
            fanout_log(fmt::format("{} {}: started", action_kind_name(task.kind), task.key));

            HostResult<T> result = action(task, ctx);
            if (!ctx.commit()) {
                fanout_log(fmt::format("{} {}: late result dropped after {}ms",
                                       action_kind_name(task.kind), task.key, ctx.elapsed().count()));
                return;
            }
            fanout_log(fmt::format("{} {}: {} in {}ms", action_kind_name(task.kind), task.key,
                                   result.is_ok() ? "ok" : error_kind_name(result.kind()),
                                   ctx.elapsed().count()));
            results.insert(index, std::move(result));
        },
        [&](size_t index, ErrorKind kind, const std::string& message) {
            const Task& task = tasks[index];
            fanout_log(fmt::format("{} {}: {} ({})", action_kind_name(task.kind), task.key,
                                   error_kind_name(kind), message));
            results.insert(index, HostResult<T>::Err(HostError{task.key, kind, message, ""}));
        });

    return results.finish();
}
