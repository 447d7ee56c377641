#include <gtest/gtest.h>
#include <dispatch/aggregator.hpp>
#include <dispatch/dispatch.hpp>
#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

static std::vector<HostSpec> numbered_hosts(size_t n) {
    std::vector<HostSpec> hosts;
    for (size_t i = 0; i < n; ++i) hosts.emplace_back("host" + std::to_string(i));
    return hosts;
}

TEST(ResultAggregator, FinishFillsMissingSlots) {
    auto tasks = make_tasks({"a", "b", "c"}, ActionKind::CALL);
    ResultAggregator<std::string> agg(tasks);
    agg.insert(1, HostResult<std::string>::Ok("/tmp/b"));

    auto results = agg.finish();
    ASSERT_EQ(results.size(), 3u);
    EXPECT_TRUE(results.at("b").is_ok());
    EXPECT_EQ(results.at("b").value(), "/tmp/b");
    ASSERT_TRUE(results.at("a").is_err());
    EXPECT_EQ(results.at("a").kind(), ErrorKind::CANCELLED);
    EXPECT_EQ(results.at("a").error().host, "a");
    EXPECT_EQ(results.at("c").kind(), ErrorKind::CANCELLED);
}

TEST(ResultAggregator, EachSlotIsWrittenOnce) {
    auto tasks = make_tasks({"a"}, ActionKind::CALL);
    ResultAggregator<std::string> agg(tasks);
    EXPECT_TRUE(agg.insert(0, HostResult<std::string>::Ok("first")));
    EXPECT_FALSE(agg.insert(0, HostResult<std::string>::Ok("second")));
    EXPECT_FALSE(agg.insert(5, HostResult<std::string>::Ok("out of range")));

    auto results = agg.finish();
    EXPECT_EQ(results.at("a").value(), "first");
}

TEST(ResultAggregator, ConcurrentInsertsLoseNothing) {
    const size_t per_thread = 200;
    const size_t threads = 8;
    auto tasks = make_tasks(numbered_hosts(per_thread * threads), ActionKind::CALL);
    ResultAggregator<std::string> agg(tasks);

    std::vector<std::thread> workers;
    for (size_t t = 0; t < threads; ++t) {
        workers.emplace_back([&, t] {
            for (size_t i = t; i < tasks.size(); i += threads) {
                agg.insert(i, HostResult<std::string>::Ok(tasks[i].key));
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(agg.filled(), tasks.size());
    auto results = agg.finish();
    ASSERT_EQ(results.size(), tasks.size());
    for (const auto& kv : results) {
        ASSERT_TRUE(kv.second.is_ok());
        EXPECT_EQ(kv.second.value(), kv.first);
    }
}

TEST(ResultAggregator, ProgressIsSerializedAndOrdered) {
    auto tasks = make_tasks(numbered_hosts(64), ActionKind::CALL);
    std::vector<size_t> ordinals;
    std::atomic<int> inside{0};
    bool overlapped = false;

    ResultAggregator<SSHResult> agg(tasks, [&](const ProgressEvent& e) {
        if (++inside > 1) overlapped = true;
        ordinals.push_back(e.n);
        EXPECT_EQ(e.total, 64u);
        if (e.ok) {
            ASSERT_NE(e.output, nullptr);
            EXPECT_EQ(e.output->stdout_data, "out");
        } else {
            EXPECT_EQ(e.kind, ErrorKind::AUTHENTICATION);
            EXPECT_NE(e.error.find("AuthenticationError"), std::string::npos);
        }
        --inside;
    });

    std::vector<std::thread> workers;
    for (size_t t = 0; t < 4; ++t) {
        workers.emplace_back([&, t] {
            for (size_t i = t; i < tasks.size(); i += 4) {
                if (i % 5 == 0) {
                    agg.insert(i, HostResult<SSHResult>::Err(
                        HostError{tasks[i].key, ErrorKind::AUTHENTICATION, "denied", ""}));
                } else {
                    agg.insert(i, HostResult<SSHResult>::Ok(SSHResult{0, "out", ""}));
                }
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_FALSE(overlapped);
    ASSERT_EQ(ordinals.size(), 64u);
    for (size_t i = 0; i < ordinals.size(); ++i) {
        EXPECT_EQ(ordinals[i], i + 1);
    }
}

TEST(ResultAggregator, PathOutcomeInProgress) {
    auto tasks = make_tasks({"a"}, ActionKind::COPY);
    std::string seen;
    ResultAggregator<std::string> agg(tasks, [&](const ProgressEvent& e) { seen = e.path; });
    agg.insert(0, HostResult<std::string>::Ok("/srv/a.txt"));
    EXPECT_EQ(seen, "/srv/a.txt");
}

TEST(ResultAggregator, ThrowingProgressCallbackIsContained) {
    auto tasks = make_tasks({"a", "b"}, ActionKind::COPY);
    int calls = 0;
    ResultAggregator<std::string> agg(tasks, [&](const ProgressEvent&) {
        ++calls;
        throw std::runtime_error("terminal closed");
    });

    bool inserted = false;
    EXPECT_NO_THROW(inserted = agg.insert(0, HostResult<std::string>::Ok("/srv/a")));
    EXPECT_TRUE(inserted);
    EXPECT_NO_THROW(inserted = agg.insert(1, HostResult<std::string>::Ok("/srv/b")));
    EXPECT_TRUE(inserted);
    EXPECT_EQ(calls, 2);

    auto results = agg.finish();
    EXPECT_EQ(results.at("a").value(), "/srv/a");
    EXPECT_EQ(results.at("b").value(), "/srv/b");
}

TEST(Dispatch, OneEntryPerTask) {
    auto tasks = make_tasks({"a", "b", "a"}, ActionKind::CALL);
    PoolOptions pool;
    pool.concurrency = 2;

    HostAction<std::string> action = [](const Task& task, TaskContext&) {
        if (task.key == "b") {
            return HostResult<std::string>::Err(
                HostError{task.key, ErrorKind::CONNECTION, "refused", ""});
        }
        return HostResult<std::string>::Ok(task.host.host);
    };

    auto results = dispatch(tasks, pool, action);
    ASSERT_EQ(results.size(), 3u);
    EXPECT_EQ(results.at("a").value(), "a");
    EXPECT_EQ(results.at("a.1").value(), "a");
    EXPECT_EQ(results.at("b").kind(), ErrorKind::CONNECTION);
}

TEST(HostError, WhatIncludesKindAndDetail) {
    HostError e{"web1", ErrorKind::EXECUTION, "killed by signal KILL", "oom"};
    EXPECT_EQ(e.what(), "ExecutionError: killed by signal KILL, Error output: oom");
    HostError plain{"web1", ErrorKind::TIMEOUT, "timed out after 1.0s", ""};
    EXPECT_EQ(plain.what(), "Timeout: timed out after 1.0s");
}
