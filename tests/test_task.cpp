#include <gtest/gtest.h>
#include <dispatch/task.hpp>
#include <set>

TEST(MakeTasks, OneTaskPerHostInOrder) {
    auto tasks = make_tasks({"web1", "web2", "root@db1:2222"}, ActionKind::CALL);
    ASSERT_EQ(tasks.size(), 3u);
    for (size_t i = 0; i < tasks.size(); ++i) {
        EXPECT_EQ(tasks[i].index, i);
        EXPECT_EQ(tasks[i].kind, ActionKind::CALL);
    }
    EXPECT_EQ(tasks[0].key, "web1");
    EXPECT_EQ(tasks[2].key, "root@db1:2222");
    EXPECT_EQ(tasks[2].host.host, "db1");
}

TEST(MakeTasks, DuplicatesGetSuffixes) {
    auto tasks = make_tasks({"a", "b", "a", "a"}, ActionKind::COPY);
    ASSERT_EQ(tasks.size(), 4u);
    EXPECT_EQ(tasks[0].key, "a");
    EXPECT_EQ(tasks[1].key, "b");
    EXPECT_EQ(tasks[2].key, "a.1");
    EXPECT_EQ(tasks[3].key, "a.2");
    EXPECT_EQ(tasks[3].host.host, "a");
}

TEST(MakeTasks, SuffixSkipsSuppliedEntries) {
    auto tasks = make_tasks({"a", "a", "a.1"}, ActionKind::SLURP);
    std::set<std::string> keys;
    for (const auto& t : tasks) keys.insert(t.key);
    EXPECT_EQ(keys.size(), 3u);
    EXPECT_EQ(tasks[0].key, "a");
    EXPECT_EQ(tasks[1].key, "a.2");
    EXPECT_EQ(tasks[2].key, "a.1");
}

TEST(MakeTasks, Empty) {
    EXPECT_TRUE(make_tasks({}, ActionKind::CALL).empty());
}

TEST(ActionKind, Names) {
    EXPECT_STREQ(action_kind_name(ActionKind::CALL), "call");
    EXPECT_STREQ(action_kind_name(ActionKind::COPY), "copy");
    EXPECT_STREQ(action_kind_name(ActionKind::SLURP), "slurp");
}
