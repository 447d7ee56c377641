#include <gtest/gtest.h>
#include <core/utils.hpp>
#include <platform/platform.hpp>

TEST(Utils, SafeStoi) {
    EXPECT_EQ(safe_stoi("42"), 42);
    EXPECT_EQ(safe_stoi("-3"), -3);
    EXPECT_EQ(safe_stoi("", 7), 7);
    EXPECT_EQ(safe_stoi("12abc", 7), 7);
    EXPECT_EQ(safe_stoi("99999999999999", 7), 7);
}

TEST(Utils, Trim) {
    std::string s = "  \thello world\r\n";
    trim(s);
    EXPECT_EQ(s, "hello world");

    std::string blank = " \t ";
    trim(blank);
    EXPECT_EQ(blank, "");
}

TEST(Utils, ExpandTilde) {
    auto home = platform::home_dir().string();
    EXPECT_EQ(expand_tilde("~"), home);
    EXPECT_EQ(expand_tilde("~/x/y"), (platform::home_dir() / "x/y").string());
    EXPECT_EQ(expand_tilde("/etc/hosts"), "/etc/hosts");
    EXPECT_EQ(expand_tilde("~other/x"), "~other/x");
}

TEST(Utils, ExpandHostTemplate) {
    EXPECT_EQ(expand_host_template("/tmp/{host}/out", "web1"), "/tmp/web1/out");
    EXPECT_EQ(expand_host_template("{host}-{host}", "a"), "a-a");
    EXPECT_EQ(expand_host_template("plain", "a"), "plain");
}

TEST(Utils, NowClockShape) {
    auto s = now_clock();
    ASSERT_EQ(s.size(), 8u);
    EXPECT_EQ(s[2], ':');
    EXPECT_EQ(s[5], ':');
}
