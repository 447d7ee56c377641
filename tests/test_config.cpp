#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/utils.hpp>
#include <ops/options.hpp>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigEnvTest : public ::testing::Test {
protected:
    void SetUp() override { clear(); }
    void TearDown() override { clear(); }

    static void clear() {
        for (const char* name : {"FANOUT_HOSTS", "FANOUT_USER", "FANOUT_PAR", "FANOUT_TIMEOUT",
                                 "FANOUT_OUTDIR", "FANOUT_ERRDIR", "FANOUT_VERBOSE", "FANOUT_LOG"}) {
            unsetenv(name);
        }
    }
};

TEST(Config, EmptyTextGivesDefaults) {
    auto r = Config::parse("");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.defaults().concurrency, DEFAULT_CONCURRENCY);
    EXPECT_EQ(r.value.defaults().timeout, DEFAULT_TIMEOUT_SECS);
    EXPECT_TRUE(r.value.hosts().empty());
    EXPECT_FALSE(r.value.verbose());
}

TEST(Config, ParsesDefaultsAndHosts) {
    auto r = Config::parse(R"(
defaults:
  user: deploy
  port: 2222
  concurrency: 8
  timeout: 15
  connect_timeout: 3
  strict_host_keys: true
  outdir: /tmp/out
hosts:
  - web1
  - "root@db1:2200"
verbose: true
log_file: /tmp/fanout-test.log
)");
    ASSERT_TRUE(r.is_ok()) << r.error;
    const auto& d = r.value.defaults();
    EXPECT_EQ(d.user, "deploy");
    EXPECT_EQ(d.port, 2222);
    EXPECT_EQ(d.concurrency, 8);
    EXPECT_EQ(d.timeout, 15);
    EXPECT_EQ(d.connect_timeout, 3);
    EXPECT_TRUE(d.strict_host_keys);
    ASSERT_EQ(r.value.hosts().size(), 2u);
    EXPECT_EQ(r.value.hosts()[1].host, "db1");
    EXPECT_EQ(*r.value.hosts()[1].port, 2200);
    EXPECT_TRUE(r.value.verbose());
    EXPECT_EQ(r.value.log_file(), "/tmp/fanout-test.log");
}

TEST(Config, HostsAsString) {
    auto r = Config::parse("hosts: web1 web2 web3\n");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.hosts().size(), 3u);
}

TEST(Config, BadValuesAreErrors) {
    EXPECT_TRUE(Config::parse("defaults:\n  port: twenty\n").is_err());
    EXPECT_TRUE(Config::parse("hosts:\n  - web1:bad\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
    EXPECT_TRUE(Config::parse("defaults: [unclosed\n").is_err());
}

TEST(Config, SeedsBatchOptions) {
    auto r = Config::parse("defaults:\n  user: ops\n  concurrency: 4\n  timeout: 0\n  port: 2022\n"
                           "  connect_timeout: 5\n  key: ~/.ssh/deploy\n");
    ASSERT_TRUE(r.is_ok()) << r.error;
    Options o = options_from_config(r.value);
    EXPECT_EQ(o.user, "ops");
    EXPECT_EQ(o.concurrency, 4);
    EXPECT_EQ(o.timeout.count(), 0);
    EXPECT_EQ(o.connect_timeout, std::chrono::seconds(5));
    EXPECT_EQ(o.port, 2022);
    ASSERT_TRUE(o.key_path.has_value());
    EXPECT_EQ(*o.key_path, expand_tilde("~/.ssh/deploy"));
    EXPECT_FALSE(o.cancel.cancelled());
    EXPECT_EQ(validate_options(o), "");
}

TEST(Config, MissingFileIsNotAnError) {
    auto r = Config::load(fs::temp_directory_path() / "fanout_no_such_config.yaml");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.defaults().concurrency, DEFAULT_CONCURRENCY);
}

TEST(Config, LoadsFile) {
    auto path = fs::temp_directory_path() / "fanout_config_test.yaml";
    std::ofstream(path) << "defaults:\n  concurrency: 3\n";
    auto r = Config::load(path);
    fs::remove(path);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.defaults().concurrency, 3);
}

TEST_F(ConfigEnvTest, EnvironmentOverridesFile) {
    auto r = Config::parse("defaults:\n  user: ops\n  concurrency: 4\nhosts: [a, b]\n");
    ASSERT_TRUE(r.is_ok());
    Config config = r.value;

    setenv("FANOUT_HOSTS", "x y z", 1);
    setenv("FANOUT_USER", "admin", 1);
    setenv("FANOUT_PAR", "16", 1);
    setenv("FANOUT_TIMEOUT", "5", 1);
    setenv("FANOUT_VERBOSE", "yes", 1);
    ASSERT_TRUE(config.apply_env().is_ok());

    EXPECT_EQ(config.hosts().size(), 3u);
    EXPECT_EQ(config.defaults().user, "admin");
    EXPECT_EQ(config.defaults().concurrency, 16);
    EXPECT_EQ(config.defaults().timeout, 5);
    EXPECT_TRUE(config.verbose());
}

TEST_F(ConfigEnvTest, BadEnvironmentValues) {
    Config config;
    setenv("FANOUT_PAR", "zero", 1);
    EXPECT_TRUE(config.apply_env().is_err());
    unsetenv("FANOUT_PAR");

    setenv("FANOUT_TIMEOUT", "-1", 1);
    EXPECT_TRUE(config.apply_env().is_err());
}
