#include <gtest/gtest.h>
#include <core/host.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(HostParse, PlainHost) {
    auto r = parse_host("web1");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.entry, "web1");
    EXPECT_EQ(r.value.host, "web1");
    EXPECT_FALSE(r.value.user.has_value());
    EXPECT_FALSE(r.value.port.has_value());
}

TEST(HostParse, UserHostPort) {
    auto r = parse_host("root@db1:2222");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.entry, "root@db1:2222");
    EXPECT_EQ(r.value.host, "db1");
    EXPECT_EQ(*r.value.user, "root");
    EXPECT_EQ(*r.value.port, 2222);
}

TEST(HostParse, BracketedIpv6WithPort) {
    auto r = parse_host("[fe80::1]:2200");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.host, "fe80::1");
    EXPECT_EQ(*r.value.port, 2200);
}

TEST(HostParse, BareIpv6HasNoPort) {
    auto r = parse_host("fe80::1");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.host, "fe80::1");
    EXPECT_FALSE(r.value.port.has_value());
}

TEST(HostParse, BadPort) {
    EXPECT_TRUE(parse_host("web1:http").is_err());
    EXPECT_TRUE(parse_host("web1:0").is_err());
    EXPECT_TRUE(parse_host("web1:70000").is_err());
}

TEST(HostParse, EmptyParts) {
    EXPECT_TRUE(parse_host("").is_err());
    EXPECT_TRUE(parse_host("@web1").is_err());
    EXPECT_TRUE(parse_host("deploy@").is_err());
}

TEST(HostParse, ImplicitConstruction) {
    HostSpec h = "alice@web2:23";
    EXPECT_EQ(h.entry, "alice@web2:23");
    EXPECT_EQ(h.host, "web2");
    EXPECT_EQ(h.pretty(), "alice@web2:23");

    // Unparseable strings keep their text so the batch still reports them.
    HostSpec bad = "web1:notaport";
    EXPECT_EQ(bad.entry, "web1:notaport");
    EXPECT_EQ(bad.host, "web1:notaport");
}

TEST(HostEntry, SecondFieldIsUser) {
    auto r = parse_host_entry("web1:2200 deploy");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.host, "web1");
    EXPECT_EQ(*r.value.port, 2200);
    EXPECT_EQ(*r.value.user, "deploy");
}

TEST(HostEntry, UserTwiceIsError) {
    auto r = parse_host_entry("root@web1 deploy");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("User specified twice"), std::string::npos);
}

TEST(HostEntry, TooManyFields) {
    auto r = parse_host_entry("web1 deploy extra");
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("Bad line"), std::string::npos);
}

TEST(HostString, SplitsOnWhitespace) {
    auto r = parse_host_string("  web1\tweb2\n root@web3:22 ");
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[0].host, "web1");
    EXPECT_EQ(r.value[1].host, "web2");
    EXPECT_EQ(*r.value[2].user, "root");
}

TEST(HostString, EmptyStringGivesNoHosts) {
    auto r = parse_host_string("   ");
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
}

class HostFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "fanout_host_file_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_file(const std::string& name, const std::string& content) {
        auto path = test_dir / name;
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(HostFileTest, SkipsCommentsAndBlankLines) {
    auto path = write_file("hosts", "# cluster\n\nweb1\n  web2 deploy  \n# web3\n");
    auto r = read_host_file(path);
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    EXPECT_EQ(r.value[0].host, "web1");
    EXPECT_EQ(*r.value[1].user, "deploy");
}

TEST_F(HostFileTest, BadLinesWarnAndAreSkipped) {
    auto path = write_file("hosts", "web1\nweb2 a b\nweb3\n");
    std::vector<std::string> warnings;
    auto r = read_host_file(path, [&](const std::string& w) { warnings.push_back(w); });
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 2u);
    ASSERT_EQ(warnings.size(), 1u);
    EXPECT_NE(warnings[0].find(":2:"), std::string::npos);
}

TEST_F(HostFileTest, MissingFileIsError) {
    auto r = read_host_file(test_dir / "nope");
    EXPECT_TRUE(r.is_err());
}

TEST_F(HostFileTest, MultipleFilesConcatenate) {
    auto a = write_file("a", "web1\n");
    auto b = write_file("b", "web2\nweb1\n");
    auto r = read_host_files({a, b});
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 3u);
    EXPECT_EQ(r.value[2].host, "web1");
}
