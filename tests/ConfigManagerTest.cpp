#include <fstream>
#include <stdexcept>
#include <string>

#include "ConfigManager.hpp"

#include "gtest/gtest.h"

namespace {

std::string writeConfig(const std::string& name, const std::string& body)
{
    const std::string path = testing::TempDir() + name;
    std::ofstream f(path);
    f << body;
    return path;
}

} // namespace

TEST(ConfigManager, Defaults)
{
    ConfigManager cfg;
    EXPECT_TRUE(cfg.getLogPath().empty());
    EXPECT_TRUE(cfg.flushEachLine());
    EXPECT_FALSE(cfg.utf8());
    EXPECT_EQ(cfg.max_line_bytes(), 0u);
}

TEST(ConfigManager, LoadsAllKeys)
{
    const auto path = writeConfig("cfg_all.json", R"({
        "log_path": "/tmp/linefilter.log",
        "flush_each_line": false,
        "utf8": true,
        "max_line_bytes": "64KB"
    })");

    ConfigManager cfg;
    ASSERT_TRUE(cfg.loadFromFile(path));
    EXPECT_EQ(cfg.getLogPath(), "/tmp/linefilter.log");
    EXPECT_FALSE(cfg.flushEachLine());
    EXPECT_TRUE(cfg.utf8());
    EXPECT_EQ(cfg.max_line_bytes(), 64u * 1024u);
}

TEST(ConfigManager, EmptyObjectKeepsDefaults)
{
    ConfigManager cfg;
    ASSERT_TRUE(cfg.loadFromFile(writeConfig("cfg_empty.json", "{}")));
    EXPECT_TRUE(cfg.flushEachLine());
    EXPECT_EQ(cfg.max_line_bytes(), 0u);
}

TEST(ConfigManager, UnknownKeysIgnored)
{
    ConfigManager cfg;
    EXPECT_TRUE(cfg.loadFromFile(writeConfig("cfg_unknown.json", R"({"colour": "always"})")));
}

TEST(ConfigManager, MissingFile)
{
    ConfigManager cfg;
    EXPECT_FALSE(cfg.loadFromFile(testing::TempDir() + "does_not_exist_linefilter.json"));
}

TEST(ConfigManager, InvalidJson)
{
    ConfigManager cfg;
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_bad.json", "{ \"log_path\": ")));
}

TEST(ConfigManager, NonObjectTopLevel)
{
    ConfigManager cfg;
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_array.json", "[1, 2]")));
}

TEST(ConfigManager, WrongTypes)
{
    ConfigManager cfg;
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_t1.json", R"({"log_path": 3})")));
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_t2.json", R"({"flush_each_line": "yes"})")));
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_t3.json", R"({"utf8": 1})")));
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_t4.json", R"({"max_line_bytes": 4096})")));
}

TEST(ConfigManager, MalformedSize)
{
    ConfigManager cfg;
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_s1.json", R"({"max_line_bytes": "12GB"})")));
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_s2.json", R"({"max_line_bytes": "0KB"})")));
}

TEST(ConfigManager, ParseSize)
{
    EXPECT_EQ(ConfigManager::parse_size_kb_mb("1K"), 1024u);
    EXPECT_EQ(ConfigManager::parse_size_kb_mb(" 80kb "), 80u * 1024u);
    EXPECT_EQ(ConfigManager::parse_size_kb_mb("10 MB"), 10u * 1024u * 1024u);
    EXPECT_THROW(ConfigManager::parse_size_kb_mb("10"), std::runtime_error);
    EXPECT_THROW(ConfigManager::parse_size_kb_mb("MB"), std::runtime_error);
    EXPECT_THROW(ConfigManager::parse_size_kb_mb("1.5MB"), std::runtime_error);
}

TEST(ConfigManager, ParseSizeRejectsOverflow)
{
    EXPECT_THROW(ConfigManager::parse_size_kb_mb("17592186044417MB"), std::runtime_error);
    EXPECT_THROW(ConfigManager::parse_size_kb_mb("18014398509481984KB"), std::runtime_error);
    EXPECT_EQ(ConfigManager::parse_size_kb_mb("17592186044415MB"), 17592186044415ULL * 1024ULL * 1024ULL);

    ConfigManager cfg;
    EXPECT_FALSE(cfg.loadFromFile(writeConfig("cfg_s3.json", R"({"max_line_bytes": "17592186044417MB"})")));
}
