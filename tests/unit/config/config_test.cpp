#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>

#include "../../common/test_helpers.h"
#include <tagflow/config/config.h>
#include <tagflow/config/config_helpers.h>

using namespace std::chrono_literals;
using namespace tagflow;
using namespace tagflow::config;

namespace {

// Sets an environment variable for the lifetime of the guard
class ScopedEnv {
public:
    ScopedEnv(const char* name, const std::string& value) : name_(name) {
        if (const char* old = std::getenv(name)) {
            previous_ = old;
            hadPrevious_ = true;
        }
        ::setenv(name, value.c_str(), 1);
    }
    ~ScopedEnv() {
        if (hadPrevious_) {
            ::setenv(name_, previous_.c_str(), 1);
        } else {
            ::unsetenv(name_);
        }
    }

private:
    const char* name_;
    std::string previous_;
    bool hadPrevious_ = false;
};

} // namespace

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override { dir_ = tagflow::tests::make_temp_dir("tagflow_config_"); }
    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::filesystem::path write(const std::string& body) {
        return tagflow::tests::write_file(dir_ / "config.toml", body);
    }

    std::filesystem::path dir_;
};

TEST(ConfigHelpersTest, TrimAndUnquote) {
    std::string s = "  value \t";
    trim(s);
    EXPECT_EQ(s, "value");
    EXPECT_EQ(unquote(" \"quoted\" "), "quoted");
    EXPECT_EQ(unquote("'single'"), "single");
    EXPECT_EQ(unquote("bare"), "bare");
}

TEST(ConfigHelpersTest, ExpandTilde) {
    ScopedEnv home("HOME", "/home/tester");
    EXPECT_EQ(expand_tilde("~/data/tags.db"), std::filesystem::path("/home/tester/data/tags.db"));
    EXPECT_EQ(expand_tilde("~"), std::filesystem::path("/home/tester"));
    EXPECT_EQ(expand_tilde("/abs/path"), std::filesystem::path("/abs/path"));
}

TEST(ConfigHelpersTest, ConfigPathResolutionOrder) {
    ScopedEnv xdg("XDG_CONFIG_HOME", "/xdg");
    {
        ScopedEnv explicitPath("TAGFLOW_CONFIG", "/etc/tagflow.toml");
        EXPECT_EQ(get_config_path(), std::filesystem::path("/etc/tagflow.toml"));
        EXPECT_EQ(get_config_path("/override.toml"), std::filesystem::path("/override.toml"));
    }
    ScopedEnv cleared("TAGFLOW_CONFIG", "");
    EXPECT_EQ(get_config_path(), std::filesystem::path("/xdg/tagflow/config.toml"));
}

TEST_F(ConfigTest, ParseSectionsCommentsAndQuotes) {
    auto path = write(R"(
# top comment
[database]
path = "/var/lib/tagflow/tags.db"   # trailing
max_connections = 4

[logging]
pattern = "[%l] %v # not a comment"
)");

    auto sections = parse_config_file(path);
    EXPECT_EQ(sections["database"]["path"], "/var/lib/tagflow/tags.db");
    EXPECT_EQ(sections["database"]["max_connections"], "4");
    EXPECT_EQ(sections["logging"]["pattern"], "[%l] %v # not a comment");
    EXPECT_EQ(parse_config_value(path, "database", "max_connections"), "4");
    EXPECT_EQ(parse_config_value(path, "database", "absent"), "");
}

TEST_F(ConfigTest, MissingFileYieldsDefaults) {
    auto loaded = loadConfig(dir_ / "nope.toml");
    ASSERT_TRUE(loaded.has_value());

    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.database.minConnections, 2u);
    EXPECT_EQ(cfg.database.maxConnections, 10u);
    EXPECT_EQ(cfg.database.busyTimeout, 2000ms);
    EXPECT_EQ(cfg.database.acquireTimeout, 30000ms);
    EXPECT_TRUE(cfg.database.enableWAL);
    EXPECT_EQ(cfg.database.path.filename(), "tags.db");
    EXPECT_EQ(cfg.executor.threads, 0u);
    EXPECT_EQ(cfg.executor.maxPending, 0u);
    EXPECT_EQ(cfg.tags.maxLength, 40u);
    EXPECT_EQ(cfg.logging.level, "info");
}

TEST_F(ConfigTest, LoadsEverySection) {
    auto path = write(R"(
[database]
path = "/tmp/tagflow/custom.db"
min_connections = 1
max_connections = 3
busy_timeout_ms = 500
acquire_timeout_ms = 750
enable_wal = false

[executor]
threads = 6
max_pending = 1000

[tags]
max_length = 64

[logging]
level = "debug"
pattern = "%v"
)");

    auto loaded = loadConfig(path);
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;

    const auto& cfg = loaded.value();
    EXPECT_EQ(cfg.database.path, std::filesystem::path("/tmp/tagflow/custom.db"));
    EXPECT_EQ(cfg.database.minConnections, 1u);
    EXPECT_EQ(cfg.database.maxConnections, 3u);
    EXPECT_EQ(cfg.database.busyTimeout, 500ms);
    EXPECT_EQ(cfg.database.acquireTimeout, 750ms);
    EXPECT_FALSE(cfg.database.enableWAL);
    EXPECT_EQ(cfg.executor.threads, 6u);
    EXPECT_EQ(cfg.executor.maxPending, 1000u);
    EXPECT_EQ(cfg.tags.maxLength, 64u);
    EXPECT_EQ(cfg.logging.level, "debug");
    EXPECT_EQ(cfg.logging.pattern, "%v");
}

TEST_F(ConfigTest, InvalidNumberNamesKey) {
    auto loaded = loadConfig(write("[executor]\nthreads = many\n"));
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidArgument);
    EXPECT_NE(loaded.error().message.find("executor.threads"), std::string::npos);
}

TEST_F(ConfigTest, InvalidBooleanNamesKey) {
    auto loaded = loadConfig(write("[database]\nenable_wal = maybe\n"));
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().message.find("database.enable_wal"), std::string::npos);
}

TEST_F(ConfigTest, ContradictoryPoolBoundsAreRejected) {
    auto loaded = loadConfig(write("[database]\nmin_connections = 5\nmax_connections = 2\n"));
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, ZeroTagLengthIsRejected) {
    auto loaded = loadConfig(write("[tags]\nmax_length = 0\n"));
    ASSERT_FALSE(loaded.has_value());
    EXPECT_EQ(loaded.error().code, ErrorCode::InvalidArgument);
}

TEST_F(ConfigTest, UnknownLogLevelIsRejected) {
    auto loaded = loadConfig(write("[logging]\nlevel = chatty\n"));
    ASSERT_FALSE(loaded.has_value());
    EXPECT_NE(loaded.error().message.find("logging.level"), std::string::npos);
}
