#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <tagflow/core/types.h>

namespace tagflow::config {

struct DatabaseSettings {
    std::filesystem::path path; ///< Empty = <data dir>/tags.db
    std::size_t minConnections = 2;
    std::size_t maxConnections = 10;
    std::chrono::milliseconds busyTimeout{2000};
    std::chrono::milliseconds acquireTimeout{30000};
    bool enableWAL = true;
};

struct ExecutorSettings {
    std::size_t threads = 0;    ///< 0 = hardware concurrency
    std::size_t maxPending = 0; ///< 0 = unbounded
};

struct TagSettings {
    std::size_t maxLength = 40;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern; ///< Empty keeps the spdlog default pattern
};

struct TagflowConfig {
    DatabaseSettings database;
    ExecutorSettings executor;
    TagSettings tags;
    LoggingConfig logging;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing file or missing keys keep their defaults. A value that does not
 * parse, or settings that contradict each other, fail with InvalidArgument
 * naming the offending key.
 */
Result<TagflowConfig> loadConfig(const std::filesystem::path& path);

// loadConfig(get_config_path())
Result<TagflowConfig> loadDefaultConfig();

} // namespace tagflow::config
