#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <charconv>
#include <string_view>
#include <system_error>
#include <utility>
#include <tagflow/config/config.h>
#include <tagflow/config/config_helpers.h>

namespace tagflow::config {

namespace {

constexpr std::array<std::string_view, 9> kLogLevels = {
    "trace", "debug", "info", "warn", "warning", "error", "err", "critical", "off"};

Error invalidValue(const std::string& section, const std::string& key, const std::string& value) {
    return Error{ErrorCode::InvalidArgument,
                 "Invalid value for " + section + "." + key + ": '" + value + "'"};
}

// Applies section.key to target when present; leaves target untouched otherwise
class SectionReader {
public:
    SectionReader(const ConfigSections& sections, std::string section) : section_(std::move(section)) {
        if (auto it = sections.find(section_); it != sections.end()) {
            values_ = &it->second;
        }
    }

    Result<void> readSize(const std::string& key, std::size_t& target) const {
        const std::string* raw = find(key);
        if (!raw) {
            return {};
        }
        std::size_t value = 0;
        auto [end, ec] = std::from_chars(raw->data(), raw->data() + raw->size(), value);
        if (raw->empty() || ec != std::errc{} || end != raw->data() + raw->size()) {
            return invalidValue(section_, key, *raw);
        }
        target = value;
        return {};
    }

    Result<void> readMillis(const std::string& key, std::chrono::milliseconds& target) const {
        std::size_t ms = static_cast<std::size_t>(target.count());
        auto result = readSize(key, ms);
        if (!result) {
            return result;
        }
        target = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(ms));
        return {};
    }

    Result<void> readBool(const std::string& key, bool& target) const {
        const std::string* raw = find(key);
        if (!raw) {
            return {};
        }
        std::string lowered = *raw;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
            target = true;
        } else if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
            target = false;
        } else {
            return invalidValue(section_, key, *raw);
        }
        return {};
    }

    void readString(const std::string& key, std::string& target) const {
        if (const std::string* raw = find(key)) {
            target = *raw;
        }
    }

private:
    const std::string* find(const std::string& key) const {
        if (!values_) {
            return nullptr;
        }
        auto it = values_->find(key);
        return it == values_->end() ? nullptr : &it->second;
    }

    std::string section_;
    const std::map<std::string, std::string>* values_ = nullptr;
};

} // namespace

Result<TagflowConfig> loadConfig(const std::filesystem::path& path) {
    TagflowConfig config;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("No config file at '{}', using defaults", path.string());
        config.database.path = get_data_dir() / "tags.db";
        return config;
    }

    const auto sections = parse_config_file(path);

    const SectionReader database(sections, "database");
    std::string dbPath;
    database.readString("path", dbPath);
    config.database.path = dbPath.empty() ? get_data_dir() / "tags.db" : expand_tilde(dbPath);
    if (auto r = database.readSize("min_connections", config.database.minConnections); !r)
        return r.error();
    if (auto r = database.readSize("max_connections", config.database.maxConnections); !r)
        return r.error();
    if (auto r = database.readMillis("busy_timeout_ms", config.database.busyTimeout); !r)
        return r.error();
    if (auto r = database.readMillis("acquire_timeout_ms", config.database.acquireTimeout); !r)
        return r.error();
    if (auto r = database.readBool("enable_wal", config.database.enableWAL); !r)
        return r.error();

    if (config.database.maxConnections == 0) {
        return Error{ErrorCode::InvalidArgument, "database.max_connections must be at least 1"};
    }
    if (config.database.minConnections > config.database.maxConnections) {
        return Error{ErrorCode::InvalidArgument,
                     "database.min_connections exceeds database.max_connections"};
    }

    const SectionReader executor(sections, "executor");
    if (auto r = executor.readSize("threads", config.executor.threads); !r)
        return r.error();
    if (auto r = executor.readSize("max_pending", config.executor.maxPending); !r)
        return r.error();

    const SectionReader tags(sections, "tags");
    if (auto r = tags.readSize("max_length", config.tags.maxLength); !r)
        return r.error();
    if (config.tags.maxLength == 0) {
        return Error{ErrorCode::InvalidArgument, "tags.max_length must be at least 1"};
    }

    const SectionReader logging(sections, "logging");
    logging.readString("level", config.logging.level);
    logging.readString("pattern", config.logging.pattern);
    if (std::find(kLogLevels.begin(), kLogLevels.end(), config.logging.level) == kLogLevels.end()) {
        return invalidValue("logging", "level", config.logging.level);
    }

    spdlog::debug("Loaded config from '{}'", path.string());
    return config;
}

Result<TagflowConfig> loadDefaultConfig() {
    return loadConfig(get_config_path());
}

} // namespace tagflow::config
