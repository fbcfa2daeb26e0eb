#include <spdlog/spdlog.h>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>
#include <system_error>
#include <utility>
#include <tagflow/app/runtime.h>
#include <tagflow/metadata/tag_schema.h>

namespace tagflow::app {

namespace {

std::optional<spdlog::level::level_enum> parseLevel(const std::string& v) {
    if (v == "trace")
        return spdlog::level::trace;
    if (v == "debug")
        return spdlog::level::debug;
    if (v == "info")
        return spdlog::level::info;
    if (v == "warn" || v == "warning")
        return spdlog::level::warn;
    if (v == "error" || v == "err")
        return spdlog::level::err;
    if (v == "critical")
        return spdlog::level::critical;
    if (v == "off")
        return spdlog::level::off;
    return std::nullopt;
}

} // namespace

Result<void> applyLogging(const config::LoggingConfig& config) {
    std::string level = config.level;
    if (const char* envLvl = std::getenv("TAGFLOW_LOG_LEVEL"); envLvl && *envLvl) {
        level = envLvl;
    }

    auto lvl = parseLevel(level);
    if (!lvl) {
        return Error{ErrorCode::InvalidArgument, "Unknown log level: " + level};
    }
    spdlog::set_level(*lvl);

    if (!config.pattern.empty()) {
        spdlog::set_pattern(config.pattern);
    }
    return {};
}

Runtime::Runtime(config::TagflowConfig config) : config_(std::move(config)) {}

Runtime::~Runtime() {
    shutdown();
}

Result<std::unique_ptr<Runtime>> Runtime::create(const config::TagflowConfig& config) {
    auto logging = applyLogging(config.logging);
    if (!logging) {
        return logging.error();
    }

    std::unique_ptr<Runtime> runtime(new Runtime(config));
    auto started = runtime->start();
    if (!started) {
        spdlog::error("Runtime startup failed: {}", started.error().message);
        return started.error();
    }
    return runtime;
}

Result<void> Runtime::start() {
    const auto& db = config_.database;
    if (db.path.empty()) {
        return Error{ErrorCode::InvalidArgument, "database.path is not set"};
    }

    if (db.path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(db.path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::InvalidState, "Cannot create database directory '" +
                                                      db.path.parent_path().string() +
                                                      "': " + ec.message()};
        }
    }

    executor_ = std::make_unique<async::ThreadPoolExecutor>(
        async::ThreadPoolConfig{config_.executor.threads, config_.executor.maxPending});

    metadata::ConnectionPoolConfig poolConfig;
    poolConfig.minConnections = db.minConnections;
    poolConfig.maxConnections = db.maxConnections;
    poolConfig.busyTimeout = db.busyTimeout;
    poolConfig.enableWAL = db.enableWAL;
    pool_ = std::make_unique<metadata::ConnectionPool>(db.path.string(), poolConfig);

    auto initialized = pool_->initialize();
    if (!initialized) {
        return initialized;
    }

    {
        auto conn = pool_->acquire(db.acquireTimeout);
        if (!conn) {
            return conn.error();
        }
        auto schema = metadata::ensureTagSchema(**conn.value());
        if (!schema) {
            return schema;
        }
    }

    bridge_ = std::make_unique<metadata::DbBridge>(
        *pool_, *executor_, metadata::DbBridgeConfig{db.acquireTimeout});

    spdlog::info("tagflow runtime started: db='{}' workers={} connections={}..{}",
                 db.path.string(), executor_->threadCount(), db.minConnections,
                 db.maxConnections);
    return {};
}

void Runtime::shutdown() {
    if (stopped_.exchange(true)) {
        return;
    }
    if (executor_) {
        executor_->shutdown();
    }
    if (pool_) {
        pool_->shutdown();
    }
    spdlog::debug("tagflow runtime stopped");
}

} // namespace tagflow::app
