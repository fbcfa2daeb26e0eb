#pragma once

#include <atomic>
#include <memory>
#include <tagflow/async/executor.h>
#include <tagflow/config/config.h>
#include <tagflow/core/types.h>
#include <tagflow/metadata/connection_pool.h>
#include <tagflow/metadata/db_bridge.h>
#include <tagflow/tags/tag_engine.h>

namespace tagflow::app {

// Set the default logger level and pattern. TAGFLOW_LOG_LEVEL overrides config.level.
Result<void> applyLogging(const config::LoggingConfig& config);

/**
 * @brief Process-level owner of the worker pool, connection pool and bridge.
 *
 * Built once at startup and handed by reference to everything that needs
 * the executor or the bridge. shutdown() drains the executor first, then
 * closes the connection pool; the destructor calls it.
 */
class Runtime {
public:
    static Result<std::unique_ptr<Runtime>> create(const config::TagflowConfig& config);

    ~Runtime();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    void shutdown();

    [[nodiscard]] async::ThreadPoolExecutor& executor() { return *executor_; }
    [[nodiscard]] metadata::ConnectionPool& pool() { return *pool_; }
    [[nodiscard]] metadata::DbBridge& bridge() { return *bridge_; }
    [[nodiscard]] const config::TagflowConfig& config() const { return config_; }

    [[nodiscard]] tags::TagEngineConfig tagEngineConfig() const {
        return tags::TagEngineConfig{config_.tags.maxLength};
    }

private:
    explicit Runtime(config::TagflowConfig config);

    Result<void> start();

    config::TagflowConfig config_;
    std::unique_ptr<async::ThreadPoolExecutor> executor_;
    std::unique_ptr<metadata::ConnectionPool> pool_;
    std::unique_ptr<metadata::DbBridge> bridge_;
    std::atomic<bool> stopped_{false};
};

} // namespace tagflow::app
