/*
 * logging_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Central Logging Manager - installs the spdlog default logger

**************************************************/

#ifndef SKYGATE_LOGGING_LOGGING_MANAGER_HPP
#define SKYGATE_LOGGING_LOGGING_MANAGER_HPP

#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/server_config.hpp"

namespace skygate::logging {

/// Pattern producing one JSON object per line
inline constexpr const char* kJsonPattern =
    R"({"time":"%Y-%m-%dT%H:%M:%S.%e%z","level":"%l","thread":%t,"msg":"%v"})";

/// Human readable pattern
inline constexpr const char* kTextPattern =
    "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v";

/**
 * @brief Parse a level name, accepting spdlog names plus `warning` and
 * `fatal`
 */
auto parseLevel(const std::string& name)
    -> std::optional<spdlog::level::level_enum>;

/**
 * @brief Central logging manager with spdlog integration
 *
 * Builds the sinks described by the `logging` configuration section and
 * installs them as the spdlog default logger. Error output paths only
 * receive `error` and above.
 */
class LoggingManager {
public:
    static auto getInstance() -> LoggingManager&;

    LoggingManager(const LoggingManager&) = delete;
    LoggingManager& operator=(const LoggingManager&) = delete;

    /**
     * @brief Initialize logging; calling it again replaces the sinks
     */
    void initialize(const config::LoggingConfig& config);

    /**
     * @brief Flush and drop every logger
     */
    void shutdown();

    [[nodiscard]] auto isInitialized() const -> bool;

    /**
     * @brief Change the default logger level at runtime
     * @return false if the level name is not recognised
     */
    auto setLevel(const std::string& level) -> bool;

    [[nodiscard]] auto getConfig() const -> config::LoggingConfig;

    [[nodiscard]] auto sinkCount() const -> size_t;

private:
    LoggingManager() = default;
    ~LoggingManager();

    void setupDefaultLogger(spdlog::level::level_enum level);

    mutable std::shared_mutex mutex_;
    config::LoggingConfig config_;
    std::vector<spdlog::sink_ptr> sinks_;
    bool initialized_{false};
};

}  // namespace skygate::logging

#endif  // SKYGATE_LOGGING_LOGGING_MANAGER_HPP
