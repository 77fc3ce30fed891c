/*
 * logging_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "logging_manager.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>

#include "sink_factory.hpp"

namespace skygate::logging {

auto parseLevel(const std::string& name)
    -> std::optional<spdlog::level::level_enum> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "warning") {
        return spdlog::level::warn;
    }
    if (lower == "fatal") {
        return spdlog::level::critical;
    }

    auto level = spdlog::level::from_str(lower);
    // from_str maps unknown names to off, so only accept off when asked
    if (level == spdlog::level::off && lower != "off") {
        return std::nullopt;
    }
    return level;
}

auto LoggingManager::getInstance() -> LoggingManager& {
    static LoggingManager instance;
    return instance;
}

LoggingManager::~LoggingManager() {
    if (initialized_) {
        shutdown();
    }
}

void LoggingManager::initialize(const config::LoggingConfig& config) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        spdlog::warn("LoggingManager already initialized, reinitializing...");
        spdlog::drop_all();
        sinks_.clear();
    }

    config_ = config;

    const auto level = parseLevel(config.level).value_or(spdlog::level::info);
    const std::string pattern =
        config.format == "text" ? kTextPattern : kJsonPattern;

    for (const auto& path : config.outputPaths) {
        if (auto sink = SinkFactory::createOutputSink(
                path, spdlog::level::trace, pattern)) {
            sinks_.push_back(sink);
        }
    }
    for (const auto& path : config.errorOutputPaths) {
        if (auto sink = SinkFactory::createOutputSink(
                path, spdlog::level::err, pattern)) {
            sinks_.push_back(sink);
        }
    }

    setupDefaultLogger(level);

    initialized_ = true;
    spdlog::info("LoggingManager initialized with {} sinks at level {}",
                 sinks_.size(), spdlog::level::to_string_view(level));
}

void LoggingManager::shutdown() {
    std::unique_lock lock(mutex_);

    if (!initialized_) {
        return;
    }

    spdlog::info("LoggingManager shutting down...");
    if (auto logger = spdlog::default_logger()) {
        logger->flush();
    }
    spdlog::drop_all();
    sinks_.clear();
    initialized_ = false;

    // drop_all() also releases the default logger; late messages from
    // destructors still need somewhere to go.
    spdlog::set_default_logger(std::make_shared<spdlog::logger>(
        "skygate", SinkFactory::createConsoleSink(true, spdlog::level::warn,
                                                  kTextPattern)));
}

auto LoggingManager::isInitialized() const -> bool {
    std::shared_lock lock(mutex_);
    return initialized_;
}

auto LoggingManager::setLevel(const std::string& level) -> bool {
    auto parsed = parseLevel(level);
    if (!parsed) {
        spdlog::warn("Ignoring unknown log level '{}'", level);
        return false;
    }

    std::unique_lock lock(mutex_);
    config_.level = level;
    spdlog::set_level(*parsed);
    return true;
}

auto LoggingManager::getConfig() const -> config::LoggingConfig {
    std::shared_lock lock(mutex_);
    return config_;
}

auto LoggingManager::sinkCount() const -> size_t {
    std::shared_lock lock(mutex_);
    return sinks_.size();
}

void LoggingManager::setupDefaultLogger(spdlog::level::level_enum level) {
    auto default_logger = std::make_shared<spdlog::logger>(
        "skygate", sinks_.begin(), sinks_.end());
    default_logger->set_level(level);
    default_logger->flush_on(spdlog::level::err);
    spdlog::set_default_logger(default_logger);
}

}  // namespace skygate::logging
