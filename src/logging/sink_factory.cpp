/*
 * sink_factory.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "sink_factory.hpp"

#include <filesystem>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace skygate::logging {

auto SinkFactory::createOutputSink(const std::string& outputPath,
                                   spdlog::level::level_enum level,
                                   const std::string& pattern)
    -> spdlog::sink_ptr {
    try {
        if (outputPath == "stdout") {
            return createConsoleSink(false, level, pattern);
        }
        if (outputPath == "stderr") {
            return createConsoleSink(true, level, pattern);
        }
        return createFileSink(outputPath, level, pattern);
    } catch (const std::exception& e) {
        spdlog::error("Failed to create sink '{}': {}", outputPath, e.what());
        return nullptr;
    }
}

auto SinkFactory::createConsoleSink(bool useStderr,
                                    spdlog::level::level_enum level,
                                    const std::string& pattern)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (useStderr) {
        sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createFileSink(const std::string& filePath,
                                 spdlog::level::level_enum level,
                                 const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(filePath);
    auto sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(filePath, false);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& filePath) {
    std::filesystem::path path(filePath);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
}

}  // namespace skygate::logging
