/*
 * sink_factory.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-28

Description: Factory for creating spdlog sinks from output paths

**************************************************/

#ifndef SKYGATE_LOGGING_SINK_FACTORY_HPP
#define SKYGATE_LOGGING_SINK_FACTORY_HPP

#include <string>

#include <spdlog/spdlog.h>

namespace skygate::logging {

/**
 * @brief Factory class for creating spdlog sinks
 *
 * An output path is either `stdout`, `stderr` or a file path. Files are
 * appended to and their parent directories are created on demand.
 */
class SinkFactory {
public:
    /**
     * @brief Create a sink for an output path
     * @return Shared pointer to created sink, or nullptr on failure
     */
    [[nodiscard]] static auto createOutputSink(
        const std::string& outputPath, spdlog::level::level_enum level,
        const std::string& pattern) -> spdlog::sink_ptr;

    [[nodiscard]] static auto createConsoleSink(
        bool useStderr, spdlog::level::level_enum level,
        const std::string& pattern) -> spdlog::sink_ptr;

    [[nodiscard]] static auto createFileSink(const std::string& filePath,
                                             spdlog::level::level_enum level,
                                             const std::string& pattern)
        -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& filePath);
};

}  // namespace skygate::logging

#endif  // SKYGATE_LOGGING_SINK_FACTORY_HPP
