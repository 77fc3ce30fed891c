/*
 * config_loader.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: YAML configuration loading for the reflector

**************************************************/

#ifndef SKYGATE_CONFIG_CONFIG_LOADER_HPP
#define SKYGATE_CONFIG_CONFIG_LOADER_HPP

#include <filesystem>
#include <string_view>

#include "server_config.hpp"

namespace skygate::config {

namespace fs = std::filesystem;

/**
 * @brief YAML to JSON conversion backed by yaml-cpp
 */
class YamlLoader {
public:
    /// Maximum nesting accepted before the document is rejected
    static constexpr size_t kMaxDepth = 64;

    /**
     * @brief Parse a YAML document into JSON
     * @throws InvalidConfigException on malformed YAML
     */
    static auto parse(std::string_view content) -> json;

    /**
     * @brief Parse a YAML file into JSON
     * @throws ConfigNotFoundException when the file does not exist
     * @throws InvalidConfigException on malformed YAML
     */
    static auto parseFile(const fs::path& path) -> json;
};

/**
 * @brief Load, deserialize and validate a reflector configuration file
 */
auto loadReflectorConfig(const fs::path& path) -> ReflectorConfig;

/**
 * @brief Deserialize and validate an already parsed document
 */
auto buildReflectorConfig(const json& document) -> ReflectorConfig;

}  // namespace skygate::config

#endif  // SKYGATE_CONFIG_CONFIG_LOADER_HPP
