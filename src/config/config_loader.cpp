/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-11-30

Description: YAML configuration loading for the reflector

**************************************************/

#include "config_loader.hpp"

#include <charconv>
#include <string>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "atom/log/spdlog_logger.hpp"
#include "exception/exception.hpp"

namespace skygate::config {

namespace {

auto scalarToJson(const YAML::Node& node) -> json {
    std::string value = node.as<std::string>();

    // Quoted scalars are always strings
    if (node.Tag() == "!") {
        return json(value);
    }

    if (value == "true" || value == "True" || value == "TRUE" ||
        value == "yes" || value == "Yes" || value == "YES" ||
        value == "on" || value == "On" || value == "ON") {
        return json(true);
    }
    if (value == "false" || value == "False" || value == "FALSE" ||
        value == "no" || value == "No" || value == "NO" ||
        value == "off" || value == "Off" || value == "OFF") {
        return json(false);
    }
    if (value == "null" || value == "Null" || value == "NULL" ||
        value == "~" || value.empty()) {
        return json(nullptr);
    }

    const auto* begin = value.data();
    const auto* end = value.data() + value.size();

    long long intVal = 0;
    if (auto [ptr, ec] = std::from_chars(begin, end, intVal);
        ec == std::errc{} && ptr == end) {
        return json(intVal);
    }

    double floatVal = 0.0;
    if (auto [ptr, ec] = std::from_chars(begin, end, floatVal);
        ec == std::errc{} && ptr == end) {
        return json(floatVal);
    }

    return json(value);
}

auto yamlNodeToJson(const YAML::Node& node, size_t depth) -> json {
    if (depth > YamlLoader::kMaxDepth) {
        THROW_INVALID_CONFIG_EXCEPTION("Maximum nesting depth exceeded");
    }

    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalarToJson(node);

        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yamlNodeToJson(item, depth + 1));
            }
            return arr;
        }

        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& pair : node) {
                obj[pair.first.as<std::string>()] =
                    yamlNodeToJson(pair.second, depth + 1);
            }
            return obj;
        }

        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
    }
    return json(nullptr);
}

}  // namespace

auto YamlLoader::parse(std::string_view content) -> json {
    try {
        return yamlNodeToJson(YAML::Load(std::string(content)), 0);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YamlLoader: YAML parse error: {}", e.what());
        THROW_INVALID_CONFIG_EXCEPTION(
            fmt::format("YAML parse error: {}", e.what()));
    }
}

auto YamlLoader::parseFile(const fs::path& path) -> json {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        THROW_CONFIG_NOT_FOUND_EXCEPTION(
            fmt::format("configuration file not found: {}", path.string()));
    }

    try {
        return yamlNodeToJson(YAML::LoadFile(path.string()), 0);
    } catch (const YAML::Exception& e) {
        LOG_ERROR("YamlLoader: Failed to parse {}: {}", path.string(),
                  e.what());
        THROW_INVALID_CONFIG_EXCEPTION(
            fmt::format("YAML parse error in {}: {}", path.string(), e.what()));
    }
}

auto buildReflectorConfig(const json& document) -> ReflectorConfig {
    if (!document.is_object()) {
        THROW_INVALID_CONFIG_EXCEPTION(
            "configuration root must be a mapping");
    }

    ReflectorConfig cfg;
    try {
        cfg = ReflectorConfig::deserialize(document);
    } catch (const json::exception& e) {
        THROW_INVALID_CONFIG_EXCEPTION(
            fmt::format("malformed configuration: {}", e.what()));
    }
    cfg.validate();
    return cfg;
}

auto loadReflectorConfig(const fs::path& path) -> ReflectorConfig {
    LOG_INFO("Loading configuration from {}", path.string());
    auto cfg = buildReflectorConfig(YamlLoader::parseFile(path));
    LOG_INFO("Configuration loaded: {} device(s), backend mode {}",
             cfg.devices.size(), cfg.backend.mode);
    return cfg;
}

}  // namespace skygate::config
