/*
 * message_bus.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "message_bus.hpp"

namespace skygate::server::backend {

namespace {

auto nextLevel(std::string_view& rest) -> std::string_view {
    auto pos = rest.find('/');
    std::string_view level = rest.substr(0, pos);
    rest = pos == std::string_view::npos ? std::string_view{}
                                         : rest.substr(pos + 1);
    return level;
}

}  // namespace

auto topicMatches(std::string_view filter, std::string_view topic) -> bool {
    bool topicDone = false;
    while (true) {
        if (filter.empty()) {
            return topicDone || topic.empty();
        }
        std::string_view filterLevel = nextLevel(filter);
        if (filterLevel == "#") {
            return filter.empty();
        }
        if (topicDone) {
            return false;
        }
        bool lastTopicLevel = topic.find('/') == std::string_view::npos;
        std::string_view topicLevel = nextLevel(topic);
        if (filterLevel != "+" && filterLevel != topicLevel) {
            return false;
        }
        if (lastTopicLevel) {
            topicDone = true;
        }
        if (filter.empty()) {
            return topicDone;
        }
    }
}

}  // namespace skygate::server::backend
