/*
 * message_bus.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12-3

Description: Publish/subscribe interface of the coordinator message bus

**************************************************/

#ifndef SKYGATE_SERVER_BACKEND_MESSAGE_BUS_HPP
#define SKYGATE_SERVER_BACKEND_MESSAGE_BUS_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace skygate::server::backend {

/**
 * @brief MQTT-style message bus owned by the coordinator
 *
 * The transport itself lives outside this project. Implementations must
 * be safe to call from several threads and may invoke handlers on their
 * own network thread.
 */
class MessageBus {
public:
    using MessageHandler =
        std::function<void(const std::string& topic,
                           const std::string& payload)>;
    using SubscriptionId = std::uint64_t;

    virtual ~MessageBus() = default;

    virtual void connect() = 0;
    [[nodiscard]] virtual bool isConnected() const = 0;

    virtual void publish(const std::string& topic, const std::string& payload,
                         int qos, bool retain) = 0;

    /**
     * @brief Subscribe to a topic filter, `+` and `#` wildcards allowed
     */
    virtual auto subscribe(const std::string& topicFilter, int qos,
                           MessageHandler handler) -> SubscriptionId = 0;

    virtual void unsubscribe(SubscriptionId id) = 0;
};

/**
 * @brief MQTT topic filter matching
 *
 * `+` matches exactly one level, a trailing `#` matches any remaining
 * levels including none.
 */
auto topicMatches(std::string_view filter, std::string_view topic) -> bool;

}  // namespace skygate::server::backend

#endif  // SKYGATE_SERVER_BACKEND_MESSAGE_BUS_HPP
