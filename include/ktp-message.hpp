/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-message.hpp
 * @brief The publish message and helpers to build and print it.
 *
 * Messages are represented by the generated Protobuf type
 * ktp::PublishMessagePb (proto/ktp-message.proto). Clients build Data
 * messages through buildPublishMessage() or the publisher facade, the pool
 * builds Shutdown messages itself.
 *
 * The string representation (toString() and operator<<) carries type, topic,
 * key, headers and payload, except for a Sensitive message whose payload is
 * never printed; its representation is prefixed with "SENSITIVE". Every log
 * line of the library that mentions a message goes through toString().
 */

#ifndef KTP_MESSAGE_HPP_
#define KTP_MESSAGE_HPP_

#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>

#include "proto/ktp-message.pb.h"

namespace ktp {

using Ktp_Message = ktp::PublishMessagePb;
using Ktp_MessageType = ktp::PublishMessageTypePb;
using Ktp_Headers = std::unordered_map<std::string, std::string>;

/**
 * @brief Build a message from its parts.
 *
 * @param type    The message type
 * @param topic   The kafka topic to publish the message into
 * @param key     The kafka partition key
 * @param headers The optional kafka headers, std::nullopt leaves the message
 *                without headers
 * @param payload The data of the message
 *
 * @return The newly built message
 */
auto buildPublishMessage(Ktp_MessageType type, std::string_view topic,
                         std::string_view key,
                         const std::optional<Ktp_Headers> &headers,
                         std::string_view payload) -> Ktp_Message;

/**
 * @brief The message's headers, std::nullopt when none were set.
 */
auto getHeaders(const Ktp_Message &msg) -> std::optional<Ktp_Headers>;

auto toString(Ktp_MessageType type) -> std::string;

auto toString(const Ktp_Message &msg) -> std::string;

inline auto operator<<(std::ostream &os, const Ktp_Message &msg)
    -> std::ostream & {
  return os << toString(msg);
}

} // namespace ktp

#endif // KTP_MESSAGE_HPP_
