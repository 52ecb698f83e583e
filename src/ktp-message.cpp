/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-message.cpp
 * @brief Builders and printers for ktp::PublishMessagePb.
 */

#include "ktp-message.hpp"

#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "proto/ktp-message.pb.h"

namespace ktp {

auto buildPublishMessage(Ktp_MessageType type, std::string_view topic,
                         std::string_view key,
                         const std::optional<Ktp_Headers> &headers,
                         std::string_view payload) -> Ktp_Message {
  Ktp_Message msg{};

  msg.set_type(type);
  msg.set_topic(std::string{topic});
  msg.set_key(std::string{key});
  msg.set_payload(std::string{payload});

  if (headers) {
    auto *entries = msg.mutable_headers()->mutable_entries();

    for (const auto &[name, value] : *headers) {
      (*entries)[name] = value;
    }
  }

  return msg;
}

auto getHeaders(const Ktp_Message &msg) -> std::optional<Ktp_Headers> {
  if (!msg.has_headers()) {
    return {};
  }

  Ktp_Headers headers{};
  for (const auto &[name, value] : msg.headers().entries()) {
    headers[name] = value;
  }

  return headers;
}

auto toString(Ktp_MessageType type) -> std::string {
  return ktp::PublishMessageTypePb_Name(type);
}

auto toString(const Ktp_Message &msg) -> std::string {
  std::ostringstream os{};
  const bool sensitive = msg.type() == ktp::PublishMessageTypePb::Sensitive;

  if (sensitive) {
    os << "SENSITIVE ";
  }

  os << "PublishMessage type=" << toString(msg.type())
     << " topic=" << msg.topic() << " key=" << msg.key() << " headers=";

  if (msg.has_headers()) {
    // sorted so that the representation is stable across runs
    const std::map<std::string, std::string> sorted{
        msg.headers().entries().begin(), msg.headers().entries().end()};

    os << "{";

    bool first{true};
    for (const auto &[name, value] : sorted) {
      os << (first ? "" : ", ") << name << ": " << value;
      first = false;
    }

    os << "}";
  } else {
    os << "None";
  }

  if (!sensitive) {
    os << " payload=" << msg.payload();
  }

  return os.str();
}

} // namespace ktp
