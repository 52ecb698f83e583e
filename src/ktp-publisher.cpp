/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-publisher.cpp
 * @brief The application facing facade of the publish thread pool.
 */

#include "ktp-publisher.hpp"

#include <cstddef>
#include <exception>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-debug.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-metadata.hpp"
#include "ktp-pool.hpp"
#include "ktp-queue.hpp"

namespace ktp {

Ktp_Publisher::Ktp_Publisher(const Ktp_Config &config,
                             std::shared_ptr<Ktp_Queue> queue,
                             std::shared_ptr<Ktp_Pool> pool,
                             Ktp_Broker_Client::ClientFactory client_factory)
    : m_config{config}, m_queue{std::move(queue)}, m_pool{std::move(pool)},
      m_client_factory{std::move(client_factory)} {}

auto Ktp_Publisher::addDataMsg(std::string_view topic, std::string_view key,
                               const std::optional<Ktp_Headers> &headers,
                               std::string_view payload)
    -> std::expected<size_t, Ktp_Error> {
  if (!m_config.is_enabled) {
    return 0;
  }

  return m_queue->enqueue({buildPublishMessage(
      ktp::PublishMessageTypePb::Data, topic, key, headers, payload)});
}

auto Ktp_Publisher::addMsg(Ktp_Message msg)
    -> std::expected<size_t, Ktp_Error> {
  if (!m_config.is_enabled) {
    return 0;
  }

  std::vector<Ktp_Message> msgs{};
  msgs.push_back(std::move(msg));

  return m_queue->enqueue(std::move(msgs));
}

auto Ktp_Publisher::addMsgs(std::vector<Ktp_Message> msgs)
    -> std::expected<size_t, Ktp_Error> {
  if (!m_config.is_enabled) {
    return 0;
  }

  return m_queue->enqueue(std::move(msgs));
}

auto Ktp_Publisher::drainMsgs() -> std::vector<Ktp_Message> {
  if (!m_config.is_enabled) {
    return {};
  }

  return m_queue->drainAll();
}

auto Ktp_Publisher::shutdown() -> std::expected<std::string, Ktp_Error> {
  if (!m_config.is_enabled) {
    return "kafka not enabled";
  }

  auto res = m_queue->enqueue({buildPublishMessage(
      ktp::PublishMessageTypePb::Shutdown, "", "", std::nullopt, "")});
  if (!res) {
    return std::unexpected(res.error());
  }

  KTP_DEBUG_PRINT(std::cout << m_config.label << " - shutdown started\n");

  return "shutdown started";
}

auto Ktp_Publisher::getMetadata(bool fetch_offsets,
                                std::optional<std::string_view> topic)
    -> std::expected<Ktp_Metadata_Report, Ktp_Error> {
  if (!m_config.is_enabled) {
    return std::unexpected(
        Ktp_Error{Ktp_Error::Code::kNotEnabled, "kafka not enabled"});
  }

  if (!m_config.hasBrokers()) {
    return std::unexpected(Ktp_Error{Ktp_Error::Code::kConnectionUnavailable,
                                     "no kafka brokers configured"});
  }

  std::unique_ptr<Ktp_Broker_Client> client{};

  try {
    client = m_client_factory(m_config, Ktp_Broker_Client::Role::kConsumer);
  } catch (const std::exception &e) {
    KTP_LOG_PRINT(std::cerr << m_config.label
                            << " - failed to create kafka consumer: "
                            << e.what() << "\n");

    return std::unexpected(
        Ktp_Error{Ktp_Error::Code::kConnectionUnavailable, e.what()});
  }

  if (!client) {
    return std::unexpected(Ktp_Error{Ktp_Error::Code::kConnectionUnavailable,
                                     "failed to create kafka consumer"});
  }

  auto report = ktp::getMetadata(m_config, *client, fetch_offsets, topic);
  if (!report) {
    return std::unexpected(Ktp_Error{Ktp_Error::Code::kConnectionUnavailable,
                                     std::move(report.error())});
  }

  return std::move(*report);
}

auto Ktp_Publisher::config() const -> const Ktp_Config & { return m_config; }

auto Ktp_Publisher::pool() const -> std::shared_ptr<Ktp_Pool> {
  return m_pool;
}

} // namespace ktp
