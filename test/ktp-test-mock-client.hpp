/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-test-mock-client.hpp
 * @brief In-process Ktp_Broker_Client for the tests, no broker is needed.
 *
 * Every client created by Mock_Broker::factory() records into the same
 * Mock_Broker, so a test can observe what all the workers published.
 */

#ifndef KTP_TEST_MOCK_CLIENT_HPP_
#define KTP_TEST_MOCK_CLIENT_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-message.hpp"

struct Mock_Published {
  std::string topic{};
  std::string key{};
  std::optional<ktp::Ktp_Headers> headers{};
  std::string payload{};
};

class Mock_Broker {
public:
  // attempt is the 1-based number of publish calls seen by the broker
  using PublishStatus = std::function<int(size_t attempt)>;

  auto factory() -> ktp::Ktp_Broker_Client::ClientFactory;

  void setPublishStatus(PublishStatus status) {
    std::lock_guard<std::mutex> lock(m_mutex);

    m_publish_status = std::move(status);
  }

  auto publish(std::string_view topic, std::string_view key,
               const std::optional<ktp::Ktp_Headers> &headers,
               std::string_view payload) -> int {
    std::lock_guard<std::mutex> lock(m_mutex);

    const size_t attempt = ++m_num_attempts;
    const int status = m_publish_status ? m_publish_status(attempt) : 0;
    if (0 == status) {
      m_published.push_back(Mock_Published{std::string{topic},
                                           std::string{key}, headers,
                                           std::string{payload}});
    }

    return status;
  }

  auto published() -> std::vector<Mock_Published> {
    std::lock_guard<std::mutex> lock(m_mutex);

    return m_published;
  }

  auto numPublished() -> size_t {
    std::lock_guard<std::mutex> lock(m_mutex);

    return m_published.size();
  }

  auto numAttempts() -> size_t {
    std::lock_guard<std::mutex> lock(m_mutex);

    return m_num_attempts;
  }

  /**
   * @brief Poll until numPublished() reaches count or timeout elapses.
   */
  auto waitForPublished(size_t count, std::chrono::milliseconds timeout)
      -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (numPublished() < count) {
      if (std::chrono::steady_clock::now() >= deadline) {
        return false;
      }

      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    return true;
  }

  ktp::Ktp_Cluster_Metadata metadata{};
  std::optional<std::string> metadata_error{};
  std::optional<std::pair<int64_t, int64_t>> watermarks{};

  std::atomic<size_t> num_clients{};
  std::atomic<size_t> num_consumers{};

  // publish() calls wait while block_publish is set
  std::atomic<bool> block_publish{};
  std::atomic<size_t> num_publish_entered{};
  std::atomic<size_t> num_publish_returned{};

private:
  std::mutex m_mutex{};
  PublishStatus m_publish_status{};
  size_t m_num_attempts{};
  std::vector<Mock_Published> m_published{};
};

class Mock_Client : public ktp::Ktp_Broker_Client {
public:
  explicit Mock_Client(Mock_Broker &broker) : m_broker{broker} {}

  auto publish(std::string_view topic, std::string_view key,
               const std::optional<ktp::Ktp_Headers> &headers,
               std::string_view payload, int64_t timestamp_ms)
      -> int override {
    m_broker.num_publish_entered++;

    // sleep_for() is a cancellation point, as the waits of a real client are
    while (m_broker.block_publish.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    const int status = m_broker.publish(topic, key, headers, payload);

    m_broker.num_publish_returned++;

    return status;
  }

  auto fetchMetadata(std::optional<std::string_view> topic,
                     std::chrono::milliseconds timeout)
      -> std::expected<ktp::Ktp_Cluster_Metadata, std::string> override {
    if (m_broker.metadata_error) {
      return std::unexpected(*m_broker.metadata_error);
    }

    if (!topic) {
      return m_broker.metadata;
    }

    ktp::Ktp_Cluster_Metadata metadata{};
    metadata.brokers = m_broker.metadata.brokers;

    for (const auto &topic_info : m_broker.metadata.topics) {
      if (topic_info.name == *topic) {
        metadata.topics.push_back(topic_info);
      }
    }

    return metadata;
  }

  auto fetchWatermarks(std::string_view topic, int32_t partition,
                       std::chrono::milliseconds timeout)
      -> std::expected<std::pair<int64_t, int64_t>, std::string> override {
    if (!m_broker.watermarks) {
      return std::unexpected(std::string{"Local: Timed out"});
    }

    return *m_broker.watermarks;
  }

private:
  Mock_Broker &m_broker;
};

inline auto Mock_Broker::factory() -> ktp::Ktp_Broker_Client::ClientFactory {
  return [this](const ktp::Ktp_Config &config,
                ktp::Ktp_Broker_Client::Role role)
             -> std::unique_ptr<ktp::Ktp_Broker_Client> {
    num_clients++;
    if (ktp::Ktp_Broker_Client::Role::kConsumer == role) {
      num_consumers++;
    }

    return std::make_unique<Mock_Client>(*this);
  };
}

/**
 * @brief A valid enabled configuration with short sleeps for the tests.
 */
inline auto makeTestConfig(const std::string &num_threads = "3")
    -> ktp::Ktp_Config {
  ktp::Ktp_Config::ConfigType configs{};

  configs[std::string{ktp::Ktp_Config::kBrokers}] = "localhost:9092";
  configs[std::string{ktp::Ktp_Config::kTopics}] = "testing";
  configs[std::string{ktp::Ktp_Config::kNumThreads}] = num_threads;
  configs[std::string{ktp::Ktp_Config::kRetryIntervalSec}] = "0.01";
  configs[std::string{ktp::Ktp_Config::kIdleIntervalSec}] = "0.05";

  return *ktp::Ktp_Config::fromConfigType("ktp-test", configs);
}

/**
 * @brief Poll until pred() holds or timeout elapses.
 */
inline auto waitUntil(const std::function<bool()> &pred,
                      std::chrono::milliseconds timeout) -> bool {
  const auto deadline = std::chrono::steady_clock::now() + timeout;

  while (!pred()) {
    if (std::chrono::steady_clock::now() >= deadline) {
      return false;
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  return true;
}

#endif // KTP_TEST_MOCK_CLIENT_HPP_
