/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-broker-client.hpp
 * @brief Abstract broker client used by the workers and the metadata query.
 *
 * Ktp_Broker_Client declares the broker operations the thread pool needs:
 *  - publish(): send one message and report its delivery status, 0 means
 *    delivered, any other value is the broker error code.
 *  - fetchMetadata(): cluster metadata for one topic or for all topics.
 *  - fetchWatermarks(): low and high offsets of one partition.
 *
 * Each worker owns its own client (never shared between threads). Clients
 * are created through a ClientFactory so that the pool and the facade can be
 * run against Ktp_Kafka_Client (librdkafka) in production and against an
 * in-process client in tests.
 */

#ifndef KTP_BROKER_CLIENT_HPP_
#define KTP_BROKER_CLIENT_HPP_

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ktp-config.hpp"
#include "ktp-message.hpp"

namespace ktp {

struct Ktp_Broker_Info {
  int32_t id{};
  std::string host{};
  int port{};
};

struct Ktp_Partition_Info {
  int32_t id{};
  int32_t leader{};
  std::vector<int32_t> replicas{};
  std::vector<int32_t> isr{};
  std::optional<std::string> error{};
};

struct Ktp_Topic_Info {
  std::string name{};
  std::optional<std::string> error{};
  std::vector<Ktp_Partition_Info> partitions{};
};

struct Ktp_Cluster_Metadata {
  std::vector<Ktp_Broker_Info> brokers{};
  std::vector<Ktp_Topic_Info> topics{};
};

class Ktp_Broker_Client {
public:
  enum class Role { kProducer, kConsumer };

  using ClientFactory = std::function<std::unique_ptr<Ktp_Broker_Client>(
      const Ktp_Config &config, Role role)>;

  virtual ~Ktp_Broker_Client() noexcept = default;

  /**
   * @brief Publish one message and wait for its delivery report.
   *
   * @param topic        The topic to publish into
   * @param key          The partition key
   * @param headers      The message headers, std::nullopt for none
   * @param payload      The message payload
   * @param timestamp_ms The message timestamp in milliseconds since epoch
   *
   * @return 0 if the message is delivered, else the non-zero broker status
   */
  virtual auto publish(std::string_view topic, std::string_view key,
                       const std::optional<Ktp_Headers> &headers,
                       std::string_view payload, int64_t timestamp_ms)
      -> int = 0;

  /**
   * @brief Fetch the cluster metadata.
   *
   * @param topic   The topic to fetch, std::nullopt for all topics
   * @param timeout The maximum time to wait for the broker
   */
  virtual auto fetchMetadata(std::optional<std::string_view> topic,
                             std::chrono::milliseconds timeout)
      -> std::expected<Ktp_Cluster_Metadata, std::string> = 0;

  /**
   * @brief Fetch the low and high watermark offsets of a partition.
   */
  virtual auto fetchWatermarks(std::string_view topic, int32_t partition,
                               std::chrono::milliseconds timeout)
      -> std::expected<std::pair<int64_t, int64_t>, std::string> = 0;
}; // class Ktp_Broker_Client

} // namespace ktp

#endif // KTP_BROKER_CLIENT_HPP_
