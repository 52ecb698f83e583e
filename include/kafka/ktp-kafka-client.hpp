/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-kafka-client.hpp
 * @brief Ktp_Broker_Client implemented over the librdkafka C API.
 *
 * A Ktp_Kafka_Client wraps one rd_kafka_t handle created for a producer or a
 * consumer role. The producer publishes one message at a time and polls the
 * handle until the delivery report of that message arrives, so publish()
 * returns the final delivery status (bounded by "message.timeout.ms").
 *
 * The consumer role is only used to query cluster metadata and partition
 * watermarks, it never subscribes to a topic.
 *
 * A Ktp_Kafka_Client is not thread safe, each worker creates its own through
 * Ktp_Kafka_Client::factory().
 */

#ifndef KTP_KAFKA_CLIENT_HPP_
#define KTP_KAFKA_CLIENT_HPP_

#include <chrono>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "rdkafka.h"

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-message.hpp"

#include "kafka/ktp-kafka-util.hpp"

namespace ktp {

class Ktp_Kafka_Client : public Ktp_Broker_Client {
public:
  /**
   * @brief Create the librdkafka handle, throw std::runtime_error if any
   *        setting is rejected or the handle can not be created.
   */
  Ktp_Kafka_Client(Role role, const KafkaConfigType &configs);
  virtual ~Ktp_Kafka_Client() noexcept;

  Ktp_Kafka_Client(const Ktp_Kafka_Client &obj) = delete;
  const Ktp_Kafka_Client &operator=(const Ktp_Kafka_Client &obj) = delete;
  Ktp_Kafka_Client(Ktp_Kafka_Client &&obj) = delete;
  Ktp_Kafka_Client &operator=(Ktp_Kafka_Client &&obj) = delete;

  /**
   * @brief The ClientFactory that builds a Ktp_Kafka_Client from the thread
   *        pool configuration.
   */
  static auto factory() -> ClientFactory;

  auto publish(std::string_view topic, std::string_view key,
               const std::optional<Ktp_Headers> &headers,
               std::string_view payload, int64_t timestamp_ms)
      -> int override;

  auto fetchMetadata(std::optional<std::string_view> topic,
                     std::chrono::milliseconds timeout)
      -> std::expected<Ktp_Cluster_Metadata, std::string> override;

  auto fetchWatermarks(std::string_view topic, int32_t partition,
                       std::chrono::milliseconds timeout)
      -> std::expected<std::pair<int64_t, int64_t>, std::string> override;

private:
  static void deliveryReportCallback(rd_kafka_t *kafka,
                                     const rd_kafka_message_t *msg,
                                     void *opaque);

  Role m_role{};
  rd_kafka_t *m_kafka{};
}; // class Ktp_Kafka_Client

} // namespace ktp

#endif // KTP_KAFKA_CLIENT_HPP_
