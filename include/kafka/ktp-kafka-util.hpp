/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-kafka-util.hpp
 * @brief Utility helpers for configuring librdkafka instances.
 *
 * set_config() wraps rd_kafka_conf_set() and returns a std::expected value
 * instead of relying on an output error-string buffer.
 *
 * buildKafkaConfigType() turns a Ktp_Config into the librdkafka key/value
 * settings for a producer or a consumer: "bootstrap.servers" from the broker
 * list, and either "security.protocol"=PLAINTEXT or SSL with the CA,
 * certificate and key locations and certificate verification enabled.
 *
 * The constant kKafkaErrorStringLength defines the size of the temporary
 * error string buffer required by librdkafka calls.
 */

#ifndef KTP_KAFKA_UTIL_HPP_

#define KTP_KAFKA_UTIL_HPP_

#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>

#include "rdkafka.h"

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"

namespace ktp {

constexpr size_t kKafkaErrorStringLength = 512;

using KafkaConfigType = std::unordered_map<std::string, std::string>;

/**
 * @brief The method sets kafka configuration to key value.
 *
 * @param conf  The rd_kafka_conf_t object to set the configuration' key value
 * @param key   The configuration key
 * @param value The configuration value
 *
 * @return It returns the RD_KAFKA_CONF_OK if everything is ok, else a string
 *         describing the kafka error
 */
auto set_config(rd_kafka_conf_t *conf, std::string_view key,
                std::string_view value)
    -> std::expected<rd_kafka_conf_res_t, std::string>;

/**
 * @brief The method builds the librdkafka settings for the role.
 *
 * @param config The thread pool configuration
 * @param role   Producer settings add "message.timeout.ms"
 *
 * @return The librdkafka key/value settings
 */
auto buildKafkaConfigType(const Ktp_Config &config,
                          Ktp_Broker_Client::Role role) -> KafkaConfigType;

} // namespace ktp

#endif // KTP_KAFKA_UTIL_HPP_
