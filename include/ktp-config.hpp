/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-config.hpp
 * @brief Immutable configuration for the publish thread pool.
 *
 * A Ktp_Config is built once, validated, and then copied into every worker;
 * nothing mutates it afterward.
 *
 * The raw settings are a string key/value map (Ktp_Config::ConfigType) whose
 * keys are the KAFKA_* environment variable names:
 *
 * | Key                              | Value                                 |
 * | -------------------------------- | ------------------------------------- |
 * | KAFKA_ENABLED                    | "true" or "1" enables (default true)  |
 * | KAFKA_LOG_LABEL                  | label prefixed to every log line      |
 * | KAFKA_BROKERS                    | "host1:port,host2:port"               |
 * | KAFKA_TOPICS                     | "topic1,topic2"                       |
 * | KAFKA_PUBLISH_RETRY_INTERVAL_SEC | float seconds, default "1"            |
 * | KAFKA_PUBLISH_IDLE_INTERVAL_SEC  | float seconds, default "0.5"          |
 * | KAFKA_NUM_THREADS                | 1 - 255, default "5"                  |
 * | KAFKA_TLS_CLIENT_KEY             | optional path to the mTLS key         |
 * | KAFKA_TLS_CLIENT_CERT            | optional path to the mTLS certificate |
 * | KAFKA_TLS_CLIENT_CA              | optional path to the mTLS CA          |
 *
 * fromConfigType() validates the map, fromEnvironment() reads the same keys
 * from the process environment. Both return the reason as a string when a
 * value is invalid: unparsable numbers, a sleep interval of 1ms or less, or
 * zero threads. A disabled configuration is returned without validating the
 * other keys and has zero threads.
 */

#ifndef KTP_CONFIG_HPP_
#define KTP_CONFIG_HPP_

#include <chrono>
#include <expected>
#include <ostream>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ktp {

struct Ktp_Config {
  using ConfigType = std::unordered_map<std::string, std::string>;

  static constexpr std::string_view kEnabled = "KAFKA_ENABLED";
  static constexpr std::string_view kLogLabel = "KAFKA_LOG_LABEL";
  static constexpr std::string_view kBrokers = "KAFKA_BROKERS";
  static constexpr std::string_view kTopics = "KAFKA_TOPICS";
  static constexpr std::string_view kRetryIntervalSec =
      "KAFKA_PUBLISH_RETRY_INTERVAL_SEC";
  static constexpr std::string_view kIdleIntervalSec =
      "KAFKA_PUBLISH_IDLE_INTERVAL_SEC";
  static constexpr std::string_view kNumThreads = "KAFKA_NUM_THREADS";
  static constexpr std::string_view kTlsClientKey = "KAFKA_TLS_CLIENT_KEY";
  static constexpr std::string_view kTlsClientCert = "KAFKA_TLS_CLIENT_CERT";
  static constexpr std::string_view kTlsClientCa = "KAFKA_TLS_CLIENT_CA";

  static constexpr std::string_view kDefaultLabel = "ktp";

  std::string label{kDefaultLabel};
  bool is_enabled{};
  std::vector<std::string> broker_list{};
  std::set<std::string> publish_topics{};
  unsigned int num_threads{};
  std::chrono::milliseconds retry_sleep{};
  std::chrono::milliseconds idle_sleep{};
  std::string tls_key{};
  std::string tls_cert{};
  std::string tls_ca{};

  /**
   * @return true if any of the TLS key, certificate or CA paths is set, the
   *         broker connection is then mutual TLS instead of plaintext.
   */
  auto hasTls() const -> bool;

  /**
   * @return true if the broker list has at least one non-blank entry in
   *         its first position, the check a worker does before connecting.
   */
  auto hasBrokers() const -> bool;

  /**
   * @brief Build and validate a configuration from a key/value map.
   *
   * @param label   The default log label, overridden by KAFKA_LOG_LABEL
   * @param configs The key/value settings, missing keys take their defaults
   *
   * @return The validated configuration, or the reason it is invalid
   */
  static auto fromConfigType(std::string_view label, const ConfigType &configs)
      -> std::expected<Ktp_Config, std::string>;

  /**
   * @brief Build and validate a configuration from the KAFKA_* environment
   *        variables.
   */
  static auto fromEnvironment(std::string_view label = kDefaultLabel)
      -> std::expected<Ktp_Config, std::string>;
}; // struct Ktp_Config

auto toString(const Ktp_Config &config) -> std::string;

inline auto operator<<(std::ostream &os, const Ktp_Config &config)
    -> std::ostream & {
  return os << toString(config);
}

} // namespace ktp

#endif // KTP_CONFIG_HPP_
