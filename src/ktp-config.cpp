/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-config.cpp
 * @brief Validation and printing of Ktp_Config.
 */

#include "ktp-config.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <expected>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ktp-debug.hpp"
#include "ktp-util.hpp"

namespace ktp {

namespace {

auto getValue(const Ktp_Config::ConfigType &configs, std::string_view key,
              std::string_view default_value) -> std::string {
  auto iter = configs.find(std::string{key});
  if (configs.end() == iter) {
    return std::string{default_value};
  }

  return iter->second;
}

/**
 * Seconds as a float ("0.5") into whole milliseconds, anything at or below
 * 1ms is rejected as it would make the worker busy-spin.
 */
auto parseIntervalSec(std::string_view key, const std::string &value)
    -> std::expected<std::chrono::milliseconds, std::string> {
  double seconds{};

  const auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), seconds);
  // from_chars() also accepts "nan" and "inf"
  if (std::errc{} != ec || value.data() + value.size() != ptr ||
      !std::isfinite(seconds)) {
    return std::unexpected("invalid sleep interval for " + std::string{key} +
                           "=" + value +
                           " please set to a positive float above 0.001");
  }

  const double millis = seconds * 1000.0;
  if (millis <= 1.0) {
    return std::unexpected("please use a positive float for the sleep "
                           "interval " +
                           std::string{key} + "=" + value +
                           " please set to a number above 0.001");
  }

  if (millis >=
      static_cast<double>(std::chrono::milliseconds::max().count())) {
    return std::unexpected("sleep interval out of range for " +
                           std::string{key} + "=" + value);
  }

  return std::chrono::milliseconds{
      static_cast<std::chrono::milliseconds::rep>(millis)};
}

auto parseNumThreads(const std::string &value)
    -> std::expected<unsigned int, std::string> {
  unsigned int num_threads{};

  const auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), num_threads);
  if (std::errc{} != ec || value.data() + value.size() != ptr ||
      num_threads > 255) {
    return std::unexpected("invalid number of threads for " +
                           std::string{Ktp_Config::kNumThreads} + "=" + value +
                           " please set to a number between 1-255");
  }

  if (0 == num_threads) {
    return std::unexpected("please use a valid number for the number of "
                           "threads " +
                           std::string{Ktp_Config::kNumThreads} + "=" + value +
                           " please set to a number between 1-255");
  }

  return num_threads;
}

} // namespace

auto Ktp_Config::hasTls() const -> bool {
  return !tls_key.empty() || !tls_cert.empty() || !tls_ca.empty();
}

auto Ktp_Config::hasBrokers() const -> bool {
  return !broker_list.empty() && !broker_list[0].empty();
}

auto Ktp_Config::fromConfigType(std::string_view label,
                                const ConfigType &configs)
    -> std::expected<Ktp_Config, std::string> {
  Ktp_Config config{};

  const std::string enabled = getValue(configs, kEnabled, "true");
  config.is_enabled = stringCompare(enabled, "true") || enabled == "1";

  if (!config.is_enabled) {
    config.label = std::string{label};

    KTP_LOG_PRINT(std::cout << "kafka disabled " << kEnabled << "=" << enabled
                            << "\n");

    return config;
  }

  config.label = getValue(configs, kLogLabel, label);
  config.tls_key = getValue(configs, kTlsClientKey, "");
  config.tls_cert = getValue(configs, kTlsClientCert, "");
  config.tls_ca = getValue(configs, kTlsClientCa, "");

  auto retry_sleep = parseIntervalSec(
      kRetryIntervalSec, getValue(configs, kRetryIntervalSec, "1"));
  if (!retry_sleep) {
    return std::unexpected(retry_sleep.error());
  }

  config.retry_sleep = *retry_sleep;

  auto idle_sleep = parseIntervalSec(
      kIdleIntervalSec, getValue(configs, kIdleIntervalSec, "0.5"));
  if (!idle_sleep) {
    return std::unexpected(idle_sleep.error());
  }

  config.idle_sleep = *idle_sleep;

  auto num_threads = parseNumThreads(getValue(configs, kNumThreads, "5"));
  if (!num_threads) {
    return std::unexpected(num_threads.error());
  }

  config.num_threads = *num_threads;

  // the broker list keeps blank entries, a worker refuses to connect to a
  // blank first broker.
  config.broker_list = splitString(getValue(configs, kBrokers, ""));

  for (auto &topic : splitString(getValue(configs, kTopics, ""))) {
    if (!topic.empty()) {
      config.publish_topics.insert(std::move(topic));
    }
  }

  KTP_DEBUG_PRINT(std::cout << "build config - " << config << "\n");

  return config;
}

auto Ktp_Config::fromEnvironment(std::string_view label)
    -> std::expected<Ktp_Config, std::string> {
  ConfigType configs{};

  for (const auto key :
       {kEnabled, kLogLabel, kBrokers, kTopics, kRetryIntervalSec,
        kIdleIntervalSec, kNumThreads, kTlsClientKey, kTlsClientCert,
        kTlsClientCa}) {
    const std::string name{key};
    const char *value = std::getenv(name.c_str());

    if (nullptr != value) {
      configs[name] = value;
    }
  }

  return fromConfigType(label, configs);
}

auto toString(const Ktp_Config &config) -> std::string {
  std::ostringstream os{};

  os << "Ktp_Config label=" << config.label
     << " enabled=" << (config.is_enabled ? "true" : "false")
     << " tls key=" << config.tls_key << " cert=" << config.tls_cert
     << " ca=" << config.tls_ca
     << " retry_sleep=" << config.retry_sleep.count() << "ms"
     << " idle_sleep=" << config.idle_sleep.count() << "ms"
     << " threads=" << config.num_threads
     << " broker_list=[" << joinString(config.broker_list, ", ") << "]"
     << " topics=[";

  bool first{true};
  for (const auto &topic : config.publish_topics) {
    os << (first ? "" : ", ") << topic;
    first = false;
  }

  os << "]";

  return os.str();
}

} // namespace ktp
