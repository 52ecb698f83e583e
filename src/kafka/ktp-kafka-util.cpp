/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-kafka-util.cpp
 * @brief Implementation of the librdkafka configuration helpers.
 */

#include "kafka/ktp-kafka-util.hpp"

#include <cassert>
#include <expected>
#include <string>
#include <string_view>

#include "rdkafka.h"

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-util.hpp"

namespace ktp {

auto set_config(rd_kafka_conf_t *config, std::string_view key,
                std::string_view value)
    -> std::expected<rd_kafka_conf_res_t, std::string> {
  char err_str[kKafkaErrorStringLength]{};
  rd_kafka_conf_res_t res{};

  assert(nullptr != config ||
         nullptr == "config parameter must not be nullptr");

  // string_view is not guaranteed to be null terminated
  const std::string key_str{key};
  const std::string value_str{value};

  res = rd_kafka_conf_set(config, key_str.c_str(), value_str.c_str(), err_str,
                          sizeof(err_str));
  if (RD_KAFKA_CONF_OK != res) {
    std::string unexpected_err_str{err_str};

    return std::unexpected(unexpected_err_str);
  }

  return res;
}

auto buildKafkaConfigType(const Ktp_Config &config,
                          Ktp_Broker_Client::Role role) -> KafkaConfigType {
  KafkaConfigType configs{};

  configs["bootstrap.servers"] = joinString(config.broker_list);

  if (Ktp_Broker_Client::Role::kProducer == role) {
    configs["message.timeout.ms"] = "5000";
  }

  if (config.hasTls()) {
    configs["security.protocol"] = "SSL";
    configs["ssl.ca.location"] = config.tls_ca;
    configs["ssl.key.location"] = config.tls_key;
    configs["ssl.certificate.location"] = config.tls_cert;
    configs["enable.ssl.certificate.verification"] = "true";
  } else {
    configs["security.protocol"] = "PLAINTEXT";
  }

  return configs;
}

} // namespace ktp
