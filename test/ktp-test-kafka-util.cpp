/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 */

#include <gtest/gtest.h>

#include <iostream>
#include <stdexcept>
#include <string>

#include "rdkafka.h"

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"

#include "kafka/ktp-kafka-client.hpp"
#include "kafka/ktp-kafka-util.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  // set_config
  rd_kafka_conf_t *conf = rd_kafka_conf_new();

  auto res = ktp::set_config(conf, "bootstrap.servers", "localhost:9092");
  EXPECT_TRUE(res.has_value());
  EXPECT_TRUE(RD_KAFKA_CONF_OK == *res);

  res = ktp::set_config(conf, "no.such.kafka.setting", "1");
  EXPECT_FALSE(res.has_value());
  std::cout << "unknown setting: " << res.error() << "\n";

  res = ktp::set_config(conf, "message.timeout.ms", "not a number");
  EXPECT_FALSE(res.has_value());

  rd_kafka_conf_destroy(conf);

  // plaintext producer settings
  ktp::Ktp_Config::ConfigType configs{};
  configs[std::string{ktp::Ktp_Config::kBrokers}] = "host1:9092,host2:9092";

  auto config = ktp::Ktp_Config::fromConfigType("ktp-test", configs);
  EXPECT_TRUE(config.has_value());

  const ktp::Ktp_Config plaintext_config = *config;

  auto producer_configs = ktp::buildKafkaConfigType(
      *config, ktp::Ktp_Broker_Client::Role::kProducer);
  EXPECT_EQ("host1:9092,host2:9092", producer_configs["bootstrap.servers"]);
  EXPECT_EQ("PLAINTEXT", producer_configs["security.protocol"]);
  EXPECT_EQ("5000", producer_configs["message.timeout.ms"]);
  EXPECT_FALSE(producer_configs.contains("ssl.ca.location"));

  // mutual TLS consumer settings
  configs[std::string{ktp::Ktp_Config::kTlsClientCa}] = "/tmp/ca.pem";
  configs[std::string{ktp::Ktp_Config::kTlsClientCert}] = "/tmp/cert.pem";
  configs[std::string{ktp::Ktp_Config::kTlsClientKey}] = "/tmp/key.pem";

  config = ktp::Ktp_Config::fromConfigType("ktp-test", configs);
  auto consumer_configs = ktp::buildKafkaConfigType(
      *config, ktp::Ktp_Broker_Client::Role::kConsumer);
  EXPECT_EQ("SSL", consumer_configs["security.protocol"]);
  EXPECT_EQ("/tmp/ca.pem", consumer_configs["ssl.ca.location"]);
  EXPECT_EQ("/tmp/cert.pem", consumer_configs["ssl.certificate.location"]);
  EXPECT_EQ("/tmp/key.pem", consumer_configs["ssl.key.location"]);
  EXPECT_EQ("true", consumer_configs["enable.ssl.certificate.verification"]);
  EXPECT_FALSE(consumer_configs.contains("message.timeout.ms"));

  // a rejected setting fails the client creation, no broker is contacted
  ktp::KafkaConfigType bad_configs{{"no.such.kafka.setting", "1"}};
  EXPECT_THROW((ktp::Ktp_Kafka_Client{
                   ktp::Ktp_Broker_Client::Role::kProducer, bad_configs}),
               std::runtime_error);

  // the handles are created without connecting to the brokers
  auto producer = ktp::Ktp_Kafka_Client::factory()(
      plaintext_config, ktp::Ktp_Broker_Client::Role::kProducer);
  EXPECT_TRUE(nullptr != producer);

  auto consumer = ktp::Ktp_Kafka_Client::factory()(
      plaintext_config, ktp::Ktp_Broker_Client::Role::kConsumer);
  EXPECT_TRUE(nullptr != consumer);

  return RUN_ALL_TESTS();
}
