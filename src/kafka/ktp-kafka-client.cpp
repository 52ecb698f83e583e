/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-kafka-client.cpp
 * @brief Ktp_Broker_Client implemented over the librdkafka C API.
 */

#include "kafka/ktp-kafka-client.hpp"

#include <chrono>
#include <cstdint>
#include <expected>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "rdkafka.h"

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-debug.hpp"
#include "ktp-message.hpp"
#include "ktp-proc.hpp"

#include "kafka/ktp-kafka-util.hpp"

namespace ktp {

namespace {

constexpr int kPollIntervalMs = 100;

// The delivery report of one publish() call, passed as the message opaque.
struct DeliveryReport {
  bool done{};
  rd_kafka_resp_err_t err{RD_KAFKA_RESP_ERR_NO_ERROR};
};

} // namespace

Ktp_Kafka_Client::Ktp_Kafka_Client(Role role, const KafkaConfigType &configs)
    : m_role{role} {
  char err_str[kKafkaErrorStringLength]{};
  rd_kafka_conf_t *conf = rd_kafka_conf_new();

  for (const auto &[key, value] : configs) {
    auto res = set_config(conf, key, value);
    if (!res) {
      rd_kafka_conf_destroy(conf);

      throw std::runtime_error("failed to set kafka config " + key + ": " +
                               res.error());
    }
  }

  rd_kafka_type_t kafka_type{RD_KAFKA_CONSUMER};
  if (Role::kProducer == m_role) {
    rd_kafka_conf_set_dr_msg_cb(conf,
                                &Ktp_Kafka_Client::deliveryReportCallback);
    kafka_type = RD_KAFKA_PRODUCER;
  }

  m_kafka = rd_kafka_new(kafka_type, conf, err_str, sizeof(err_str));
  if (nullptr == m_kafka) {
    // conf is only owned by the handle when rd_kafka_new() succeeds
    rd_kafka_conf_destroy(conf);

    throw std::runtime_error(std::string{"failed to create kafka client: "} +
                             err_str);
  }
}

Ktp_Kafka_Client::~Ktp_Kafka_Client() noexcept try {
  if (nullptr != m_kafka) {
    if (Role::kProducer == m_role) {
      rd_kafka_flush(m_kafka, kPollIntervalMs * 10);
    }

    rd_kafka_destroy(m_kafka);
    m_kafka = nullptr;
  }
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Ktp_Kafka_Client::factory() -> ClientFactory {
  return [](const Ktp_Config &config,
            Role role) -> std::unique_ptr<Ktp_Broker_Client> {
    return std::make_unique<Ktp_Kafka_Client>(
        role, buildKafkaConfigType(config, role));
  };
}

void Ktp_Kafka_Client::deliveryReportCallback(rd_kafka_t *kafka,
                                              const rd_kafka_message_t *msg,
                                              void *opaque) {
  auto *report = static_cast<DeliveryReport *>(msg->_private);
  if (nullptr == report) {
    return;
  }

  report->err = msg->err;
  report->done = true;
}

auto Ktp_Kafka_Client::publish(std::string_view topic, std::string_view key,
                               const std::optional<Ktp_Headers> &headers,
                               std::string_view payload, int64_t timestamp_ms)
    -> int {
  DeliveryReport report{};
  rd_kafka_headers_t *kafka_headers{};

  if (Role::kProducer != m_role) {
    return static_cast<int>(RD_KAFKA_RESP_ERR__INVALID_ARG);
  }

  if (headers) {
    kafka_headers = rd_kafka_headers_new(headers->size());

    for (const auto &[name, value] : *headers) {
      rd_kafka_header_add(kafka_headers, name.c_str(),
                          static_cast<ssize_t>(name.size()), value.data(),
                          static_cast<ssize_t>(value.size()));
    }
  }

  const std::string topic_str{topic};

  // no thread cancel until the delivery report: librdkafka keeps &report as
  // the message opaque and waits with its own locks held
  Ktp_Proc_No_Cancel no_cancel{};

  rd_kafka_resp_err_t err = rd_kafka_producev(
      m_kafka, RD_KAFKA_V_TOPIC(topic_str.c_str()),
      RD_KAFKA_V_KEY(const_cast<char *>(key.data()), key.size()),
      RD_KAFKA_V_VALUE(const_cast<char *>(payload.data()), payload.size()),
      RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY),
      RD_KAFKA_V_TIMESTAMP(timestamp_ms), RD_KAFKA_V_HEADERS(kafka_headers),
      RD_KAFKA_V_OPAQUE(&report), RD_KAFKA_V_END);
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    // the headers are only owned by librdkafka when the produce succeeds
    if (nullptr != kafka_headers) {
      rd_kafka_headers_destroy(kafka_headers);
    }

    KTP_DEBUG_PRINT(std::cerr << "failed to produce to topic " << topic_str
                              << ": " << rd_kafka_err2str(err) << "\n");

    return static_cast<int>(err);
  }

  // message.timeout.ms bounds the wait, librdkafka always reports the
  // delivery (success or failure) of a queued message.
  while (!report.done) {
    rd_kafka_poll(m_kafka, kPollIntervalMs);
  }

  if (RD_KAFKA_RESP_ERR_NO_ERROR != report.err) {
    KTP_DEBUG_PRINT(std::cerr << "failed to deliver to topic " << topic_str
                              << ": " << rd_kafka_err2str(report.err)
                              << "\n");
  }

  return static_cast<int>(report.err);
}

auto Ktp_Kafka_Client::fetchMetadata(std::optional<std::string_view> topic,
                                     std::chrono::milliseconds timeout)
    -> std::expected<Ktp_Cluster_Metadata, std::string> {
  const struct rd_kafka_metadata *metadata{};
  rd_kafka_topic_t *kafka_topic{};

  if (topic) {
    const std::string topic_str{*topic};

    kafka_topic = rd_kafka_topic_new(m_kafka, topic_str.c_str(), nullptr);
    if (nullptr == kafka_topic) {
      return std::unexpected(
          std::string{rd_kafka_err2str(rd_kafka_last_error())});
    }
  }

  rd_kafka_resp_err_t err =
      rd_kafka_metadata(m_kafka, nullptr == kafka_topic ? 1 : 0, kafka_topic,
                        &metadata, static_cast<int>(timeout.count()));

  if (nullptr != kafka_topic) {
    rd_kafka_topic_destroy(kafka_topic);
  }

  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    return std::unexpected(std::string{rd_kafka_err2str(err)});
  }

  Ktp_Cluster_Metadata cluster{};

  for (int index = 0; index < metadata->broker_cnt; index++) {
    const auto &broker = metadata->brokers[index];

    cluster.brokers.push_back(
        Ktp_Broker_Info{broker.id, broker.host, broker.port});
  }

  for (int index = 0; index < metadata->topic_cnt; index++) {
    const auto &kafka_topic_md = metadata->topics[index];
    Ktp_Topic_Info topic_info{};

    topic_info.name = kafka_topic_md.topic;
    if (RD_KAFKA_RESP_ERR_NO_ERROR != kafka_topic_md.err) {
      topic_info.error = rd_kafka_err2str(kafka_topic_md.err);
    }

    for (int part_index = 0; part_index < kafka_topic_md.partition_cnt;
         part_index++) {
      const auto &kafka_partition = kafka_topic_md.partitions[part_index];
      Ktp_Partition_Info partition{};

      partition.id = kafka_partition.id;
      partition.leader = kafka_partition.leader;
      partition.replicas.assign(kafka_partition.replicas,
                                kafka_partition.replicas +
                                    kafka_partition.replica_cnt);
      partition.isr.assign(kafka_partition.isrs,
                           kafka_partition.isrs + kafka_partition.isr_cnt);
      if (RD_KAFKA_RESP_ERR_NO_ERROR != kafka_partition.err) {
        partition.error = rd_kafka_err2str(kafka_partition.err);
      }

      topic_info.partitions.push_back(std::move(partition));
    }

    cluster.topics.push_back(std::move(topic_info));
  }

  rd_kafka_metadata_destroy(metadata);

  return cluster;
}

auto Ktp_Kafka_Client::fetchWatermarks(std::string_view topic,
                                       int32_t partition,
                                       std::chrono::milliseconds timeout)
    -> std::expected<std::pair<int64_t, int64_t>, std::string> {
  int64_t low{-1};
  int64_t high{-1};
  const std::string topic_str{topic};

  rd_kafka_resp_err_t err = rd_kafka_query_watermark_offsets(
      m_kafka, topic_str.c_str(), partition, &low, &high,
      static_cast<int>(timeout.count()));
  if (RD_KAFKA_RESP_ERR_NO_ERROR != err) {
    return std::unexpected(std::string{rd_kafka_err2str(err)});
  }

  return std::make_pair(low, high);
}

} // namespace ktp
