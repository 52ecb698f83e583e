/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-metadata.cpp
 * @brief Read-only cluster metadata query with optional offset counts.
 */

#include "ktp-metadata.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-debug.hpp"

namespace ktp {

namespace {

auto idsToString(const std::vector<int32_t> &ids) -> std::string {
  std::ostringstream os{};

  os << "[";
  for (size_t index = 0; index < ids.size(); index++) {
    if (index > 0) {
      os << ", ";
    }

    os << ids[index];
  }
  os << "]";

  return os.str();
}

} // namespace

auto getMetadata(const Ktp_Config &config, Ktp_Broker_Client &client,
                 bool fetch_offsets, std::optional<std::string_view> topic)
    -> std::expected<Ktp_Metadata_Report, std::string> {
  auto cluster = client.fetchMetadata(topic, kMetadataTimeout);
  if (!cluster) {
    KTP_LOG_PRINT(std::cerr << config.label
                            << " - failed to fetch metadata: "
                            << cluster.error() << "\n");

    return std::unexpected(cluster.error());
  }

  Ktp_Metadata_Report report{};
  report.cluster = std::move(*cluster);

  KTP_LOG_PRINT(std::cout << config.label << " - cluster brokers="
                          << report.cluster.brokers.size()
                          << " topics=" << report.cluster.topics.size()
                          << "\n");

  for (const auto &broker : report.cluster.brokers) {
    KTP_LOG_PRINT(std::cout << config.label << " - broker id=" << broker.id
                            << " host=" << broker.host << ":" << broker.port
                            << "\n");
  }

  for (const auto &topic_info : report.cluster.topics) {
    // counted from zero for every topic
    int64_t message_count{};

    KTP_LOG_PRINT(std::cout << config.label << " - topic=" << topic_info.name
                            << " err=" << topic_info.error.value_or("none")
                            << " partitions=" << topic_info.partitions.size()
                            << "\n");

    for (const auto &partition : topic_info.partitions) {
      KTP_LOG_PRINT(std::cout << config.label << " - topic=" << topic_info.name
                              << " partition=" << partition.id
                              << " leader=" << partition.leader
                              << " replicas=" << idsToString(partition.replicas)
                              << " isr=" << idsToString(partition.isr)
                              << " err=" << partition.error.value_or("none")
                              << "\n");

      if (!fetch_offsets) {
        continue;
      }

      Ktp_Partition_Watermarks watermarks{partition.id, -1, -1};

      auto offsets = client.fetchWatermarks(topic_info.name, partition.id,
                                            kWatermarksTimeout);
      if (offsets) {
        watermarks.low = offsets->first;
        watermarks.high = offsets->second;
      } else {
        KTP_DEBUG_PRINT(std::cerr << config.label
                                  << " - failed to fetch watermarks topic="
                                  << topic_info.name
                                  << " partition=" << partition.id << ": "
                                  << offsets.error() << "\n");
      }

      message_count += watermarks.high - watermarks.low;

      KTP_LOG_PRINT(std::cout << config.label << " - topic="
                              << topic_info.name
                              << " partition=" << partition.id
                              << " low=" << watermarks.low
                              << " high=" << watermarks.high << "\n");

      report.watermarks[topic_info.name].push_back(watermarks);
    }

    if (fetch_offsets) {
      report.message_counts[topic_info.name] = message_count;

      KTP_LOG_PRINT(std::cout << config.label << " - topic="
                              << topic_info.name
                              << " messages=" << message_count << "\n");
    }
  }

  return report;
}

} // namespace ktp
