/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-metadata.hpp
 * @brief Read-only cluster metadata query with optional offset counts.
 *
 * getMetadata() fetches the cluster metadata for one topic or for every
 * topic (30 seconds timeout). With fetch_offsets it also fetches the low and
 * high watermarks of every partition (1 second timeout each, (-1, -1) when
 * the query fails) and adds high - low to the topic's message count.
 *
 * The report is logged line by line with the configuration's label and
 * returned to the caller.
 */

#ifndef KTP_METADATA_HPP_
#define KTP_METADATA_HPP_

#include <chrono>
#include <cstdint>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"

namespace ktp {

constexpr std::chrono::milliseconds kMetadataTimeout{30000};
constexpr std::chrono::milliseconds kWatermarksTimeout{1000};

struct Ktp_Partition_Watermarks {
  int32_t partition{};
  int64_t low{-1};
  int64_t high{-1};
};

struct Ktp_Metadata_Report {
  Ktp_Cluster_Metadata cluster{};

  // per topic, only filled when offsets are fetched
  std::map<std::string, std::vector<Ktp_Partition_Watermarks>> watermarks{};
  std::map<std::string, int64_t> message_counts{};
};

/**
 * @brief Query the cluster metadata and log the report.
 *
 * @param config        The configuration, for its label
 * @param client        The broker client, normally of the consumer role
 * @param fetch_offsets true to fetch the partition watermarks
 * @param topic         The topic to query, std::nullopt for every topic
 *
 * @return The report, or the broker error string if the metadata can not be
 *         fetched
 */
auto getMetadata(const Ktp_Config &config, Ktp_Broker_Client &client,
                 bool fetch_offsets,
                 std::optional<std::string_view> topic = std::nullopt)
    -> std::expected<Ktp_Metadata_Report, std::string>;

} // namespace ktp

#endif // KTP_METADATA_HPP_
