/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-publisher.hpp
 * @brief The application facing facade of the publish thread pool.
 *
 * Ktp_Publisher is returned by Ktp_Pool::start() and is the only object the
 * application needs: it enqueues messages onto the shared Ktp_Queue for the
 * workers to publish, requests a cooperative shutdown and runs the read-only
 * metadata query.
 *
 * All the add methods return right away with the queue length after the
 * append. A disabled publisher accepts and drops every message, it returns
 * 0 from the add methods and an empty vector from drainMsgs().
 *
 * The facade is safe to share between threads, the queue serializes every
 * access.
 */

#ifndef KTP_PUBLISHER_HPP_
#define KTP_PUBLISHER_HPP_

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-metadata.hpp"
#include "ktp-pool.hpp"
#include "ktp-queue.hpp"

namespace ktp {

class Ktp_Publisher {
public:
  Ktp_Publisher(const Ktp_Config &config, std::shared_ptr<Ktp_Queue> queue,
                std::shared_ptr<Ktp_Pool> pool,
                Ktp_Broker_Client::ClientFactory client_factory);
  virtual ~Ktp_Publisher() noexcept = default;

  Ktp_Publisher(const Ktp_Publisher &obj) = delete;
  const Ktp_Publisher &operator=(const Ktp_Publisher &obj) = delete;
  Ktp_Publisher(Ktp_Publisher &&obj) = delete;
  Ktp_Publisher &operator=(Ktp_Publisher &&obj) = delete;

  /**
   * @brief Build a Data message and enqueue it.
   *
   * @return The queue length after the append, 0 if disabled, or the queue
   *         error
   */
  auto addDataMsg(std::string_view topic, std::string_view key,
                  const std::optional<Ktp_Headers> &headers,
                  std::string_view payload)
      -> std::expected<size_t, Ktp_Error>;

  auto addMsg(Ktp_Message msg) -> std::expected<size_t, Ktp_Error>;

  /**
   * @brief Enqueue the messages in order, an empty vector is kEmptyBatch.
   */
  auto addMsgs(std::vector<Ktp_Message> msgs)
      -> std::expected<size_t, Ktp_Error>;

  /**
   * @brief Remove and return every pending message.
   */
  auto drainMsgs() -> std::vector<Ktp_Message>;

  /**
   * @brief Enqueue one Shutdown message for the workers, does not wait for
   *        them to stop (see pool()->wait()).
   *
   * @return "shutdown started", or "kafka not enabled" if disabled
   */
  auto shutdown() -> std::expected<std::string, Ktp_Error>;

  /**
   * @brief Run the metadata query with a consumer-role broker client.
   *
   * @return The report, or kNotEnabled ("kafka not enabled") without
   *         connecting when disabled, or kConnectionUnavailable with the
   *         broker error
   */
  auto getMetadata(bool fetch_offsets,
                   std::optional<std::string_view> topic = std::nullopt)
      -> std::expected<Ktp_Metadata_Report, Ktp_Error>;

  auto config() const -> const Ktp_Config &;
  auto pool() const -> std::shared_ptr<Ktp_Pool>;

private:
  const Ktp_Config m_config{};
  std::shared_ptr<Ktp_Queue> m_queue{};
  std::shared_ptr<Ktp_Pool> m_pool{};
  Ktp_Broker_Client::ClientFactory m_client_factory{};
}; // class Ktp_Publisher

} // namespace ktp

#endif // KTP_PUBLISHER_HPP_
