/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-pool.hpp
 * @brief The pool of publishing workers sharing one work queue.
 *
 * Ktp_Pool::start() is the entry point of the library: it creates the
 * shared Ktp_Queue, starts config.num_threads Ktp_Worker threads (none when
 * the configuration is disabled) and returns the Ktp_Publisher facade that
 * the application uses to enqueue messages. It returns right away, the
 * workers connect to the brokers on their own threads.
 *
 * The pool is owned by the publisher. Workers stop cooperatively through
 * Ktp_Publisher::shutdown(); destroying the pool cancels and joins any worker
 * still running.
 */

#ifndef KTP_POOL_HPP_
#define KTP_POOL_HPP_

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-error.hpp"
#include "ktp-queue.hpp"
#include "ktp-retry-policy.hpp"
#include "ktp-worker.hpp"

namespace ktp {

class Ktp_Publisher;

class Ktp_Pool {
public:
  Ktp_Pool(const Ktp_Config &config, std::shared_ptr<Ktp_Queue> queue,
           Ktp_Broker_Client::ClientFactory client_factory,
           Ktp_Retry_Policy::Factory retry_factory);
  virtual ~Ktp_Pool() noexcept;

  Ktp_Pool(const Ktp_Pool &obj) = delete;
  const Ktp_Pool &operator=(const Ktp_Pool &obj) = delete;
  Ktp_Pool(Ktp_Pool &&obj) = delete;
  Ktp_Pool &operator=(Ktp_Pool &&obj) = delete;

  /**
   * @brief Start the workers and return the publisher facade.
   *
   * @param config         The validated configuration
   * @param client_factory Creates each worker's broker client, the default
   *                       is Ktp_Kafka_Client::factory()
   * @param retry_factory  Creates each worker's retry policy, the default
   *                       retries forever every config.retry_sleep
   *
   * @return The publisher facade owning the queue and the pool
   */
  static auto start(const Ktp_Config &config,
                    Ktp_Broker_Client::ClientFactory client_factory = {},
                    Ktp_Retry_Policy::Factory retry_factory = {})
      -> std::shared_ptr<Ktp_Publisher>;

  /**
   * @brief Join every worker still running.
   */
  void wait();

  auto numWorkers() const -> size_t;

  /**
   * @throws std::out_of_range if index is not a worker of the pool
   */
  auto workerState(size_t index) const -> Ktp_Worker::WorkerState;

  /**
   * @throws std::out_of_range if index is not a worker of the pool
   */
  auto lastError(size_t index) const -> std::optional<Ktp_Error>;

  /**
   * @return The sum of every worker's counters.
   */
  auto stats() const -> Ktp_Worker::Stats;

private:
  std::vector<std::unique_ptr<Ktp_Worker>> m_workers{};
}; // class Ktp_Pool

} // namespace ktp

#endif // KTP_POOL_HPP_
