/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-worker.hpp
 * @brief One publishing thread of the pool.
 *
 * A Ktp_Worker is a Ktp_Proc that loops over the shared Ktp_Queue:
 *
 *   kDraining ---- empty batch ----> kIdle (timed wait, woken on enqueue)
 *       |                              |
 *       | batch                        +--> kDraining
 *       v
 *   kPublishing (front to back, Data and Sensitive are published and
 *       |        retried through the Ktp_Retry_Policy)
 *       |
 *       +-- Shutdown message or shutdown broadcast --> kShuttingDown
 *                                                       --> kTerminated
 *
 * When a worker drains a Shutdown message it raises the queue's shutdown
 * broadcast, requeues a copy of the message for the other workers and drops
 * the rest of its local batch. LogBrokerDetails, LogBrokerTopicDetails and
 * any other unsupported type drop the rest of the local batch. Every drop is
 * counted in Stats.
 *
 * A worker with an empty broker list (or a blank first broker) never
 * connects, it logs the error and terminates immediately.
 *
 * Worker failures are never returned to the caller that enqueued the message.
 * They are logged, and the last one is kept for lastError():
 * kConnectionUnavailable when the worker can not get a broker client,
 * kPublishRejected for a failed publish attempt and kUnsupportedMessageKind
 * for a dropped batch.
 *
 * publish() of the broker client runs with pthread cancellation disabled, a
 * worker cancelled by the pool in the middle of a publish stops right after it.
 *
 * Each worker owns its broker client, created from the ClientFactory on the
 * worker thread, so no client is ever shared between threads.
 */

#ifndef KTP_WORKER_HPP_
#define KTP_WORKER_HPP_

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-proc.hpp"
#include "ktp-queue.hpp"
#include "ktp-retry-policy.hpp"

namespace ktp {

class Ktp_Worker : public Ktp_Proc {
public:
  enum class WorkerState {
    kIdle,
    kDraining,
    kPublishing,
    kShuttingDown,
    kTerminated
  };

  struct Stats {
    size_t published{};
    size_t publish_failures{};
    size_t publish_abandoned{};
    size_t dropped_unsupported{};
    size_t dropped_on_shutdown{};
    size_t shutdown_requeued{};

    auto operator+=(const Stats &rhs) -> Stats &;
  };

  /**
   * @param index          The worker position in the pool, the log label is
   *                       "<config.label>-tid-<index + 1>"
   * @param config         The worker's own copy of the configuration
   * @param queue          The shared work queue
   * @param client_factory Creates the worker's broker client
   * @param retry_factory  Creates the worker's retry policy
   */
  Ktp_Worker(size_t index, const Ktp_Config &config,
             std::shared_ptr<Ktp_Queue> queue,
             Ktp_Broker_Client::ClientFactory client_factory,
             Ktp_Retry_Policy::Factory retry_factory);
  virtual ~Ktp_Worker() noexcept;

  Ktp_Worker(const Ktp_Worker &obj) = delete;
  const Ktp_Worker &operator=(const Ktp_Worker &obj) = delete;
  Ktp_Worker(Ktp_Worker &&obj) = delete;
  Ktp_Worker &operator=(Ktp_Worker &&obj) = delete;

  /**
   * @brief Start the worker thread.
   */
  auto start() -> bool;

  auto label() const -> const std::string &;
  auto workerState() const -> WorkerState;
  auto stats() const -> Stats;
  auto lastError() const -> std::optional<Ktp_Error>;

private:
  void run();
  void runLoop(Ktp_Broker_Client &client, Ktp_Retry_Policy &retry_policy);

  /**
   * @return true if the batch has a Shutdown message and the worker must
   *         terminate.
   */
  auto processBatch(const std::vector<Ktp_Message> &batch,
                    Ktp_Broker_Client &client,
                    Ktp_Retry_Policy &retry_policy) -> bool;

  void publishWithRetry(const Ktp_Message &msg, Ktp_Broker_Client &client,
                        Ktp_Retry_Policy &retry_policy);

  void setWorkerState(WorkerState state);
  void setLastError(Ktp_Error::Code code, std::string message);

  const std::string m_label{};
  const Ktp_Config m_config{};
  std::shared_ptr<Ktp_Queue> m_queue{};
  Ktp_Broker_Client::ClientFactory m_client_factory{};
  Ktp_Retry_Policy::Factory m_retry_factory{};

  std::atomic<WorkerState> m_worker_state{WorkerState::kIdle};

  std::atomic<size_t> m_published{};
  std::atomic<size_t> m_publish_failures{};
  std::atomic<size_t> m_publish_abandoned{};
  std::atomic<size_t> m_dropped_unsupported{};
  std::atomic<size_t> m_dropped_on_shutdown{};
  std::atomic<size_t> m_shutdown_requeued{};

  mutable std::mutex m_last_error_mutex{};
  std::optional<Ktp_Error> m_last_error{};
}; // class Ktp_Worker

auto toString(Ktp_Worker::WorkerState state) -> std::string_view;

inline auto operator<<(std::ostream &os, Ktp_Worker::WorkerState state)
    -> std::ostream & {
  return os << toString(state);
}

} // namespace ktp

#endif // KTP_WORKER_HPP_
