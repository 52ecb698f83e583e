/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-worker.cpp
 * @brief One publishing thread of the pool.
 */

#include "ktp-worker.hpp"

#include <pthread.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-debug.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-proc.hpp"
#include "ktp-queue.hpp"
#include "ktp-retry-policy.hpp"

namespace ktp {

auto Ktp_Worker::Stats::operator+=(const Stats &rhs) -> Stats & {
  published += rhs.published;
  publish_failures += rhs.publish_failures;
  publish_abandoned += rhs.publish_abandoned;
  dropped_unsupported += rhs.dropped_unsupported;
  dropped_on_shutdown += rhs.dropped_on_shutdown;
  shutdown_requeued += rhs.shutdown_requeued;

  return *this;
}

Ktp_Worker::Ktp_Worker(size_t index, const Ktp_Config &config,
                       std::shared_ptr<Ktp_Queue> queue,
                       Ktp_Broker_Client::ClientFactory client_factory,
                       Ktp_Retry_Policy::Factory retry_factory)
    : Ktp_Proc{config.label + "-tid-" + std::to_string(index + 1)},
      m_label{config.label + "-tid-" + std::to_string(index + 1)},
      m_config{config}, m_queue{std::move(queue)},
      m_client_factory{std::move(client_factory)},
      m_retry_factory{std::move(retry_factory)} {
  if (!m_retry_factory) {
    m_retry_factory = Ktp_Fixed_Retry_Policy::factory();
  }
}

Ktp_Worker::~Ktp_Worker() noexcept try {
  // the thread uses the members below, it must be stopped before they are
  // destroyed and not later in ~Ktp_Proc().
  stopExec();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Ktp_Worker::start() -> bool {
  return exec([this]() { run(); });
}

auto Ktp_Worker::label() const -> const std::string & { return m_label; }

auto Ktp_Worker::workerState() const -> WorkerState {
  return m_worker_state.load();
}

auto Ktp_Worker::stats() const -> Stats {
  Stats stats{};

  stats.published = m_published.load();
  stats.publish_failures = m_publish_failures.load();
  stats.publish_abandoned = m_publish_abandoned.load();
  stats.dropped_unsupported = m_dropped_unsupported.load();
  stats.dropped_on_shutdown = m_dropped_on_shutdown.load();
  stats.shutdown_requeued = m_shutdown_requeued.load();

  return stats;
}

auto Ktp_Worker::lastError() const -> std::optional<Ktp_Error> {
  std::unique_lock<std::mutex> lock(m_last_error_mutex);

  return m_last_error;
}

void Ktp_Worker::setWorkerState(WorkerState state) {
  m_worker_state.store(state);
}

void Ktp_Worker::setLastError(Ktp_Error::Code code, std::string message) {
  Ktp_Error error{code, std::move(message)};

  KTP_LOG_PRINT(std::cerr << m_label << " - " << error << "\n");

  std::unique_lock<std::mutex> lock(m_last_error_mutex);
  m_last_error = std::move(error);
}

void Ktp_Worker::run() {
  if (!m_config.hasBrokers()) {
    setLastError(Ktp_Error::Code::kConnectionUnavailable,
                 "no kafka brokers configured, exiting");
    setWorkerState(WorkerState::kTerminated);

    return;
  }

  std::unique_ptr<Ktp_Broker_Client> client{};
  std::unique_ptr<Ktp_Retry_Policy> retry_policy{};

  try {
    client =
        m_client_factory(m_config, Ktp_Broker_Client::Role::kProducer);
    retry_policy = m_retry_factory(m_config);
  } catch (const std::exception &e) {
    setLastError(Ktp_Error::Code::kConnectionUnavailable,
                 std::string{"failed to create kafka producer: "} + e.what());
  }

  if (!client || !retry_policy) {
    if (!lastError()) {
      setLastError(Ktp_Error::Code::kConnectionUnavailable,
                   "failed to create kafka producer");
    }

    setWorkerState(WorkerState::kTerminated);

    return;
  }

  KTP_DEBUG_PRINT(std::cout << m_label << " - started with brokers="
                            << m_config.broker_list.front() << "\n");

  try {
    runLoop(*client, *retry_policy);
  } catch (const std::exception &e) {
    KTP_LOG_PRINT(std::cerr << m_label << " - stopped on error: " << e.what()
                            << "\n");
  }

  setWorkerState(WorkerState::kTerminated);

  KTP_DEBUG_PRINT(std::cout << m_label << " - terminated\n");
}

void Ktp_Worker::runLoop(Ktp_Broker_Client &client,
                         Ktp_Retry_Policy &retry_policy) {
  bool terminating{};

  while (!terminating) {
    setWorkerState(WorkerState::kDraining);

    const std::vector<Ktp_Message> batch = m_queue->drain();
    if (batch.empty()) {
      if (m_queue->isShutdownRequested()) {
        setWorkerState(WorkerState::kShuttingDown);

        KTP_DEBUG_PRINT(std::cout << m_label
                                  << " - shutdown requested, exiting\n");

        break;
      }

      setWorkerState(WorkerState::kIdle);
      m_queue->waitForWork(m_config.idle_sleep);

      continue;
    }

    terminating = processBatch(batch, client, retry_policy);
  }
}

auto Ktp_Worker::processBatch(const std::vector<Ktp_Message> &batch,
                              Ktp_Broker_Client &client,
                              Ktp_Retry_Policy &retry_policy) -> bool {
  bool terminating{};
  bool stop{};
  size_t index{};

  for (index = 0; index < batch.size() && !stop; index++) {
    const Ktp_Message &msg = batch[index];

    switch (msg.type()) {
    case ktp::PublishMessageTypePb::Shutdown: {
      const size_t num_remaining = batch.size() - index - 1;

      setWorkerState(WorkerState::kShuttingDown);
      terminating = true;
      stop = true;

      m_queue->requestShutdown();

      // the other workers racing on the queue must see it too
      auto requeued = m_queue->enqueue({msg});
      if (requeued) {
        m_shutdown_requeued++;
      } else {
        KTP_LOG_PRINT(std::cerr << m_label
                                << " - failed to requeue shutdown message: "
                                << requeued.error() << "\n");
      }

      if (num_remaining > 0) {
        m_dropped_on_shutdown += num_remaining;

        KTP_LOG_PRINT(std::cerr << m_label
                                << " - shutdown with unpublished messages="
                                << num_remaining << "\n");
      } else {
        KTP_DEBUG_PRINT(std::cout << m_label
                                  << " - shutdown with local batch drained\n");
      }

      break;
    }

    case ktp::PublishMessageTypePb::Data:
    case ktp::PublishMessageTypePb::Sensitive:
      setWorkerState(WorkerState::kPublishing);
      publishWithRetry(msg, client, retry_policy);
      break;

    case ktp::PublishMessageTypePb::LogBrokerDetails:
    case ktp::PublishMessageTypePb::LogBrokerTopicDetails:
      setLastError(Ktp_Error::Code::kUnsupportedMessageKind,
                   std::string{toString(msg.type())} +
                       " is not supported yet, dropping messages=" +
                       std::to_string(batch.size() - index));

      m_dropped_unsupported += batch.size() - index;
      stop = true;
      break;

    default:
      setLastError(Ktp_Error::Code::kUnsupportedMessageKind,
                   "unsupported message type=" +
                       std::to_string(static_cast<int>(msg.type())) +
                       ", dropping messages=" +
                       std::to_string(batch.size() - index));

      m_dropped_unsupported += batch.size() - index;
      stop = true;
      break;
    }
  }

  return terminating;
}

void Ktp_Worker::publishWithRetry(const Ktp_Message &msg,
                                  Ktp_Broker_Client &client,
                                  Ktp_Retry_Policy &retry_policy) {
  const std::optional<Ktp_Headers> headers = getHeaders(msg);
  size_t attempt{};

  while (true) {
    const int64_t timestamp_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count();

    int status{};

    {
      // a cancel requested while the client is in the broker library is
      // acted on once publish() returns
      Ktp_Proc_No_Cancel no_cancel{};

      status = client.publish(msg.topic(), msg.key(), headers, msg.payload(),
                              timestamp_ms);
    }

    pthread_testcancel();

    if (0 == status) {
      m_published++;

      KTP_DEBUG_PRINT(std::cout << m_label << " - published " << msg
                                << "\n");

      return;
    }

    attempt++;
    m_publish_failures++;

    // the Sensitive form of the message never prints its payload
    setLastError(Ktp_Error::Code::kPublishRejected,
                 "failed to publish with status=" + std::to_string(status) +
                     " attempt=" + std::to_string(attempt) + " " +
                     toString(msg));

    const auto delay = retry_policy.nextDelay(attempt);
    if (!delay) {
      m_publish_abandoned++;

      KTP_LOG_PRINT(std::cerr << m_label << " - abandoned after attempts="
                              << attempt << " topic=" << msg.topic()
                              << "\n");

      return;
    }

    // a cancellation point, so the pool can stop a worker stuck retrying
    std::this_thread::sleep_for(*delay);
  }
}

auto toString(Ktp_Worker::WorkerState state) -> std::string_view {
  switch (state) {
  case Ktp_Worker::WorkerState::kIdle:
    return "Idle";
  case Ktp_Worker::WorkerState::kDraining:
    return "Draining";
  case Ktp_Worker::WorkerState::kPublishing:
    return "Publishing";
  case Ktp_Worker::WorkerState::kShuttingDown:
    return "ShuttingDown";
  case Ktp_Worker::WorkerState::kTerminated:
    return "Terminated";
  }

  return "Unknown";
}

} // namespace ktp
