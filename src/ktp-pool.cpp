/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-pool.cpp
 * @brief The pool of publishing workers sharing one work queue.
 */

#include "ktp-pool.hpp"

#include <cstddef>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>
#include <vector>

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-debug.hpp"
#include "ktp-error.hpp"
#include "ktp-publisher.hpp"
#include "ktp-queue.hpp"
#include "ktp-retry-policy.hpp"
#include "ktp-worker.hpp"

#include "kafka/ktp-kafka-client.hpp"

namespace ktp {

Ktp_Pool::Ktp_Pool(const Ktp_Config &config, std::shared_ptr<Ktp_Queue> queue,
                   Ktp_Broker_Client::ClientFactory client_factory,
                   Ktp_Retry_Policy::Factory retry_factory) {
  if (!config.is_enabled) {
    return;
  }

  for (size_t index = 0; index < config.num_threads; index++) {
    auto worker = std::make_unique<Ktp_Worker>(index, config, queue,
                                               client_factory, retry_factory);

    if (!worker->start()) {
      KTP_LOG_PRINT(std::cerr << config.label
                              << " - failed to start worker "
                              << worker->label() << "\n");

      continue;
    }

    m_workers.push_back(std::move(worker));
  }

  KTP_DEBUG_PRINT(std::cout << config.label << " - started workers="
                            << m_workers.size() << "\n");
}

Ktp_Pool::~Ktp_Pool() noexcept try {
  // ~Ktp_Worker() cancels and joins a worker still running
  m_workers.clear();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Ktp_Pool::start(const Ktp_Config &config,
                     Ktp_Broker_Client::ClientFactory client_factory,
                     Ktp_Retry_Policy::Factory retry_factory)
    -> std::shared_ptr<Ktp_Publisher> {
  if (!client_factory) {
    client_factory = Ktp_Kafka_Client::factory();
  }

  if (!retry_factory) {
    retry_factory = Ktp_Fixed_Retry_Policy::factory();
  }

  auto queue = std::make_shared<Ktp_Queue>();
  auto pool = std::make_shared<Ktp_Pool>(config, queue, client_factory,
                                         std::move(retry_factory));

  return std::make_shared<Ktp_Publisher>(config, std::move(queue),
                                         std::move(pool),
                                         std::move(client_factory));
}

void Ktp_Pool::wait() {
  for (auto &worker : m_workers) {
    if (worker->isRunning()) {
      worker->wait();
    }
  }
}

auto Ktp_Pool::numWorkers() const -> size_t { return m_workers.size(); }

auto Ktp_Pool::workerState(size_t index) const -> Ktp_Worker::WorkerState {
  return m_workers.at(index)->workerState();
}

auto Ktp_Pool::lastError(size_t index) const -> std::optional<Ktp_Error> {
  return m_workers.at(index)->lastError();
}

auto Ktp_Pool::stats() const -> Ktp_Worker::Stats {
  Ktp_Worker::Stats stats{};

  for (const auto &worker : m_workers) {
    stats += worker->stats();
  }

  return stats;
}

} // namespace ktp
