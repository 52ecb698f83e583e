/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-queue.cpp
 * @brief The shared work queue of messages pending publish.
 */

#include "ktp-queue.hpp"

#include <pthread.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <expected>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "ktp-debug.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-proc.hpp"

namespace ktp {

Ktp_Queue::Ktp_Queue() {
  pthread_mutexattr_t mutex_attr{};
  pthread_condattr_t cond_attr{};
  int err{};

  err = pthread_mutexattr_init(&mutex_attr);
  if (err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  err = pthread_mutexattr_setrobust(&mutex_attr, PTHREAD_MUTEX_ROBUST);
  if (err) {
    pthread_mutexattr_destroy(&mutex_attr);

    throw std::runtime_error(std::system_category().message(err));
  }

  err = pthread_mutex_init(&m_mutex, &mutex_attr);
  pthread_mutexattr_destroy(&mutex_attr);
  if (err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  err = pthread_condattr_init(&cond_attr);
  if (err) {
    pthread_mutex_destroy(&m_mutex);

    throw std::runtime_error(std::system_category().message(err));
  }

  err = pthread_condattr_setclock(&cond_attr, CLOCK_MONOTONIC);
  if (0 == err) {
    err = pthread_cond_init(&m_cond, &cond_attr);
  }

  pthread_condattr_destroy(&cond_attr);
  if (err) {
    pthread_mutex_destroy(&m_mutex);

    throw std::runtime_error(std::system_category().message(err));
  }
}

Ktp_Queue::~Ktp_Queue() noexcept try {
  // The destructor runs when the last holder (the facade or a worker)
  // releases the queue, so no other thread can be waiting on it.
  pthread_cond_destroy(&m_cond);
  pthread_mutex_destroy(&m_mutex);
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Ktp_Queue::lock() -> std::expected<void, Ktp_Error> {
  const int err = pthread_mutex_lock(&m_mutex);

  if (EOWNERDEAD == err) {
    // The previous holder died in the middle of an update, the queue content
    // can not be trusted: unlock without marking the mutex consistent so
    // that it stays poisoned for every later caller.
    pthread_mutex_unlock(&m_mutex);
  }

  if (err) {
    return std::unexpected(Ktp_Error{
        Ktp_Error::Code::kLockFailure,
        "failed to get lock on work queue with err=" +
            std::system_category().message(err)});
  }

  return {};
}

void Ktp_Queue::unlock() {
  const int err = pthread_mutex_unlock(&m_mutex);
  if (err) {
    throw std::runtime_error(std::system_category().message(err));
  }
}

auto Ktp_Queue::enqueue(std::vector<Ktp_Message> msgs)
    -> std::expected<size_t, Ktp_Error> {
  if (msgs.empty()) {
    KTP_LOG_PRINT(std::cerr << "no msgs to add\n");

    return std::unexpected(
        Ktp_Error{Ktp_Error::Code::kEmptyBatch, "no msgs to add"});
  }

  size_t num_msgs{};

  auto locked = lock();
  if (!locked) {
    KTP_LOG_PRINT(std::cerr << locked.error().message << "\n");

    return std::unexpected(locked.error());
  }

  KTP_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  std::move(msgs.begin(), msgs.end(), std::back_inserter(m_queue));
  num_msgs = m_queue.size();

  pthread_cond_broadcast(&m_cond);

  KTP_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return num_msgs;
}

auto Ktp_Queue::drain(size_t max_batch) -> std::vector<Ktp_Message> {
  std::vector<Ktp_Message> batch{};

  auto locked = lock();
  if (!locked) {
    KTP_LOG_PRINT(std::cerr << locked.error().message << "\n");

    return batch;
  }

  KTP_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  const size_t num_msgs = std::min(max_batch, m_queue.size());
  batch.reserve(num_msgs);

  for (size_t index = 0; index < num_msgs; index++) {
    batch.push_back(std::move(m_queue.front()));
    m_queue.pop_front();
  }

  KTP_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return batch;
}

auto Ktp_Queue::drainAll() -> std::vector<Ktp_Message> {
  std::vector<Ktp_Message> batch{};

  auto locked = lock();
  if (!locked) {
    KTP_LOG_PRINT(std::cerr << locked.error().message << "\n");

    return batch;
  }

  KTP_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  batch.assign(std::make_move_iterator(m_queue.begin()),
               std::make_move_iterator(m_queue.end()));
  m_queue.clear();

  KTP_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return batch;
}

auto Ktp_Queue::size() -> size_t {
  size_t num_msgs{};

  auto locked = lock();
  if (!locked) {
    KTP_LOG_PRINT(std::cerr << locked.error().message << "\n");

    return 0;
  }

  KTP_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  num_msgs = m_queue.size();

  KTP_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  unlock();

  return num_msgs;
}

auto Ktp_Queue::waitForWork(std::chrono::milliseconds timeout) -> bool {
  struct timespec deadline{};
  bool has_work{};
  int err{};

  clock_gettime(CLOCK_MONOTONIC, &deadline);

  deadline.tv_sec += timeout.count() / 1000L;
  deadline.tv_nsec += (timeout.count() % 1000L) * 1000000L;
  if (deadline.tv_nsec >= 1000000000L) {
    deadline.tv_sec += 1;
    deadline.tv_nsec -= 1000000000L;
  }

  auto locked = lock();
  if (!locked) {
    KTP_LOG_PRINT(std::cerr << locked.error().message << "\n");

    // nothing to wait on, sleep out the interval so the caller does not spin
    clock_nanosleep(CLOCK_MONOTONIC, TIMER_ABSTIME, &deadline, nullptr);

    return false;
  }

  KTP_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&m_mutex);

  while (m_queue.empty() && !m_shutdown_requested.load()) {
    err = pthread_cond_timedwait(&m_cond, &m_mutex, &deadline);
    if (err) {
      // ETIMEDOUT ends the wait, any other error is reported below with the
      // mutex state left as the wait returned it.
      break;
    }
  }

  has_work = !m_queue.empty();

  KTP_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();

  if (EOWNERDEAD == err) {
    // see lock(), the mutex is left poisoned
    pthread_mutex_unlock(&m_mutex);

    KTP_LOG_PRINT(std::cerr << "work queue lock owner died while waiting\n");

    return false;
  }

  unlock();

  if (err && ETIMEDOUT != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  return has_work;
}

void Ktp_Queue::requestShutdown() {
  m_shutdown_requested.store(true);

  auto locked = lock();
  if (!locked) {
    // a broadcast without the mutex is still valid, waiters may just miss
    // it and finish their timed wait.
    pthread_cond_broadcast(&m_cond);

    return;
  }

  pthread_cond_broadcast(&m_cond);

  unlock();
}

auto Ktp_Queue::isShutdownRequested() const -> bool {
  return m_shutdown_requested.load();
}

} // namespace ktp
