/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-queue.hpp
 * @brief The shared work queue of messages pending publish.
 *
 * Overview
 * --------
 * Ktp_Queue is the only shared mutable object of the thread pool: the
 * publisher facade appends to it and every worker drains batches from it.
 * It is owned through std::shared_ptr by the facade and by each worker.
 *
 * Synchronization and semantics
 * -----------------------------
 * - A single pthread mutex (m_mutex) protects the std::deque m_queue. It is
 *   held only for the in-memory append or drain, never across publish I/O
 *   or sleeps.
 * - The mutex is robust: if a thread dies while holding it, the next lock
 *   reports EOWNERDEAD. The queue then leaves the mutex unrecoverable
 *   (poisoned) and every later operation reports a lock failure instead of
 *   blocking or retrying.
 * - enqueue() returns std::expected: kEmptyBatch for zero messages and
 *   kLockFailure when the lock cannot be acquired.
 * - drain() returns up to max_batch messages from the front in FIFO order.
 *   On lock failure it logs and returns an empty vector, which the caller
 *   treats as "nothing to do".
 * - A pthread condition variable (m_cond) is signalled on enqueue and on
 *   shutdown request so that idle workers blocked in waitForWork() wake up
 *   early instead of sleeping out their full idle interval.
 *
 * Shutdown broadcast
 * ------------------
 * - requestShutdown() raises a flag observed by every worker. A worker that
 *   drains a Shutdown message raises it, and also requeues the message for
 *   the workers racing on the queue.
 */

#ifndef KTP_QUEUE_HPP_
#define KTP_QUEUE_HPP_

#include <pthread.h>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <expected>
#include <vector>

#include "ktp-error.hpp"
#include "ktp-message.hpp"

namespace ktp {

class Ktp_Queue {
public:
  static constexpr size_t kDefaultDrainBatch = 10;

  Ktp_Queue();
  virtual ~Ktp_Queue() noexcept;

  Ktp_Queue(const Ktp_Queue &obj) = delete;
  const Ktp_Queue &operator=(const Ktp_Queue &obj) = delete;
  Ktp_Queue(Ktp_Queue &&obj) = delete;
  Ktp_Queue &operator=(Ktp_Queue &&obj) = delete;

  /**
   * @brief Append all messages to the back of the queue, preserving order.
   *
   * @param msgs The messages to append
   *
   * @return The number of messages in the queue after the append, or
   *         kEmptyBatch if msgs is empty, or kLockFailure if the queue lock
   *         cannot be acquired.
   */
  auto enqueue(std::vector<Ktp_Message> msgs)
      -> std::expected<size_t, Ktp_Error>;

  /**
   * @brief Remove and return up to max_batch messages from the front.
   *
   * @param max_batch The maximum number of messages to remove
   *
   * @return The removed messages in queue order, empty if there is none or
   *         the lock cannot be acquired.
   */
  auto drain(size_t max_batch = kDefaultDrainBatch)
      -> std::vector<Ktp_Message>;

  /**
   * @brief Remove and return every message in the queue.
   */
  auto drainAll() -> std::vector<Ktp_Message>;

  /**
   * @return The number of pending messages, 0 if the lock cannot be acquired.
   */
  auto size() -> size_t;

  /**
   * @brief Block the caller until the queue has messages, a shutdown is
   *        requested, or timeout elapses. This is a pthread cancellation
   *        point.
   *
   * @param timeout The maximum time to wait
   *
   * @return true if the queue has messages when the wait ends
   */
  auto waitForWork(std::chrono::milliseconds timeout) -> bool;

  /**
   * @brief Raise the shutdown broadcast flag and wake every waiting worker.
   */
  void requestShutdown();

  auto isShutdownRequested() const -> bool;

protected:
  /**
   * @brief Lock m_mutex, kLockFailure if a previous holder died with it.
   */
  auto lock() -> std::expected<void, Ktp_Error>;
  void unlock();

private:
  std::deque<Ktp_Message> m_queue{};
  pthread_mutex_t m_mutex{};
  pthread_cond_t m_cond{}; // signalled on enqueue and on shutdown request
  std::atomic<bool> m_shutdown_requested{};
}; // class Ktp_Queue

} // namespace ktp

#endif // KTP_QUEUE_HPP_
