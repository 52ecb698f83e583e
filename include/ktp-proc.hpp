/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-proc.hpp
 * @brief A named pthread running one task, joined or cancelled by its owner.
 *
 * Ktp_Proc runs a std::function<void()> on its own pthread. Every pool worker
 * is a Ktp_Proc, and the thread is named after the worker's log label so it
 * shows up in ps/top and debuggers (the kernel keeps the first 15 bytes).
 *
 * - exec() starts the thread, wait() joins it.
 * - Cancellation is deferred: a cancelled thread stops at its next
 *   cancellation point (condition wait, sleep, pthread_testcancel()).
 * - The destructor cancels and joins a thread still running. A subclass
 *   whose task uses the subclass' own members must call stopExec() from its
 *   own destructor, as those members are gone by the time ~Ktp_Proc() runs.
 *
 * The KTP_PROC_*_PTHREAD_MUTEX_CLEANUP macros bracket a region where the
 * calling thread holds a pthread mutex across a cancellation point, so that
 * a cancel inside the region releases the mutex:
 *
 *   lock(&mutex);
 *   KTP_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(&mutex);
 *   pthread_cond_timedwait(&cond, &mutex, &deadline);
 *   KTP_PROC_EXIT_PTHREAD_MUTEX_CLEANUP();
 *   unlock(&mutex);
 *
 * Ktp_Proc_No_Cancel disables cancellation of the calling thread for its
 * scope, around calls into C libraries that hold their own locks across
 * cancellation points. A cancel requested meanwhile stays pending, the caller
 * acts on it with pthread_testcancel() after the scope.
 */

#ifndef KTP_PROC_HPP_
#define KTP_PROC_HPP_

#include <pthread.h>

#include <functional>
#include <string>
#include <string_view>

#define KTP_PROC_ENTER_PTHREAD_MUTEX_CLEANUP(mutex)                            \
  pthread_cleanup_push(&ktp::cleanupFuncToUnlockPthreadMutex, (mutex))

#define KTP_PROC_EXIT_PTHREAD_MUTEX_CLEANUP(...) pthread_cleanup_pop(0)

namespace ktp {

/**
 * @brief pthread cleanup handler, arg is the pthread_mutex_t to unlock.
 */
void cleanupFuncToUnlockPthreadMutex(void *arg);

class Ktp_Proc {
public:
  using Task = std::function<void()>;

  /**
   * @param name The thread name, also used in error messages
   * @param task The task run by exec(), it can also be given to exec()
   */
  explicit Ktp_Proc(std::string_view name, Task task = {});
  virtual ~Ktp_Proc() noexcept;

  Ktp_Proc(const Ktp_Proc &obj) = delete;
  const Ktp_Proc &operator=(const Ktp_Proc &obj) = delete;
  Ktp_Proc(Ktp_Proc &&obj) = delete;
  Ktp_Proc &operator=(Ktp_Proc &&obj) = delete;

  /**
   * @brief Run the task in a new thread.
   *
   * @param task Replaces the task given at construction if set
   *
   * @return false if the thread can not be created
   *
   * @throws std::runtime_error if the thread is already running or there is
   *         no task to run
   */
  auto exec(Task task = {}) -> bool;

  /**
   * @brief Join the thread, the Ktp_Proc can then exec() again.
   *
   * @throws std::runtime_error if the thread is not running or can not be
   *         joined
   */
  auto wait() -> bool;

  auto isRunning() const -> bool;
  auto name() const -> const std::string &;

protected:
  /**
   * @brief Cancel the thread and join it, a no-op if it is not running.
   */
  auto stopExec() -> bool;

private:
  static auto threadMain(void *context) -> void *;

  const std::string m_name{};

  Task m_task{};
  bool m_running{};
  pthread_t m_th{};
}; // class Ktp_Proc

class Ktp_Proc_No_Cancel {
public:
  Ktp_Proc_No_Cancel();
  ~Ktp_Proc_No_Cancel() noexcept;

  Ktp_Proc_No_Cancel(const Ktp_Proc_No_Cancel &obj) = delete;
  const Ktp_Proc_No_Cancel &operator=(const Ktp_Proc_No_Cancel &obj) = delete;
  Ktp_Proc_No_Cancel(Ktp_Proc_No_Cancel &&obj) = delete;
  Ktp_Proc_No_Cancel &operator=(Ktp_Proc_No_Cancel &&obj) = delete;

private:
  int m_old_state{PTHREAD_CANCEL_ENABLE};
}; // class Ktp_Proc_No_Cancel

} // namespace ktp

#endif // KTP_PROC_HPP_
