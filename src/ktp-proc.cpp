/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-proc.cpp
 * @brief A named pthread running one task, joined or cancelled by its owner.
 */

#include "ktp-proc.hpp"

#include <pthread.h>

#include <cerrno>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "ktp-debug.hpp"

namespace ktp {

namespace {

// pthread_setname_np() limit, 15 bytes plus the terminating null
constexpr size_t kMaxThreadNameLength = 15;

} // namespace

void cleanupFuncToUnlockPthreadMutex(void *arg) {
  pthread_mutex_unlock(static_cast<pthread_mutex_t *>(arg));
}

Ktp_Proc::Ktp_Proc(std::string_view name, Task task)
    : m_name{name}, m_task{std::move(task)} {}

Ktp_Proc::~Ktp_Proc() noexcept try {
  stopExec();
} catch (...) {
  // explicit return to resolve exception as destructor must be noexcept
  return;
}

auto Ktp_Proc::exec(Task task) -> bool {
  if (m_running) {
    throw std::runtime_error("Task is already running (" + m_name + ")");
  }

  if (task) {
    m_task = std::move(task);
  }

  if (!m_task) {
    throw std::runtime_error("No task is assigned (" + m_name + ")");
  }

  const int err = pthread_create(&m_th, nullptr, &Ktp_Proc::threadMain, this);
  if (0 != err) {
    KTP_LOG_PRINT(std::cerr << "failed to create thread " << m_name << ": "
                            << std::system_category().message(err) << "\n");

    return false;
  }

  m_running = true;

  const std::string thread_name = m_name.substr(0, kMaxThreadNameLength);
  pthread_setname_np(m_th, thread_name.c_str());

  return true;
}

auto Ktp_Proc::wait() -> bool {
  if (!m_running) {
    throw std::runtime_error("No task is exec (" + m_name + ")");
  }

  const int err = pthread_join(m_th, nullptr);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  m_running = false;

  return true;
}

auto Ktp_Proc::isRunning() const -> bool { return m_running; }

auto Ktp_Proc::name() const -> const std::string & { return m_name; }

auto Ktp_Proc::stopExec() -> bool {
  if (!m_running) {
    return true;
  }

  // ESRCH only means the thread already returned, the join below reaps it
  const int err = pthread_cancel(m_th);
  if (0 != err && ESRCH != err) {
    throw std::runtime_error(std::system_category().message(err));
  }

  return wait();
}

Ktp_Proc_No_Cancel::Ktp_Proc_No_Cancel() {
  const int err = pthread_setcancelstate(PTHREAD_CANCEL_DISABLE, &m_old_state);
  if (0 != err) {
    throw std::runtime_error(std::system_category().message(err));
  }
}

Ktp_Proc_No_Cancel::~Ktp_Proc_No_Cancel() noexcept {
  int old_state{};

  pthread_setcancelstate(m_old_state, &old_state);
}

auto Ktp_Proc::threadMain(void *context) -> void * {
  int old_value{};

  pthread_setcancelstate(PTHREAD_CANCEL_ENABLE, &old_value);
  pthread_setcanceltype(PTHREAD_CANCEL_DEFERRED, &old_value);

  auto *proc = static_cast<Ktp_Proc *>(context);
  proc->m_task();

  return nullptr;
}

} // namespace ktp
