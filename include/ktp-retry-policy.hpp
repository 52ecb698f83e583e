/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-retry-policy.hpp
 * @brief The policy deciding how a worker retries a failed publish.
 *
 * A worker asks the policy for the delay before the next attempt after every
 * failed publish of the same message. std::nullopt means give up, the worker
 * then abandons the message and moves on to the next one.
 *
 * Ktp_Fixed_Retry_Policy waits the same interval between attempts, and by
 * default never gives up.
 */

#ifndef KTP_RETRY_POLICY_HPP_
#define KTP_RETRY_POLICY_HPP_

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>

#include "ktp-config.hpp"

namespace ktp {

class Ktp_Retry_Policy {
public:
  using Factory =
      std::function<std::unique_ptr<Ktp_Retry_Policy>(const Ktp_Config &)>;

  virtual ~Ktp_Retry_Policy() noexcept = default;

  /**
   * @brief The delay before the next publish attempt.
   *
   * @param attempt The number of failed attempts so far (1 after the first
   *                failure)
   *
   * @return The delay, or std::nullopt to abandon the message
   */
  virtual auto nextDelay(size_t attempt)
      -> std::optional<std::chrono::milliseconds> = 0;
}; // class Ktp_Retry_Policy

class Ktp_Fixed_Retry_Policy : public Ktp_Retry_Policy {
public:
  /**
   * @param interval     The delay between attempts
   * @param max_attempts The number of attempts before giving up, 0 is
   *                     unlimited
   */
  explicit Ktp_Fixed_Retry_Policy(std::chrono::milliseconds interval,
                                  size_t max_attempts = 0)
      : m_interval{interval}, m_max_attempts{max_attempts} {}

  auto nextDelay(size_t attempt)
      -> std::optional<std::chrono::milliseconds> override {
    if (m_max_attempts > 0 && attempt >= m_max_attempts) {
      return std::nullopt;
    }

    return m_interval;
  }

  /**
   * @brief The default factory, retry forever every config.retry_sleep.
   */
  static auto factory() -> Factory {
    return [](const Ktp_Config &config) -> std::unique_ptr<Ktp_Retry_Policy> {
      return std::make_unique<Ktp_Fixed_Retry_Policy>(config.retry_sleep);
    };
  }

private:
  std::chrono::milliseconds m_interval{};
  size_t m_max_attempts{};
}; // class Ktp_Fixed_Retry_Policy

} // namespace ktp

#endif // KTP_RETRY_POLICY_HPP_
