/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp-error.hpp
 * @brief Error value returned through std::expected by the queue and the
 *        publisher facade.
 *
 * Queue level failures (kEmptyBatch, kLockFailure) are returned to the caller.
 * Ktp_Publisher::getMetadata() returns kNotEnabled for a disabled pool and
 * kConnectionUnavailable when the brokers can not be queried.
 *
 * Workers never return an error to the caller that enqueued the message. They
 * log it, count it in Ktp_Worker::Stats and keep the last one for
 * Ktp_Worker::lastError(): kConnectionUnavailable, kPublishRejected or
 * kUnsupportedMessageKind.
 */

#ifndef KTP_ERROR_HPP_
#define KTP_ERROR_HPP_

#include <ostream>
#include <string>
#include <string_view>

namespace ktp {

struct Ktp_Error {
  enum class Code {
    kEmptyBatch,
    kLockFailure,
    kConnectionUnavailable,
    kPublishRejected,
    kUnsupportedMessageKind,
    kNotEnabled
  };

  Code code{};
  std::string message{};
};

inline auto toString(Ktp_Error::Code code) -> std::string_view {
  switch (code) {
  case Ktp_Error::Code::kEmptyBatch:
    return "EmptyBatch";
  case Ktp_Error::Code::kLockFailure:
    return "LockFailure";
  case Ktp_Error::Code::kConnectionUnavailable:
    return "ConnectionUnavailable";
  case Ktp_Error::Code::kPublishRejected:
    return "PublishRejected";
  case Ktp_Error::Code::kUnsupportedMessageKind:
    return "UnsupportedMessageKind";
  case Ktp_Error::Code::kNotEnabled:
    return "NotEnabled";
  }

  return "Unknown";
}

inline auto operator<<(std::ostream &os, const Ktp_Error &error)
    -> std::ostream & {
  return os << toString(error.code) << ": " << error.message;
}

} // namespace ktp

#endif // KTP_ERROR_HPP_
