/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file include/ktp-util.hpp
 * @brief Small, header-only string helpers used across the Ktp project.
 *
 *  - stringCompare(...) : compare two strings with optional case-insensitive
 *    mode (ASCII only).
 *  - splitString(...)   : split a delimited list such as the KAFKA_BROKERS
 *    value "host1:9092,host2:9092" into its fields. Empty fields are kept so
 *    that a blank list stays observable to the caller.
 *  - joinString(...)    : the reverse of splitString(), used to build the
 *    librdkafka "bootstrap.servers" value.
 */

#ifndef KTP_UTIL_HPP_
#define KTP_UTIL_HPP_

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace ktp {

/**
 * @brief Compare two strings for equality, case-insensitive by default.
 */
inline auto stringCompare(std::string_view str1, std::string_view str2,
                          bool case_insensitive = true) -> bool {
  if (!case_insensitive) {
    return str1 == str2;
  }

  return std::ranges::equal(str1, str2, [](unsigned char c1, unsigned char c2) {
    return std::tolower(c1) == std::tolower(c2);
  });
}

/**
 * @brief Split str on every delim, "a,,b" yields {"a", "", "b"} and "" yields
 *        {""}.
 */
inline auto splitString(std::string_view str, char delim = ',')
    -> std::vector<std::string> {
  std::vector<std::string> fields{};
  std::string_view::size_type start{};

  while (true) {
    const auto pos = str.find(delim, start);
    if (std::string_view::npos == pos) {
      fields.emplace_back(str.substr(start));
      break;
    }

    fields.emplace_back(str.substr(start, pos - start));
    start = pos + 1;
  }

  return fields;
}

inline auto joinString(const std::vector<std::string> &fields,
                       std::string_view delim = ",") -> std::string {
  std::string joined{};

  for (size_t index = 0; index < fields.size(); index++) {
    if (index > 0) {
      joined += delim;
    }

    joined += fields[index];
  }

  return joined;
}

} // namespace ktp

#endif // KTP_UTIL_HPP_
