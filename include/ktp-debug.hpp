/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file include/ktp-debug.hpp
 * @brief Print macros used for tracing and logging across the Ktp library.
 *
 * This header provides two macros:
 *
 *  - KTP_DEBUG_PRINT(print_stmt): trace output that is enabled when NDEBUG
 *    is not defined and compiled out when NDEBUG is defined (release build).
 *
 *  - KTP_LOG_PRINT(print_stmt): always-on output used for informational and
 *    error lines that an operator needs to see in release builds too (worker
 *    start/stop, publish failures, dropped messages).
 *
 * Usage example:
 *   KTP_DEBUG_PRINT(std::cout << label << " - idle\n");
 *   KTP_LOG_PRINT(std::cerr << label << " - failed to publish\n");
 *
 * Important notes:
 *  - The argument must be a complete expression, typically a stream
 *    insertion into std::cout (information) or std::cerr (error).
 *  - Both macros are wrapped in do { ... } while (false) so they are safe to
 *    use inside control-flow constructs (if/else).
 *  - When NDEBUG is defined the KTP_DEBUG_PRINT expression is not evaluated,
 *    so do not rely on it for side effects in release builds.
 *  - Never pass a Sensitive message payload to either macro; print the
 *    message through ktp::toString() which elides it.
 */

#ifndef KTP_DEBUG_HPP_
#define KTP_DEBUG_HPP_

#include <iostream>

#ifdef NDEBUG
#define KTP_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
  } while (false)
#else
#define KTP_DEBUG_PRINT(print_stmt)                                            \
  do {                                                                         \
    (print_stmt);                                                              \
  } while (false)
#endif

#define KTP_LOG_PRINT(print_stmt)                                              \
  do {                                                                         \
    (print_stmt);                                                              \
  } while (false)

#endif // KTP_DEBUG_HPP_
