/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 *
 * @file ktp.hpp
 * @brief Convenience umbrella header for the Kafka publish thread pool (KTP).
 *
 * This header only forwards the public headers of the KTP library. Prefer
 * including the specific headers a translation unit requires for faster
 * compilation.
 *
 * Typical use:
 *
 *   auto config = ktp::Ktp_Config::fromEnvironment("my-service");
 *   auto publisher = ktp::Ktp_Pool::start(*config);
 *
 *   publisher->addDataMsg("topic", "key", std::nullopt, "payload");
 *   publisher->shutdown();
 *   publisher->pool()->wait();
 */

#ifndef KTP_HPP_
#define KTP_HPP_

#include "ktp-broker-client.hpp"
#include "ktp-config.hpp"
#include "ktp-debug.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-metadata.hpp"
#include "ktp-pool.hpp"
#include "ktp-proc.hpp"
#include "ktp-publisher.hpp"
#include "ktp-queue.hpp"
#include "ktp-retry-policy.hpp"
#include "ktp-util.hpp"
#include "ktp-worker.hpp"

#include "kafka/ktp-kafka-client.hpp"
#include "kafka/ktp-kafka-util.hpp"

#endif // KTP_HPP_
