/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "ktp-config.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-queue.hpp"
#include "ktp-retry-policy.hpp"
#include "ktp-worker.hpp"

#include "ktp-test-mock-client.hpp"

auto dataMsg(const std::string &payload) -> ktp::Ktp_Message {
  return ktp::buildPublishMessage(ktp::PublishMessageTypePb::Data, "testing",
                                  "key", std::nullopt, payload);
}

auto controlMsg(ktp::Ktp_MessageType type) -> ktp::Ktp_Message {
  return ktp::buildPublishMessage(type, "", "", std::nullopt, "");
}

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  // LogBrokerDetails is not supported, it drops the rest of its batch. The
  // whole batch is queued before the worker starts so it drains as one.
  {
    Mock_Broker broker{};
    auto queue = std::make_shared<ktp::Ktp_Queue>();

    std::vector<ktp::Ktp_Message> batch{};
    batch.push_back(dataMsg("first"));
    batch.push_back(controlMsg(ktp::PublishMessageTypePb::LogBrokerDetails));
    batch.push_back(dataMsg("dropped 1"));
    batch.push_back(dataMsg("dropped 2"));
    queue->enqueue(std::move(batch));

    ktp::Ktp_Worker worker{0, makeTestConfig("1"), queue, broker.factory(),
                           {}};
    EXPECT_EQ("ktp-test-tid-1", worker.label());

    worker.start();

    EXPECT_TRUE(waitUntil(
        [&worker]() { return worker.stats().dropped_unsupported == 3; },
        std::chrono::seconds(10)));

    // the worker keeps going after the drop
    queue->enqueue({dataMsg("after drop")});
    EXPECT_TRUE(broker.waitForPublished(2, std::chrono::seconds(10)));

    auto published = broker.published();
    EXPECT_EQ("first", published[0].payload);
    EXPECT_EQ("after drop", published[1].payload);

    queue->enqueue({controlMsg(ktp::PublishMessageTypePb::Shutdown)});
    worker.wait();

    auto stats = worker.stats();
    EXPECT_EQ(2, stats.published);
    EXPECT_EQ(3, stats.dropped_unsupported);
    EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                worker.workerState());

    auto error = worker.lastError();
    EXPECT_TRUE(error.has_value());
    EXPECT_TRUE(ktp::Ktp_Error::Code::kUnsupportedMessageKind == error->code);
    std::cout << *error << "\n";
  }

  // a Shutdown message drops the rest of its batch and is requeued
  {
    Mock_Broker broker{};
    auto queue = std::make_shared<ktp::Ktp_Queue>();

    std::vector<ktp::Ktp_Message> batch{};
    batch.push_back(dataMsg("published"));
    batch.push_back(controlMsg(ktp::PublishMessageTypePb::Shutdown));
    batch.push_back(dataMsg("dropped 1"));
    batch.push_back(dataMsg("dropped 2"));
    queue->enqueue(std::move(batch));

    ktp::Ktp_Worker worker{0, makeTestConfig("1"), queue, broker.factory(),
                           {}};
    worker.start();
    worker.wait();

    auto stats = worker.stats();
    EXPECT_EQ(1, stats.published);
    EXPECT_EQ(2, stats.dropped_on_shutdown);
    EXPECT_EQ(1, stats.shutdown_requeued);
    EXPECT_TRUE(queue->isShutdownRequested());
    EXPECT_FALSE(worker.lastError().has_value());
    EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                worker.workerState());

    auto pending = queue->drainAll();
    EXPECT_EQ(1, pending.size());
    EXPECT_TRUE(ktp::PublishMessageTypePb::Shutdown == pending[0].type());
  }

  // the shutdown broadcast stops a worker that never sees the message
  {
    Mock_Broker broker{};
    auto queue = std::make_shared<ktp::Ktp_Queue>();

    ktp::Ktp_Worker worker{0, makeTestConfig("1"), queue, broker.factory(),
                           {}};
    worker.start();

    EXPECT_TRUE(waitUntil([&broker]() { return broker.num_clients == 1; },
                          std::chrono::seconds(10)));

    queue->requestShutdown();
    worker.wait();

    EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                worker.workerState());
  }

  // an unknown message type is dropped with the rest of its batch
  {
    Mock_Broker broker{};
    auto queue = std::make_shared<ktp::Ktp_Queue>();

    std::vector<ktp::Ktp_Message> batch{};
    batch.push_back(controlMsg(static_cast<ktp::Ktp_MessageType>(42)));
    batch.push_back(dataMsg("dropped"));
    queue->enqueue(std::move(batch));

    ktp::Ktp_Worker worker{0, makeTestConfig("1"), queue, broker.factory(),
                           {}};
    worker.start();

    EXPECT_TRUE(waitUntil(
        [&worker]() { return worker.stats().dropped_unsupported == 2; },
        std::chrono::seconds(10)));
    EXPECT_EQ(0, broker.numAttempts());

    queue->enqueue({controlMsg(ktp::PublishMessageTypePb::Shutdown)});
    worker.wait();

    auto error = worker.lastError();
    EXPECT_TRUE(error.has_value());
    EXPECT_TRUE(ktp::Ktp_Error::Code::kUnsupportedMessageKind == error->code);
    EXPECT_TRUE(error->message.starts_with("unsupported message type=42"));
  }

  // a factory failure terminates the worker
  {
    auto queue = std::make_shared<ktp::Ktp_Queue>();
    auto failing_factory = [](const ktp::Ktp_Config &config,
                              ktp::Ktp_Broker_Client::Role role)
        -> std::unique_ptr<ktp::Ktp_Broker_Client> {
      throw std::runtime_error("broker unreachable");
    };

    ktp::Ktp_Worker worker{0, makeTestConfig("1"), queue, failing_factory,
                           {}};
    worker.start();
    worker.wait();

    EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                worker.workerState());

    auto error = worker.lastError();
    EXPECT_TRUE(error.has_value());
    EXPECT_TRUE(ktp::Ktp_Error::Code::kConnectionUnavailable == error->code);
    EXPECT_TRUE(error->message.ends_with("broker unreachable"));
  }

  return RUN_ALL_TESTS();
}
