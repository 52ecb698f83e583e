/**
 * Copyright © 2025 Chee Bin HOH. All rights reserved.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>

#include "ktp-config.hpp"
#include "ktp-error.hpp"
#include "ktp-message.hpp"
#include "ktp-pool.hpp"
#include "ktp-proc.hpp"
#include "ktp-publisher.hpp"
#include "ktp-worker.hpp"

#include "ktp-test-mock-client.hpp"

int main(int argc, char *argv[]) {
  ::testing::InitGoogleTest(&argc, argv);

  // 100 messages published by 3 workers
  {
    Mock_Broker broker{};
    auto publisher =
        ktp::Ktp_Pool::start(makeTestConfig("3"), broker.factory());

    EXPECT_EQ(3, publisher->pool()->numWorkers());

    for (int i = 0; i < 100; i++) {
      auto len = publisher->addDataMsg("testing", "test key", std::nullopt,
                                       "test message " + std::to_string(i));
      EXPECT_TRUE(len.has_value());
      EXPECT_TRUE(*len >= 1);
    }

    EXPECT_TRUE(broker.waitForPublished(100, std::chrono::seconds(10)));
    EXPECT_TRUE(publisher->drainMsgs().empty());

    std::set<std::string> payloads{};
    for (const auto &published : broker.published()) {
      EXPECT_EQ("testing", published.topic);
      EXPECT_EQ("test key", published.key);
      EXPECT_FALSE(published.headers.has_value());
      payloads.insert(published.payload);
    }

    EXPECT_EQ(100, payloads.size());
    EXPECT_TRUE(payloads.contains("test message 0"));
    EXPECT_TRUE(payloads.contains("test message 99"));

    // one Shutdown message stops every worker
    auto res = publisher->shutdown();
    EXPECT_TRUE(res.has_value());
    EXPECT_EQ("shutdown started", *res);

    publisher->pool()->wait();

    for (size_t index = 0; index < publisher->pool()->numWorkers(); index++) {
      EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                  publisher->pool()->workerState(index));
    }

    auto stats = publisher->pool()->stats();
    EXPECT_EQ(100, stats.published);
    EXPECT_EQ(0, stats.publish_failures);
    EXPECT_TRUE(stats.shutdown_requeued >= 1);
    EXPECT_EQ(3, broker.num_clients.load());

    // the requeued Shutdown message is left for a late worker
    auto pending = publisher->drainMsgs();
    EXPECT_TRUE(pending.size() <= 1);
    for (const auto &msg : pending) {
      EXPECT_TRUE(ktp::PublishMessageTypePb::Shutdown == msg.type());
    }
  }

  // headers and sensitive messages reach the broker
  {
    Mock_Broker broker{};
    auto publisher =
        ktp::Ktp_Pool::start(makeTestConfig("1"), broker.factory());

    ktp::Ktp_Headers headers{{"trace-id", "abc"}};
    publisher->addDataMsg("testing", "k1", headers, "with headers");
    publisher->addMsg(ktp::buildPublishMessage(
        ktp::PublishMessageTypePb::Sensitive, "secure", "k2", std::nullopt,
        "secret"));

    EXPECT_TRUE(broker.waitForPublished(2, std::chrono::seconds(10)));

    auto published = broker.published();
    EXPECT_EQ("with headers", published[0].payload);
    EXPECT_TRUE(published[0].headers.has_value());
    EXPECT_EQ("abc", published[0].headers->at("trace-id"));
    EXPECT_EQ("secure", published[1].topic);
    EXPECT_EQ("secret", published[1].payload);

    publisher->shutdown();
    publisher->pool()->wait();

    EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                publisher->pool()->workerState(0));
  }

  // no broker: the workers exit without connecting and nothing is consumed
  {
    Mock_Broker broker{};
    auto config = makeTestConfig("2");
    config.broker_list = {""};

    auto publisher = ktp::Ktp_Pool::start(config, broker.factory());
    publisher->pool()->wait();

    EXPECT_EQ(0, broker.num_clients.load());
    EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                publisher->pool()->workerState(0));
    EXPECT_TRUE(ktp::Ktp_Worker::WorkerState::kTerminated ==
                publisher->pool()->workerState(1));

    auto error = publisher->pool()->lastError(0);
    EXPECT_TRUE(error.has_value());
    EXPECT_TRUE(ktp::Ktp_Error::Code::kConnectionUnavailable == error->code);
    EXPECT_THROW(publisher->pool()->lastError(2), std::out_of_range);

    // shutdown on an empty queue leaves exactly one Shutdown message
    auto res = publisher->shutdown();
    EXPECT_EQ("shutdown started", *res);

    auto pending = publisher->drainMsgs();
    EXPECT_EQ(1, pending.size());
    EXPECT_TRUE(ktp::PublishMessageTypePb::Shutdown == pending[0].type());
  }

  // destroying the publisher stops idle workers that never got a shutdown
  {
    Mock_Broker broker{};
    auto publisher =
        ktp::Ktp_Pool::start(makeTestConfig("2"), broker.factory());

    EXPECT_TRUE(waitUntil([&broker]() { return broker.num_clients == 2; },
                          std::chrono::seconds(10)));

    publisher = {};
  }

  // destroying the publisher lets a worker finish the publish it is in
  {
    Mock_Broker broker{};
    broker.block_publish = true;

    auto publisher =
        ktp::Ktp_Pool::start(makeTestConfig("1"), broker.factory());
    publisher->addDataMsg("testing", "key", std::nullopt, "in flight");

    EXPECT_TRUE(
        waitUntil([&broker]() { return broker.num_publish_entered == 1; },
                  std::chrono::seconds(10)));

    ktp::Ktp_Proc releaser{"releaser", [&broker]() {
                             std::this_thread::sleep_for(
                                 std::chrono::milliseconds(200));
                             broker.block_publish = false;
                           }};
    releaser.exec();

    // cancels and joins the worker
    publisher = {};

    EXPECT_EQ(1, broker.num_publish_returned.load());
    auto published = broker.published();
    EXPECT_EQ(1, published.size());
    for (const auto &msg : published) {
      EXPECT_EQ("in flight", msg.payload);
    }

    releaser.wait();
  }

  return RUN_ALL_TESTS();
}
