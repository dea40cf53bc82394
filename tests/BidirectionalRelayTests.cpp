#include <chrono>
#include <future>
#include <string>
#include <thread>
#include <tuple>

#include <gtest/gtest.h>

#include "BidirectionalRelay.hpp"
#include "TestSockets.hpp"

using namespace std;

/* client_test <-> client_proxy | relay | origin_proxy <-> origin_test */
class RelayTest : public ::testing::Test {
protected:
  void SetUp() override {
    tie(client_test, client_proxy) = testsock::streamPair();
    tie(origin_test, origin_proxy) = testsock::streamPair();
    ASSERT_GE(client_test, 0);
    ASSERT_GE(origin_test, 0);
  }

  void TearDown() override {
    for (int fd : {client_test, client_proxy, origin_test, origin_proxy}) {
      if (fd >= 0) {
        close(fd);
      }
    }
  }

  future<BidirectionalRelay::Report> startRelay(int idle_timeout = 0) {
    return async(launch::async, [this, idle_timeout] {
      return BidirectionalRelay::run(client_proxy, origin_proxy, idle_timeout);
    });
  }

  int client_test = -1;
  int client_proxy = -1;
  int origin_test = -1;
  int origin_proxy = -1;
};

TEST_F(RelayTest, bytesFlowBothWays) {
  auto relay = startRelay();

  ASSERT_TRUE(testsock::sendAll(client_test, "hello origin"));
  EXPECT_EQ(testsock::readExactly(origin_test, 12), "hello origin");

  ASSERT_TRUE(testsock::sendAll(origin_test, "hello client"));
  EXPECT_EQ(testsock::readExactly(client_test, 12), "hello client");

  shutdown(client_test, SHUT_WR);
  shutdown(origin_test, SHUT_WR);

  auto report = relay.get();
  EXPECT_EQ(report.upstream.bytes, 12u);
  EXPECT_EQ(report.downstream.bytes, 12u);
  EXPECT_EQ(report.firstError(), ProxyError::None);
}

TEST_F(RelayTest, halfCloseKeepsOtherDirectionOpen) {
  auto relay = startRelay();

  // Client is done sending; origin must see end-of-stream...
  ASSERT_TRUE(testsock::sendAll(client_test, "request"));
  shutdown(client_test, SHUT_WR);
  EXPECT_EQ(testsock::readToEnd(origin_test), "request");

  // ...but can still answer
  ASSERT_TRUE(testsock::sendAll(origin_test, "late response"));
  EXPECT_EQ(testsock::readExactly(client_test, 13), "late response");

  EXPECT_EQ(relay.wait_for(chrono::milliseconds(100)), future_status::timeout);

  close(origin_test);
  origin_test = -1;
  EXPECT_TRUE(testsock::peerClosed(client_test));

  auto report = relay.get();
  EXPECT_EQ(report.upstream.bytes, 7u);
  EXPECT_EQ(report.downstream.bytes, 13u);
  EXPECT_EQ(report.upstream.error, ProxyError::None);
  EXPECT_EQ(report.downstream.error, ProxyError::None);
}

TEST_F(RelayTest, largeBinaryPayloadIsIdentical) {
  string payload;
  payload.reserve(1 << 20);
  for (size_t i = 0; i < (1u << 20); ++i) {
    payload.push_back(static_cast<char>((i * 131 + 7) & 0xff));
  }

  auto relay = startRelay();

  thread writer([this, &payload] {
    testsock::sendAll(client_test, payload);
    shutdown(client_test, SHUT_WR);
  });
  string received = testsock::readToEnd(origin_test);
  writer.join();

  EXPECT_EQ(received.size(), payload.size());
  EXPECT_TRUE(received == payload);

  shutdown(origin_test, SHUT_WR);
  auto report = relay.get();
  EXPECT_EQ(report.upstream.bytes, payload.size());
  EXPECT_EQ(report.downstream.bytes, 0u);
}

TEST_F(RelayTest, idleConnectionTimesOut) {
  auto start = chrono::steady_clock::now();
  auto relay = startRelay(1);

  ASSERT_EQ(relay.wait_for(chrono::seconds(5)), future_status::ready);
  auto report = relay.get();

  EXPECT_EQ(report.upstream.error, ProxyError::RelayTimeout);
  EXPECT_EQ(report.downstream.error, ProxyError::RelayTimeout);
  EXPECT_GE(chrono::steady_clock::now() - start, chrono::milliseconds(900));

  // Both peers were told the relay ended
  EXPECT_TRUE(testsock::peerClosed(origin_test));
  EXPECT_TRUE(testsock::peerClosed(client_test));
}

TEST_F(RelayTest, trafficInOneDirectionKeepsBothAlive) {
  auto relay = startRelay(1);

  // Origin streams for ~2.5s while the client stays silent
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(testsock::sendAll(origin_test, "tick"));
    EXPECT_EQ(testsock::readExactly(client_test, 4), "tick");
    this_thread::sleep_for(chrono::milliseconds(250));
  }

  shutdown(client_test, SHUT_WR);
  shutdown(origin_test, SHUT_WR);
  auto report = relay.get();
  EXPECT_EQ(report.upstream.error, ProxyError::None);
  EXPECT_EQ(report.downstream.error, ProxyError::None);
  EXPECT_EQ(report.downstream.bytes, 40u);
}

TEST_F(RelayTest, originResetEndsBothDirections) {
  // A reset needs TCP; swap the origin socketpair for a loopback connection
  close(origin_test);
  close(origin_proxy);
  testsock::LoopbackListener listener;
  origin_proxy = testsock::connectTo(listener.port());
  origin_test = listener.acceptOne();
  ASSERT_GE(origin_proxy, 0);
  ASSERT_GE(origin_test, 0);

  auto relay = startRelay();
  ASSERT_TRUE(testsock::sendAll(origin_test, "partial"));
  EXPECT_EQ(testsock::readExactly(client_test, 7), "partial");

  testsock::resetClose(origin_test);
  origin_test = -1;

  // The client never closes; the relay must still finish
  ASSERT_EQ(relay.wait_for(chrono::seconds(2)), future_status::ready);
  auto report = relay.get();
  EXPECT_EQ(report.downstream.error, ProxyError::RelayIOFailure);
  EXPECT_EQ(report.upstream.error, ProxyError::None);
  EXPECT_EQ(report.downstream.bytes, 7u);
  EXPECT_TRUE(testsock::peerClosed(client_test));
}
