#include <gtest/gtest.h>

#include "dispatcher.hpp"
#include "fakes.hpp"

#include <chrono>

using namespace linebridge;
using linebridge::fakes::FakeTransport;
using linebridge::fakes::ScriptedReply;

class DispatcherTest : public ::testing::Test {
 protected:
  Dispatcher MakeDispatcher(int attempts, std::chrono::milliseconds base, std::chrono::milliseconds max) {
    RetryPolicy policy;
    policy.attempts = attempts;
    policy.base_delay = base;
    policy.max_delay = max;
    BackendRequestOptions opts;
    opts.base_url = "https://backend.example/";
    return Dispatcher(&transport, &rotator, &models, opts, policy);
  }

  ChatRequest MakeRequest() {
    ChatRequest req;
    req.model = "gpt-4o";
    req.messages = {{"user", "hi"}};
    return req;
  }

  static ScriptedReply Status(int status, std::string body = "") {
    ScriptedReply r;
    r.status = status;
    if (!body.empty()) r.chunks.push_back(std::move(body));
    return r;
  }

  FakeTransport transport;
  IdGenerator ids{1};
  IdentityRotator rotator{{"u1", "u2"}, "fallback", &ids};
  ModelMapper models;
};

TEST_F(DispatcherTest, DelayGrowsLinearlyUpToCap) {
  RetryPolicy p;
  p.base_delay = std::chrono::milliseconds(500);
  p.max_delay = std::chrono::milliseconds(1200);
  EXPECT_EQ(p.DelayAfter(0).count(), 500);
  EXPECT_EQ(p.DelayAfter(1).count(), 1000);
  EXPECT_EQ(p.DelayAfter(2).count(), 1200);
}

TEST_F(DispatcherTest, FirstAttemptSucceeds) {
  transport.Push(Status(200, "0:\"x\"\n"));
  auto d = MakeDispatcher(3, std::chrono::milliseconds(10), std::chrono::milliseconds(100));
  CancelToken cancel;
  auto out = d.Dispatch(MakeRequest(), &cancel);
  ASSERT_TRUE(out.ok());
  EXPECT_EQ(out.attempt_index, 0);
  EXPECT_EQ(out.response->status, 200);
  ASSERT_EQ(transport.requests().size(), 1u);

  auto body = nlohmann::json::parse(transport.requests()[0].body);
  EXPECT_EQ(body["model"], "scira-4o");
  EXPECT_EQ(body["user_id"], out.identity.caller_id);
  EXPECT_EQ(body["id"], out.identity.conversation_id);
}

TEST_F(DispatcherTest, RetriesAfterFailuresWithTwoBackoffWaits) {
  transport.Push(Status(500, "boom"));
  transport.Push(Status(502));
  transport.Push(Status(200));
  auto d = MakeDispatcher(3, std::chrono::milliseconds(50), std::chrono::milliseconds(1000));
  CancelToken cancel;

  const auto start = std::chrono::steady_clock::now();
  auto out = d.Dispatch(MakeRequest(), &cancel);
  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);

  ASSERT_TRUE(out.ok());
  EXPECT_EQ(out.attempt_index, 2);
  EXPECT_TRUE(out.error.empty());
  // 50ms after the first failure, 100ms after the second.
  EXPECT_GE(elapsed.count(), 150);
  EXPECT_LT(elapsed.count(), 300);
  EXPECT_EQ(transport.requests().size(), 3u);

  auto m = d.Metrics();
  EXPECT_EQ(m["attempts"], 3);
  EXPECT_EQ(m["failed_attempts"], 2);
  EXPECT_EQ(m["exhausted"], 0);
}

TEST_F(DispatcherTest, EachAttemptUsesAFreshIdentity) {
  transport.Push(Status(500));
  transport.Push(Status(200));
  auto d = MakeDispatcher(2, std::chrono::milliseconds(1), std::chrono::milliseconds(1));
  auto out = d.Dispatch(MakeRequest(), nullptr);
  ASSERT_TRUE(out.ok());
  auto reqs = transport.requests();
  ASSERT_EQ(reqs.size(), 2u);
  auto a = nlohmann::json::parse(reqs[0].body);
  auto b = nlohmann::json::parse(reqs[1].body);
  EXPECT_NE(a["user_id"], b["user_id"]);
  EXPECT_NE(a["id"], b["id"]);
}

TEST_F(DispatcherTest, ExhaustionReportsLastError) {
  transport.Push(Status(500));
  ScriptedReply down;
  down.transport_error = "connection refused";
  transport.Push(down);
  auto d = MakeDispatcher(2, std::chrono::milliseconds(1), std::chrono::milliseconds(1));
  CancelToken cancel;
  auto out = d.Dispatch(MakeRequest(), &cancel);
  EXPECT_FALSE(out.ok());
  EXPECT_FALSE(out.cancelled);
  EXPECT_EQ(out.attempt_index, 1);
  EXPECT_EQ(out.error, "all retry attempts failed: connection refused");
  EXPECT_EQ(d.Metrics()["exhausted"], 1);
}

TEST_F(DispatcherTest, StatusErrorIncludesTruncatedBody) {
  transport.Push(Status(503, std::string(2000, 'e')));
  auto d = MakeDispatcher(1, std::chrono::milliseconds(1), std::chrono::milliseconds(1));
  auto out = d.Dispatch(MakeRequest(), nullptr);
  ASSERT_FALSE(out.ok());
  EXPECT_NE(out.error.find("HTTP error: status=503"), std::string::npos);
  EXPECT_NE(out.error.find("...(truncated)"), std::string::npos);
  EXPECT_NE(out.error.find("path=/api/search"), std::string::npos);
  EXPECT_LT(out.error.size(), 1200u);
}

TEST_F(DispatcherTest, CancelledTokenStopsBeforeFirstAttempt) {
  auto d = MakeDispatcher(3, std::chrono::milliseconds(1), std::chrono::milliseconds(1));
  CancelToken cancel;
  cancel.Cancel();
  auto out = d.Dispatch(MakeRequest(), &cancel);
  EXPECT_FALSE(out.ok());
  EXPECT_TRUE(out.cancelled);
  EXPECT_EQ(out.error, "context canceled");
  EXPECT_TRUE(transport.requests().empty());
}

TEST_F(DispatcherTest, DeadlineDuringBackoffAbortsRetries) {
  transport.Push(Status(500));
  transport.Push(Status(200));
  auto d = MakeDispatcher(2, std::chrono::milliseconds(2000), std::chrono::milliseconds(5000));
  CancelToken cancel(std::chrono::milliseconds(100));
  const auto start = std::chrono::steady_clock::now();
  auto out = d.Dispatch(MakeRequest(), &cancel);
  const auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(out.ok());
  EXPECT_TRUE(out.cancelled);
  EXPECT_EQ(out.error, "context deadline exceeded");
  EXPECT_LT(elapsed, std::chrono::milliseconds(1000));
  EXPECT_EQ(transport.requests().size(), 1u);
}

TEST_F(DispatcherTest, NonPositiveAttemptsBecomesOne) {
  auto d = MakeDispatcher(0, std::chrono::milliseconds(1), std::chrono::milliseconds(1));
  EXPECT_EQ(d.policy().attempts, 1);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
