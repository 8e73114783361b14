#include <gtest/gtest.h>

#include "fakes.hpp"
#include "stream_session.hpp"

#include <chrono>
#include <cstring>
#include <thread>

using namespace linebridge;
using linebridge::fakes::DataEvents;
using linebridge::fakes::RecordingSink;
using linebridge::fakes::ScriptedBodyReader;

class StreamSessionTest : public ::testing::Test {
 protected:
  void SetUp() override {
    opts.id = "chatcmpl-test";
    opts.created = 1700000000;
    opts.model = "gpt-4o";
    opts.heartbeat_interval = std::chrono::milliseconds(10000);
    counter.SetInputTokens(5);
  }

  StreamResult RunWith(ScriptedBodyReader* reader, CancelToken* cancel) {
    StreamSession session(opts, &sink, &counter);
    auto result = session.Run(reader, cancel);
    EXPECT_EQ(session.state(), StreamState::kClosed);
    return result;
  }

  static std::string Stream(std::initializer_list<const char*> lines) {
    std::string out;
    for (const char* l : lines) {
      out += l;
      out += "\n";
    }
    return out;
  }

  StreamOptions opts;
  RecordingSink sink;
  TokenCounter counter;
};

TEST_F(StreamSessionTest, TranslatesLinesIntoOrderedFrames) {
  ScriptedBodyReader reader({Stream({"0:\"Hello\"", "0:\" world\"", "g:\"hmm\"", "e:{\"finishReason\":\"stop\"}",
                                     "d:{\"usage\":{\"prompt_tokens\":5,\"completion_tokens\":3}}"})});
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);

  EXPECT_EQ(result.terminal, StreamState::kFinishing);
  EXPECT_EQ(result.finish_reason, "stop");
  EXPECT_EQ(result.usage.prompt_tokens, 5);
  EXPECT_EQ(result.usage.completion_tokens, 3);

  const auto events = DataEvents(sink.delivered());
  ASSERT_EQ(events.size(), 6u);
  auto first = nlohmann::json::parse(events[0]);
  EXPECT_EQ(first["id"], "chatcmpl-test");
  EXPECT_EQ(first["object"], "chat.completion.chunk");
  EXPECT_EQ(first["choices"][0]["delta"]["role"], "assistant");
  EXPECT_EQ(nlohmann::json::parse(events[1])["choices"][0]["delta"]["content"], "Hello");
  EXPECT_EQ(nlohmann::json::parse(events[2])["choices"][0]["delta"]["content"], " world");
  EXPECT_EQ(nlohmann::json::parse(events[3])["choices"][0]["delta"]["reasoning_content"], "hmm");

  auto last = nlohmann::json::parse(events[4]);
  EXPECT_EQ(last["choices"][0]["finish_reason"], "stop");
  EXPECT_TRUE(last["choices"][0]["delta"].empty());
  EXPECT_EQ(last["usage"]["total_tokens"], 8);
  EXPECT_EQ(events[5], "[DONE]");
  EXPECT_TRUE(sink.unflushed().empty());
}

TEST_F(StreamSessionTest, UsageSnapshotsNeverDecrease) {
  ScriptedBodyReader reader({Stream({"0:\"one\"", "0:\"two three\"", "g:\"four, five\""}), Stream({"0:\"six\""})});
  CancelToken cancel;
  RunWith(&reader, &cancel);

  const auto events = DataEvents(sink.delivered());
  ASSERT_GE(events.size(), 3u);
  int previous = -1;
  for (size_t i = 0; i + 2 < events.size(); i++) {
    auto frame = nlohmann::json::parse(events[i]);
    EXPECT_TRUE(frame["choices"][0]["finish_reason"].is_null());
    const int total = frame["usage"]["total_tokens"].get<int>();
    EXPECT_GE(total, previous);
    previous = total;
  }
}

TEST_F(StreamSessionTest, TerminalFrameCarriesReconciledUsage) {
  counter.SetInputTokens(10);
  ScriptedBodyReader reader({Stream({"0:\"a b c d e f g\"", "d:{\"usage\":{\"prompt_tokens\":9,\"completion_tokens\":8}}"})});
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);

  const auto events = DataEvents(sink.delivered());
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(nlohmann::json::parse(events[0])["usage"]["total_tokens"], 10);
  EXPECT_EQ(nlohmann::json::parse(events[1])["usage"]["total_tokens"], 19);
  // Server counts within 20% of the estimate win, even when lower.
  auto last = nlohmann::json::parse(events[2]);
  EXPECT_EQ(last["usage"]["prompt_tokens"], 9);
  EXPECT_EQ(last["usage"]["completion_tokens"], 8);
  EXPECT_EQ(last["usage"]["total_tokens"], 17);
  EXPECT_EQ(result.usage.total_tokens(), 17);
}

TEST_F(StreamSessionTest, ThrowingSinkDoesNotEscapeRun) {
  sink.set_throw_writes(true);
  ScriptedBodyReader reader({Stream({"0:\"x\""})});
  CancelToken cancel;
  StreamResult result;
  EXPECT_NO_THROW(result = RunWith(&reader, &cancel));
  EXPECT_EQ(result.terminal, StreamState::kErrorAbort);
  EXPECT_EQ(result.error, "sink exploded");
  EXPECT_TRUE(sink.delivered().empty());
}

TEST_F(StreamSessionTest, EmptyDeltasAndUnknownLinesProduceNoFrames) {
  ScriptedBodyReader reader({Stream({"0:\"\"", "f:{\"messageId\":\"m\"}", "", "garbage", "0:\"x\""})});
  CancelToken cancel;
  RunWith(&reader, &cancel);
  // initial, "x", final, [DONE]
  EXPECT_EQ(DataEvents(sink.delivered()).size(), 4u);
}

TEST_F(StreamSessionTest, MissingFinishEventDefaultsToStop) {
  ScriptedBodyReader reader({"0:\"partial"});
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);
  EXPECT_EQ(result.finish_reason, "stop");
  const auto events = DataEvents(sink.delivered());
  ASSERT_EQ(events.size(), 4u);
  EXPECT_EQ(events.back(), "[DONE]");
}

TEST_F(StreamSessionTest, FlushesAreRateLimited) {
  std::string body;
  for (int i = 0; i < 20; i++) body += "0:\"chunk\"\n";
  ScriptedBodyReader reader({body});
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);
  EXPECT_EQ(result.frames, 22);
  // Forced initial flush plus the terminal flush; a slow machine may add one.
  EXPECT_GE(sink.flushes(), 2);
  EXPECT_LE(sink.flushes(), 3);
}

TEST_F(StreamSessionTest, HeartbeatNeverFollowsDone) {
  opts.heartbeat_interval = std::chrono::milliseconds(10);
  ScriptedBodyReader reader({"0:\"a\"\n", "0:\"b\"\n", "0:\"c\"\n", "0:\"d\"\n"}, ScriptedBodyReader::Ending::kEof,
                            std::chrono::milliseconds(40));
  CancelToken cancel;
  StreamSession session(opts, &sink, &counter);
  auto result = session.Run(&reader, &cancel);

  EXPECT_EQ(result.terminal, StreamState::kFinishing);
  EXPECT_GT(session.heartbeats(), 0);
  const auto delivered = sink.delivered();
  const auto done = delivered.rfind("data: [DONE]\n\n");
  ASSERT_NE(done, std::string::npos);
  EXPECT_EQ(done + std::strlen("data: [DONE]\n\n"), delivered.size());
  EXPECT_LT(delivered.rfind(": heartbeat"), done);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(sink.delivered(), delivered);
  EXPECT_TRUE(sink.unflushed().empty());
}

TEST_F(StreamSessionTest, CancellationIsSilent) {
  opts.heartbeat_interval = std::chrono::milliseconds(10);
  ScriptedBodyReader reader({"0:\"a\"\n"}, ScriptedBodyReader::Ending::kHang);
  CancelToken cancel(std::chrono::milliseconds(150));
  StreamSession session(opts, &sink, &counter);
  auto result = session.Run(&reader, &cancel);

  EXPECT_EQ(result.terminal, StreamState::kClientGone);
  EXPECT_EQ(result.error, "context deadline exceeded");
  const auto written = sink.delivered() + sink.unflushed();
  EXPECT_EQ(written.find("[DONE]"), std::string::npos);
  EXPECT_EQ(written.find("\"finish_reason\":\"stop\""), std::string::npos);
  EXPECT_EQ(written.find("\"finish_reason\":\"error\""), std::string::npos);

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  EXPECT_EQ(sink.delivered() + sink.unflushed(), written);
}

TEST_F(StreamSessionTest, ExplicitCancelIsSilent) {
  ScriptedBodyReader reader({"0:\"a\"\n"}, ScriptedBodyReader::Ending::kHang);
  CancelToken cancel;
  std::thread canceller([&cancel] {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel.Cancel();
  });
  auto result = RunWith(&reader, &cancel);
  canceller.join();
  EXPECT_EQ(result.terminal, StreamState::kClientGone);
  EXPECT_EQ(result.error, "context canceled");
  EXPECT_EQ((sink.delivered() + sink.unflushed()).find("[DONE]"), std::string::npos);
}

TEST_F(StreamSessionTest, ReaderFaultBecomesPanicFrame) {
  ScriptedBodyReader reader({"0:\"a\"\n"}, ScriptedBodyReader::Ending::kThrow);
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);

  EXPECT_EQ(result.terminal, StreamState::kErrorAbort);
  const auto events = DataEvents(sink.delivered());
  ASSERT_GE(events.size(), 2u);
  EXPECT_EQ(events.back(), "[DONE]");
  auto terminal = nlohmann::json::parse(events[events.size() - 2]);
  EXPECT_EQ(terminal["choices"][0]["finish_reason"], "error");
  EXPECT_EQ(terminal["choices"][0]["delta"]["content"],
            "\n\n[PANIC: Internal Server Error during stream processing. Details: reader exploded]");
}

TEST_F(StreamSessionTest, UpstreamReadErrorBecomesErrorFrame) {
  ScriptedBodyReader reader({"0:\"a\"\n"}, ScriptedBodyReader::Ending::kError);
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);
  EXPECT_EQ(result.terminal, StreamState::kErrorAbort);
  const auto delivered = sink.delivered();
  EXPECT_NE(delivered.find("[Stream Error: upstream read error: connection reset]"), std::string::npos);
  EXPECT_EQ(DataEvents(delivered).back(), "[DONE]");
}

TEST_F(StreamSessionTest, OversizedLineBecomesErrorFrame) {
  opts.initial_buffer_size = 8;
  opts.max_buffer_size = 16;
  ScriptedBodyReader reader({"0:\"ok\"\n", std::string(40, 'x')});
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);
  EXPECT_EQ(result.terminal, StreamState::kErrorAbort);
  EXPECT_EQ(result.error, "scanner error: token too long");
  const auto events = DataEvents(sink.delivered());
  EXPECT_EQ(nlohmann::json::parse(events[1])["choices"][0]["delta"]["content"], "ok");
  EXPECT_EQ(events.back(), "[DONE]");
}

TEST_F(StreamSessionTest, RepeatedWriteFailuresAbortTheSession) {
  sink.set_fail_writes(true);
  std::string body;
  for (int i = 0; i < 10; i++) body += "0:\"x\"\n";
  ScriptedBodyReader reader({body});
  CancelToken cancel;
  auto result = RunWith(&reader, &cancel);
  EXPECT_EQ(result.terminal, StreamState::kErrorAbort);
  EXPECT_NE(result.error.find("reached threshold of 5"), std::string::npos);
  EXPECT_NE(result.error.find("error writing to stream"), std::string::npos);
}

TEST_F(StreamSessionTest, StateNames) {
  EXPECT_STREQ(StreamStateName(StreamState::kClientGone), "client_gone");
  EXPECT_STREQ(StreamStateName(StreamState::kFinishing), "finishing");
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
