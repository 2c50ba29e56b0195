#include <gtest/gtest.h>

#include <sstream>

#include "demo_sequence.hpp"
#include "scripted_transport.hpp"

using test_support::queue_reply;
using test_support::ScriptedTransport;
using test_support::TransportLog;

TEST(DemoSequence, PrintsEveryStep) {
  auto log = std::make_shared<TransportLog>();
  ard8088::EngineOptions options;
  options.resync_settle = std::chrono::milliseconds(0);
  ard8088::BusEngine engine(std::make_unique<ScriptedTransport>(log), options);

  queue_reply(*log, {'A', 'r', 'd', 'u', 'i', '8', '8', 0x01, 0x01}); // version
  queue_reply(*log, {0x01});                                       // reset
  queue_reply(*log, {0x01});                                       // load
  queue_reply(*log, {0x01});                                       // cycle
  queue_reply(*log, {0xF0, 0xFF, 0x0F, 0x01});                     // address
  queue_reply(*log, {0x0C, 0x01});                                 // status
  queue_reply(*log, {0x01, 0x01});                                 // 8288 cmd
  queue_reply(*log, {0x02, 0x01});                                 // 8288 ctl
  std::vector<uint8_t> store;
  for (uint8_t i = 1; i <= 14; ++i) {
    store.push_back(i);
    store.push_back(0);
  }
  store.push_back(0x01);
  queue_reply(*log, store);

  std::ostringstream out;
  EXPECT_TRUE(ard8088_host::run_demo_sequence(engine, out));

  const std::string text = out.str();
  EXPECT_NE(text.find("version: Ardui88 v1"), std::string::npos) << text;
  EXPECT_NE(text.find("reset: ok"), std::string::npos);
  EXPECT_NE(text.find("read address: 0x0ffff0"), std::string::npos);
  EXPECT_NE(text.find("read status: 0x0c"), std::string::npos);
  EXPECT_NE(text.find("AX=0x0001"), std::string::npos);
  EXPECT_NE(text.find("DI=0x000e"), std::string::npos);

  // Opcodes in order; Load is followed by 1..14 little-endian.
  ASSERT_EQ(log->written.size(), 9u + 28u);
  EXPECT_EQ(log->written[0], 0x01);
  EXPECT_EQ(log->written[1], 0x02);
  EXPECT_EQ(log->written[2], 0x03);
  EXPECT_EQ(log->written[3], 0x01);
  EXPECT_EQ(log->written[29], 0x0E);
  EXPECT_EQ(log->written[31], 0x04);
  EXPECT_EQ(log->written.back(), 0x0D);
}

TEST(DemoSequence, ReportsFailureButRunsToCompletion) {
  auto log = std::make_shared<TransportLog>();
  ard8088::EngineOptions options;
  options.resync_settle = std::chrono::milliseconds(0);
  ard8088::BusEngine engine(std::make_unique<ScriptedTransport>(log), options);

  std::ostringstream out;
  EXPECT_FALSE(ard8088_host::run_demo_sequence(engine, out));
  EXPECT_NE(out.str().find("FAILED (transport_timeout"), std::string::npos);
  EXPECT_NE(out.str().find("store: FAILED"), std::string::npos);
}
