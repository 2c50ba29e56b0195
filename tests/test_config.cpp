#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "config.hpp"

using ard8088_host::load_config;
using ard8088_host::parse_config;

namespace {

YAML::Node yaml(const std::string &text) { return YAML::Load(text); }

void expect_config_error(const std::string &text, const std::string &needle) {
  try {
    parse_config(yaml(text));
    FAIL() << "expected rejection containing '" << needle << "'";
  } catch (const std::runtime_error &e) {
    EXPECT_NE(std::string(e.what()).find(needle), std::string::npos)
        << e.what();
  }
}

} // namespace

TEST(Config, MinimalUsesDefaults) {
  const auto cfg = parse_config(yaml("serial:\n  port: /dev/ttyUSB1\n"));
  EXPECT_EQ(cfg.serial.port, "/dev/ttyUSB1");
  EXPECT_EQ(cfg.serial.baud_rate, 1000000u);
  EXPECT_EQ(cfg.serial.read_timeout_ms, 1000u);
  EXPECT_EQ(cfg.protocol.resync_settle_ms, 110u);
  EXPECT_FALSE(cfg.protocol.debug);
}

TEST(Config, FullDocument) {
  const auto cfg = parse_config(yaml(R"(
serial:
  port: /dev/ttyACM0
  baud_rate: 115200
  read_timeout_ms: 250
protocol:
  resync_settle_ms: 0
  debug: true
)"));
  EXPECT_EQ(cfg.serial.port, "/dev/ttyACM0");
  EXPECT_EQ(cfg.serial.baud_rate, 115200u);
  EXPECT_EQ(cfg.serial.read_timeout_ms, 250u);
  EXPECT_EQ(cfg.protocol.resync_settle_ms, 0u);
  EXPECT_TRUE(cfg.protocol.debug);

  const auto options = ard8088_host::to_engine_options(cfg);
  EXPECT_EQ(options.read_timeout, std::chrono::milliseconds(250));
  EXPECT_EQ(options.resync_settle, std::chrono::milliseconds(0));
  EXPECT_TRUE(options.debug);
}

TEST(Config, RejectsInvalidDocuments) {
  expect_config_error("protocol:\n  debug: true\n", "'serial'");
  expect_config_error("serial: /dev/ttyUSB0\n", "must be a map");
  expect_config_error("serial:\n  baud_rate: 9600\n", "serial.port");
  expect_config_error("serial:\n  port: ''\n", "must not be empty");
  expect_config_error("serial:\n  port: /dev/x\n  baud_rate: 12345\n",
                      "not a supported");
  expect_config_error("serial:\n  port: /dev/x\n  read_timeout_ms: 0\n",
                      "read_timeout_ms");
  expect_config_error("serial:\n  port: /dev/x\n  read_timeout_ms: fast\n",
                      "must be an integer");
  expect_config_error(
      "serial:\n  port: /dev/x\nprotocol:\n  resync_settle_ms: 20000\n",
      "resync_settle_ms");
  expect_config_error("serial:\n  port: /dev/x\nprotocol:\n  debug: maybe\n",
                      "protocol.debug");
  expect_config_error("- a\n- b\n", "top level");
}

TEST(Config, LoadFromFile) {
  const auto path = std::filesystem::temp_directory_path() /
                    "ard8088_host_test_config.yaml";
  {
    std::ofstream out(path);
    out << "serial:\n  port: /dev/ttyS3\n";
  }

  const auto cfg = load_config(path.string());
  EXPECT_EQ(cfg.serial.port, "/dev/ttyS3");
  EXPECT_TRUE(std::filesystem::path(cfg.config_file_path).is_absolute());

  std::filesystem::remove(path);
}

TEST(Config, MissingFileThrows) {
  try {
    load_config("/nonexistent/ard8088/config.yaml");
    FAIL() << "expected a missing file to be rejected";
  } catch (const std::runtime_error &e) {
    const std::string what = e.what();
    EXPECT_EQ(what.rfind("[CONFIG] ", 0), 0u) << what;
    EXPECT_NE(what.find("/nonexistent/ard8088/config.yaml"), std::string::npos);
  }
}
