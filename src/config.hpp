#pragma once

#include <cstdint>
#include <string>
#include <yaml-cpp/yaml.h>

#include "protocol/bus_engine.hpp"

namespace ard8088_host {

// Serial link to the board
struct SerialConfig {
  std::string port;               // Device path, e.g. /dev/ttyUSB1
  uint32_t baud_rate = 1000000;   // Board firmware runs at 1 Mbaud
  uint32_t read_timeout_ms = 1000;
};

// Engine behavior
struct ProtocolConfig {
  uint32_t resync_settle_ms = 110;
  bool debug = false;
};

// Complete host configuration
struct HostConfig {
  std::string config_file_path; // Absolute path of the loaded file
  SerialConfig serial;
  ProtocolConfig protocol;
};

// Load host configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
HostConfig load_config(const std::string &path);

// Parse host configuration from an already loaded YAML document
// Throws std::runtime_error if validation fails
HostConfig parse_config(const YAML::Node &yaml);

ard8088::EngineOptions to_engine_options(const HostConfig &config);

} // namespace ard8088_host
