#include "config.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include "transport/serial_port.hpp"

namespace ard8088_host {

namespace fs = std::filesystem;

// Reads an optional unsigned field and checks it against [lo, hi].
static uint32_t read_bounded(const YAML::Node &section, const char *section_name,
                             const char *key, uint32_t fallback, uint32_t lo,
                             uint32_t hi) {
  if (!section[key]) {
    return fallback;
  }

  long long value = 0;
  try {
    value = section[key].as<long long>();
  } catch (const YAML::Exception &) {
    throw std::runtime_error("[CONFIG] " + std::string(section_name) + "." +
                             key + " must be an integer");
  }

  if (value < static_cast<long long>(lo) || value > static_cast<long long>(hi)) {
    throw std::runtime_error("[CONFIG] " + std::string(section_name) + "." +
                             key + " must be in range [" + std::to_string(lo) +
                             ", " + std::to_string(hi) + "]");
  }
  return static_cast<uint32_t>(value);
}

HostConfig parse_config(const YAML::Node &yaml) {
  HostConfig config;

  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] top level must be a map");
  }

  // Parse serial section - REQUIRED
  if (!yaml["serial"]) {
    throw std::runtime_error("[CONFIG] Missing required 'serial' section");
  }
  const YAML::Node serial = yaml["serial"];
  if (!serial.IsMap()) {
    throw std::runtime_error("[CONFIG] 'serial' section must be a map");
  }

  if (!serial["port"]) {
    throw std::runtime_error("[CONFIG] Missing required 'serial.port'");
  }
  try {
    config.serial.port = serial["port"].as<std::string>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Invalid serial.port: " +
                             std::string(e.what()));
  }
  if (config.serial.port.empty()) {
    throw std::runtime_error("[CONFIG] serial.port must not be empty");
  }

  config.serial.baud_rate = read_bounded(serial, "serial", "baud_rate",
                                         config.serial.baud_rate, 1, 4000000);
  if (!transport::is_supported_baud_rate(config.serial.baud_rate)) {
    throw std::runtime_error("[CONFIG] serial.baud_rate " +
                             std::to_string(config.serial.baud_rate) +
                             " is not a supported termios rate");
  }

  config.serial.read_timeout_ms =
      read_bounded(serial, "serial", "read_timeout_ms",
                   config.serial.read_timeout_ms, 1, 60000);

  // Parse protocol section - optional
  if (yaml["protocol"]) {
    const YAML::Node protocol = yaml["protocol"];
    if (!protocol.IsMap()) {
      throw std::runtime_error("[CONFIG] 'protocol' section must be a map");
    }

    config.protocol.resync_settle_ms =
        read_bounded(protocol, "protocol", "resync_settle_ms",
                     config.protocol.resync_settle_ms, 0, 10000);

    if (protocol["debug"]) {
      try {
        config.protocol.debug = protocol["debug"].as<bool>();
      } catch (const YAML::Exception &) {
        throw std::runtime_error("[CONFIG] protocol.debug must be a boolean");
      }
    }
  }

  return config;
}

HostConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("[CONFIG] Failed to load config file '" + path +
                             "': " + e.what());
  }

  HostConfig config = parse_config(yaml);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

ard8088::EngineOptions to_engine_options(const HostConfig &config) {
  ard8088::EngineOptions options;
  options.read_timeout = std::chrono::milliseconds(config.serial.read_timeout_ms);
  options.resync_settle =
      std::chrono::milliseconds(config.protocol.resync_settle_ms);
  options.debug = config.protocol.debug;
  return options;
}

} // namespace ard8088_host
