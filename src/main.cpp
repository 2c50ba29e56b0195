#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "demo_sequence.hpp"
#include "handlers.hpp"
#include "protocol.pb.h"
#include "protocol/bus_engine.hpp"
#include "transport/framed_stdio.hpp"
#include "transport/serial_port.hpp"

static void log_err(const std::string &msg) {
  std::cerr << "ard8088-host: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: ard8088-host --config <path/to/config.yaml> "
          "[--port <device>] [--demo]");
}

int main(int argc, char **argv) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  // Parse command-line arguments
  std::optional<std::string> config_path;
  std::optional<std::string> port_override;
  bool demo = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--port" && i + 1 < argc) {
      port_override = argv[++i];
    } else if (arg == "--demo") {
      demo = true;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return 1;
  }

  // Load configuration and open the board
  std::unique_ptr<ard8088::BusEngine> engine;
  try {
    log_err("loading configuration from: " + *config_path);
    ard8088_host::HostConfig config = ard8088_host::load_config(*config_path);
    if (port_override) {
      config.serial.port = *port_override;
    }

    log_err("opening " + config.serial.port + " at " +
            std::to_string(config.serial.baud_rate) + " baud");
    auto port = std::make_unique<transport::SerialPort>(
        config.serial.port, config.serial.baud_rate);
    engine = std::make_unique<ard8088::BusEngine>(
        std::move(port), ard8088_host::to_engine_options(config));
  } catch (const std::exception &e) {
    log_err("FATAL: " + std::string(e.what()));
    return 1;
  }

  if (demo) {
    const bool ok = ard8088_host::run_demo_sequence(*engine, std::cout);
    engine->close();
    return ok ? 0 : 1;
  }

  log_err("starting (transport=stdio+uint32_le)");

  std::vector<uint8_t> frame;
  std::string io_err;

  while (true) {
    const bool ok = transport::read_frame(std::cin, frame, io_err);
    if (!ok) {
      engine->close();
      if (io_err.empty()) {
        log_err("EOF on stdin; exiting cleanly");
        return 0;
      }
      log_err("read_frame error: " + io_err);
      return 2;
    }

    ard8088::bridge::v1::Request req;
    if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
      log_err("failed to parse Request protobuf");
      engine->close();
      return 3;
    }

    ard8088::bridge::v1::Response resp;
    handlers::dispatch(*engine, req, resp);

    std::string resp_bytes;
    if (!resp.SerializeToString(&resp_bytes)) {
      log_err("failed to serialize Response protobuf");
      engine->close();
      return 4;
    }

    if (!transport::write_frame(std::cout, resp_bytes, io_err)) {
      log_err("write_frame error: " + io_err);
      engine->close();
      return 5;
    }
  }
}
