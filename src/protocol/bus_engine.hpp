#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "protocol/command_table.hpp"
#include "protocol/registers.hpp"
#include "protocol/result.hpp"
#include "transport/byte_transport.hpp"

namespace ard8088 {

struct EngineOptions {
  std::chrono::milliseconds read_timeout{1000};
  std::chrono::milliseconds resync_settle{110}; // Quiet time before flushing
  bool debug = false;                           // Log every raw reply
};

enum class SyncState { Synced, Resyncing };

struct VersionInfo {
  std::string name; // 7 ASCII characters, e.g. "Ardui88"
  uint8_t version = 0;
};

// CPU input pins the board can drive, by wire index.
enum class InputPin : uint8_t { Ready = 0, Test = 1, Intr = 2, Nmi = 3 };

// Everything a host usually needs after stepping one bus cycle.
struct CycleStatus {
  uint8_t program_state = 0; // Upper nibble of the first reply byte
  uint8_t control_bits = 0;  // Lower nibble of the first reply byte
  uint8_t status = 0;        // S0-S5, QS0-QS1
  uint8_t command_bits = 0;  // 8288 command outputs
  uint16_t data_bus = 0;     // Low byte first on the wire
};

constexpr std::size_t kVersionNameBytes = 7;
constexpr std::size_t kMaxQueueBytes = 4; // 8088 prefetch queue depth
constexpr std::size_t kMaxReplyPayloadBytes = 256;
constexpr std::size_t kCycleStatusBytes = 5;

// Session with one Arduino8088 board. Owns the transport for its lifetime
// and serializes every request/reply exchange.
class BusEngine {
public:
  explicit BusEngine(std::unique_ptr<transport::ByteTransport> transport,
                     EngineOptions options = {});

  BusEngine(const BusEngine &) = delete;
  BusEngine &operator=(const BusEngine &) = delete;

  // Sends command with payload and reads reply_payload_bytes plus the status
  // byte. On success reply_payload holds the bytes before the status byte.
  Status execute(Command command, const std::vector<uint8_t> &payload,
                 std::size_t reply_payload_bytes,
                 std::vector<uint8_t> &reply_payload);

  Result<VersionInfo> get_version();
  Status reset();
  Status load_registers(const RegisterSnapshot &regs);
  Status step_cycle();
  Result<uint32_t> read_address();
  Result<uint8_t> read_status();
  Result<uint8_t> read_8288_command();
  Result<uint8_t> read_8288_control();
  Result<uint8_t> read_data_bus();
  Status write_data_bus(uint8_t value);
  Status finalize();
  Status begin_store();
  Result<RegisterSnapshot> store_registers();
  Result<uint8_t> queue_length();

  // count must come from a preceding queue_length() call.
  Result<std::vector<uint8_t>> queue_bytes(std::size_t count);

  Status write_pin(InputPin pin, bool level);
  Result<bool> read_pin(InputPin pin);
  Result<uint8_t> get_program_state();

  // The board sends its error text without terminator; length is the number
  // of characters the caller expects.
  Result<std::string> last_error(std::size_t length);

  Result<CycleStatus> get_cycle_status();

  SyncState sync_state() const;
  std::size_t resync_count() const;

  // Closes the transport; every later call fails with TransportError.
  void close();

private:
  Status execute_locked(Command command, const std::vector<uint8_t> &payload,
                        std::size_t reply_payload_bytes,
                        std::vector<uint8_t> &reply_payload);
  void resync_locked();

  Status simple(Command command, const std::vector<uint8_t> &payload = {});
  Result<uint8_t> read_byte(Command command,
                            const std::vector<uint8_t> &payload = {});

  std::unique_ptr<transport::ByteTransport> transport_;
  EngineOptions options_;

  std::mutex mutex_;
  std::atomic<SyncState> state_{SyncState::Synced};
  std::atomic<std::size_t> resync_count_{0};
};

} // namespace ard8088
