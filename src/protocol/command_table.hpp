#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

namespace ard8088 {

// Board commands. The enumerator value is the opcode sent on the wire.
enum class Command : uint8_t {
  None = 0x00,
  Version = 0x01,
  Reset = 0x02,
  Load = 0x03,
  Cycle = 0x04,
  ReadAddress = 0x05,
  ReadStatus = 0x06,
  Read8288Command = 0x07,
  Read8288Control = 0x08,
  ReadDataBus = 0x09,
  WriteDataBus = 0x0A,
  Finalize = 0x0B,
  BeginStore = 0x0C,
  Store = 0x0D,
  QueueLen = 0x0E,
  QueueBytes = 0x0F,
  WritePin = 0x10,
  ReadPin = 0x11,
  GetProgramState = 0x12,
  LastError = 0x13,
  GetCycleStatus = 0x14,
  Invalid = 0x15
};

struct CommandSpec {
  Command command;
  std::size_t payload_bytes; // Exact outbound payload length
  const char *name;
};

constexpr std::size_t kCommandCount = 0x16;

// Indexed by opcode.
constexpr std::array<CommandSpec, kCommandCount> kCommandTable = {{
    {Command::None, 0, "None"},
    {Command::Version, 0, "Version"},
    {Command::Reset, 0, "Reset"},
    {Command::Load, 28, "Load"},
    {Command::Cycle, 0, "Cycle"},
    {Command::ReadAddress, 0, "ReadAddress"},
    {Command::ReadStatus, 0, "ReadStatus"},
    {Command::Read8288Command, 0, "Read8288Command"},
    {Command::Read8288Control, 0, "Read8288Control"},
    {Command::ReadDataBus, 0, "ReadDataBus"},
    {Command::WriteDataBus, 1, "WriteDataBus"},
    {Command::Finalize, 0, "Finalize"},
    {Command::BeginStore, 0, "BeginStore"},
    {Command::Store, 0, "Store"},
    {Command::QueueLen, 0, "QueueLen"},
    {Command::QueueBytes, 0, "QueueBytes"},
    {Command::WritePin, 2, "WritePin"},
    {Command::ReadPin, 1, "ReadPin"},
    {Command::GetProgramState, 0, "GetProgramState"},
    {Command::LastError, 0, "LastError"},
    {Command::GetCycleStatus, 0, "GetCycleStatus"},
    {Command::Invalid, 0, "Invalid"},
}};

constexpr uint8_t opcode_of(Command command) {
  return static_cast<uint8_t>(command);
}

constexpr const CommandSpec &command_spec(Command command) {
  return kCommandTable[opcode_of(command)];
}

constexpr std::size_t payload_bytes(Command command) {
  return command_spec(command).payload_bytes;
}

constexpr bool table_is_opcode_indexed() {
  for (std::size_t i = 0; i < kCommandTable.size(); ++i) {
    if (opcode_of(kCommandTable[i].command) != i) {
      return false;
    }
  }
  return true;
}

static_assert(table_is_opcode_indexed(),
              "command table entries must be ordered by opcode");

// Looks up the command for a raw opcode. Returns nullopt past Invalid.
std::optional<Command> command_from_opcode(uint8_t opcode);

const char *command_name(Command command);

} // namespace ard8088
