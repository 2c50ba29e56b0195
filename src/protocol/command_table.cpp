#include "command_table.hpp"

namespace ard8088 {

std::optional<Command> command_from_opcode(uint8_t opcode) {
  if (opcode >= kCommandCount) {
    return std::nullopt;
  }
  return kCommandTable[opcode].command;
}

const char *command_name(Command command) {
  const uint8_t opcode = opcode_of(command);
  if (opcode >= kCommandCount) {
    return "Unknown";
  }
  return kCommandTable[opcode].name;
}

} // namespace ard8088
