#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "protocol/command_table.hpp"
#include "protocol/registers.hpp"
#include "protocol/result.hpp"

namespace ard8088 {
namespace wire {

constexpr uint8_t kStatusFail = 0x00;
constexpr uint8_t kStatusOk = 0x01;

enum class ReplyStatus { Ok, Rejected, OutOfSync };

static inline uint16_t decode_u16_le(const uint8_t b[2]) {
  return static_cast<uint16_t>(static_cast<uint16_t>(b[0]) |
                               (static_cast<uint16_t>(b[1]) << 8));
}

static inline void encode_u16_le(uint16_t v, uint8_t b[2]) {
  b[0] = static_cast<uint8_t>(v & 0xFF);
  b[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
}

static inline uint32_t decode_u24_le(const uint8_t b[3]) {
  return (static_cast<uint32_t>(b[0])) | (static_cast<uint32_t>(b[1]) << 8) |
         (static_cast<uint32_t>(b[2]) << 16);
}

ReplyStatus classify_status_byte(uint8_t status);

// Builds opcode followed by payload into out. Fails with ProtocolUsage and
// leaves out empty when the payload length differs from the command table.
Status encode_request(Command command, const std::vector<uint8_t> &payload,
                      std::vector<uint8_t> &out);

// Checks a raw reply read for a request expecting expected_bytes (status byte
// included). On success payload holds everything before the status byte.
Status decode_reply(const std::vector<uint8_t> &raw, std::size_t expected_bytes,
                    std::vector<uint8_t> &payload);

// 14 registers, two bytes each, little-endian, AX..DI.
std::vector<uint8_t> encode_registers(const RegisterSnapshot &regs);

// Inverse of encode_registers. data must hold kRegisterSnapshotBytes.
RegisterSnapshot decode_registers(const uint8_t *data);

} // namespace wire
} // namespace ard8088
