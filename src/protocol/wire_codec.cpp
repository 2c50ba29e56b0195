#include "wire_codec.hpp"

#include <array>
#include <string>

namespace ard8088 {
namespace wire {

ReplyStatus classify_status_byte(uint8_t status) {
  if (status == kStatusOk) {
    return ReplyStatus::Ok;
  }
  if (status == kStatusFail) {
    return ReplyStatus::Rejected;
  }
  return ReplyStatus::OutOfSync;
}

Status encode_request(Command command, const std::vector<uint8_t> &payload,
                      std::vector<uint8_t> &out) {
  out.clear();

  const CommandSpec &spec = command_spec(command);
  if (payload.size() != spec.payload_bytes) {
    return usage(std::string(spec.name) + " expects " +
                 std::to_string(spec.payload_bytes) + " payload bytes, got " +
                 std::to_string(payload.size()));
  }

  out.reserve(1 + payload.size());
  out.push_back(opcode_of(command));
  out.insert(out.end(), payload.begin(), payload.end());
  return ok();
}

Status decode_reply(const std::vector<uint8_t> &raw, std::size_t expected_bytes,
                    std::vector<uint8_t> &payload) {
  payload.clear();

  if (expected_bytes == 0) {
    return usage("reply length must include the status byte");
  }
  if (raw.size() < expected_bytes) {
    return timed_out("expected " + std::to_string(expected_bytes) +
                     " reply bytes, got " + std::to_string(raw.size()));
  }

  const uint8_t status = raw[expected_bytes - 1];
  switch (classify_status_byte(status)) {
  case ReplyStatus::Ok:
    payload.assign(raw.begin(),
                   raw.begin() + static_cast<std::ptrdiff_t>(expected_bytes - 1));
    return ok();
  case ReplyStatus::Rejected:
    return rejected("device returned failure status");
  case ReplyStatus::OutOfSync:
    break;
  }
  return out_of_sync("unexpected status byte " + std::to_string(status));
}

std::vector<uint8_t> encode_registers(const RegisterSnapshot &regs) {
  std::vector<uint8_t> out(kRegisterSnapshotBytes, 0);
  const auto values = to_wire_order(regs);
  for (std::size_t i = 0; i < kRegisterCount; ++i) {
    encode_u16_le(values[i], &out[i * 2]);
  }
  return out;
}

RegisterSnapshot decode_registers(const uint8_t *data) {
  std::array<uint16_t, kRegisterCount> values{};
  for (std::size_t i = 0; i < kRegisterCount; ++i) {
    values[i] = decode_u16_le(data + i * 2);
  }
  return from_wire_order(values);
}

} // namespace wire
} // namespace ard8088
