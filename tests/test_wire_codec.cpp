#include <gtest/gtest.h>

#include "protocol/wire_codec.hpp"

using ard8088::Command;
using ard8088::ErrorCode;
using ard8088::RegisterSnapshot;
namespace wire = ard8088::wire;

TEST(WireCodec, EncodeRequestPrefixesOpcode) {
  std::vector<uint8_t> out;
  auto st = wire::encode_request(Command::WritePin, {0x02, 0x01}, out);
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(out, (std::vector<uint8_t>{0x10, 0x02, 0x01}));

  st = wire::encode_request(Command::Version, {}, out);
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(out, (std::vector<uint8_t>{0x01}));
}

TEST(WireCodec, EncodeRequestRejectsWrongLength) {
  std::vector<uint8_t> out{0xAA};
  const auto st = wire::encode_request(Command::Load, {1, 2, 3}, out);
  EXPECT_EQ(st.code, ErrorCode::ProtocolUsage);
  EXPECT_TRUE(out.empty());
}

TEST(WireCodec, ClassifyStatusByte) {
  EXPECT_EQ(wire::classify_status_byte(0x01), wire::ReplyStatus::Ok);
  EXPECT_EQ(wire::classify_status_byte(0x00), wire::ReplyStatus::Rejected);
  EXPECT_EQ(wire::classify_status_byte(0x7F), wire::ReplyStatus::OutOfSync);
  EXPECT_EQ(wire::classify_status_byte(0xFF), wire::ReplyStatus::OutOfSync);
}

TEST(WireCodec, DecodeReplyStripsStatus) {
  std::vector<uint8_t> payload;
  const auto st = wire::decode_reply({0x34, 0x12, 0x00, 0x01}, 4, payload);
  ASSERT_TRUE(st.ok());
  EXPECT_EQ(payload, (std::vector<uint8_t>{0x34, 0x12, 0x00}));
}

TEST(WireCodec, DecodeReplyShortReadIsTimeout) {
  std::vector<uint8_t> payload;
  const auto st = wire::decode_reply({0x34, 0x12}, 4, payload);
  EXPECT_EQ(st.code, ErrorCode::TransportTimeout);
  EXPECT_TRUE(payload.empty());
}

TEST(WireCodec, DecodeReplyStatusBytes) {
  std::vector<uint8_t> payload;
  EXPECT_EQ(wire::decode_reply({0x00}, 1, payload).code,
            ErrorCode::DeviceRejected);
  EXPECT_EQ(wire::decode_reply({0x55, 0x7F}, 2, payload).code,
            ErrorCode::OutOfSync);
  EXPECT_TRUE(payload.empty());
}

TEST(WireCodec, U24LittleEndian) {
  const uint8_t b[3] = {0x56, 0x34, 0x0F};
  EXPECT_EQ(wire::decode_u24_le(b), 0x0F3456u);
}

TEST(WireCodec, RegistersSerializeInDeclaredOrder) {
  RegisterSnapshot r;
  r.ax = 0x0102;
  r.bx = 0x0304;
  r.cx = 0x0506;
  r.dx = 0x0708;
  r.ss = 0x090A;
  r.sp = 0x0B0C;
  r.flags = 0x0D0E;
  r.ip = 0x0F10;
  r.cs = 0x1112;
  r.ds = 0x1314;
  r.es = 0x1516;
  r.bp = 0x1718;
  r.si = 0x191A;
  r.di = 0x1B1C;

  const auto bytes = wire::encode_registers(r);
  ASSERT_EQ(bytes.size(), 28u);
  for (std::size_t i = 0; i < 14; ++i) {
    const uint8_t hi = static_cast<uint8_t>(2 * i + 1);
    const uint8_t lo = static_cast<uint8_t>(2 * i + 2);
    EXPECT_EQ(bytes[2 * i], lo) << ard8088::kRegisterNames[i];
    EXPECT_EQ(bytes[2 * i + 1], hi) << ard8088::kRegisterNames[i];
  }
}

TEST(WireCodec, RegistersRecoverFullRange) {
  // Each register walks the whole uint16 range at a different offset.
  for (uint32_t v = 0; v <= 0xFFFF; ++v) {
    std::array<uint16_t, ard8088::kRegisterCount> values{};
    for (std::size_t i = 0; i < values.size(); ++i) {
      values[i] = static_cast<uint16_t>(v + i * 0x1111);
    }
    const RegisterSnapshot in = ard8088::from_wire_order(values);
    const auto bytes = wire::encode_registers(in);
    const RegisterSnapshot out = wire::decode_registers(bytes.data());
    ASSERT_EQ(ard8088::to_wire_order(out), values) << "v=" << v;
  }
}
