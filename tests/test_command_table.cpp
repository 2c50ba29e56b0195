#include <gtest/gtest.h>

#include <set>

#include "protocol/command_table.hpp"

using ard8088::Command;

TEST(CommandTable, OpcodesAreUniqueAndDense) {
  std::set<uint8_t> seen;
  for (const auto &spec : ard8088::kCommandTable) {
    EXPECT_TRUE(seen.insert(ard8088::opcode_of(spec.command)).second)
        << spec.name;
  }
  EXPECT_EQ(seen.size(), ard8088::kCommandCount);
  EXPECT_EQ(*seen.begin(), 0x00);
  EXPECT_EQ(*seen.rbegin(), 0x15);
}

TEST(CommandTable, PayloadLengths) {
  for (const auto &spec : ard8088::kCommandTable) {
    switch (spec.command) {
    case Command::Load:
      EXPECT_EQ(spec.payload_bytes, 28u);
      break;
    case Command::WriteDataBus:
    case Command::ReadPin:
      EXPECT_EQ(spec.payload_bytes, 1u) << spec.name;
      break;
    case Command::WritePin:
      EXPECT_EQ(spec.payload_bytes, 2u);
      break;
    default:
      EXPECT_EQ(spec.payload_bytes, 0u) << spec.name;
      break;
    }
  }
}

TEST(CommandTable, LookupByOpcode) {
  EXPECT_TRUE(ard8088::command_from_opcode(0x01) == Command::Version);
  EXPECT_TRUE(ard8088::command_from_opcode(0x0D) == Command::Store);
  EXPECT_TRUE(ard8088::command_from_opcode(0x15) == Command::Invalid);
  EXPECT_FALSE(ard8088::command_from_opcode(0x16).has_value());
  EXPECT_FALSE(ard8088::command_from_opcode(0xFF).has_value());
}

TEST(CommandTable, Names) {
  EXPECT_STREQ(ard8088::command_name(Command::Read8288Control),
               "Read8288Control");
  EXPECT_STREQ(ard8088::command_name(Command::GetCycleStatus),
               "GetCycleStatus");
}

static_assert(ard8088::payload_bytes(Command::Load) == 28,
              "Load carries the full register file");
