#include "bus_engine.hpp"

#include <cstdio>
#include <iostream>
#include <thread>

#include "protocol/wire_codec.hpp"

namespace ard8088 {

namespace {

std::string hex_dump(const std::vector<uint8_t> &bytes) {
  std::string out;
  char buf[4];
  for (const uint8_t b : bytes) {
    std::snprintf(buf, sizeof(buf), "%02x ", b);
    out += buf;
  }
  if (!out.empty()) {
    out.pop_back();
  }
  return out;
}

} // namespace

BusEngine::BusEngine(std::unique_ptr<transport::ByteTransport> transport,
                     EngineOptions options)
    : transport_(std::move(transport)), options_(options) {}

Status BusEngine::execute(Command command, const std::vector<uint8_t> &payload,
                          std::size_t reply_payload_bytes,
                          std::vector<uint8_t> &reply_payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  return execute_locked(command, payload, reply_payload_bytes, reply_payload);
}

Status BusEngine::execute_locked(Command command,
                                 const std::vector<uint8_t> &payload,
                                 std::size_t reply_payload_bytes,
                                 std::vector<uint8_t> &reply_payload) {
  reply_payload.clear();

  if (reply_payload_bytes > kMaxReplyPayloadBytes) {
    return usage(std::string(command_name(command)) + ": reply length " +
                 std::to_string(reply_payload_bytes) + " exceeds " +
                 std::to_string(kMaxReplyPayloadBytes));
  }

  std::vector<uint8_t> request;
  Status st = wire::encode_request(command, payload, request);
  if (!st.ok()) {
    return st;
  }

  if (!transport_ || !transport_->is_open()) {
    return io_error("transport is closed");
  }

  std::string err;
  if (!transport_->write(request.data(), request.size(), err)) {
    return io_error(std::string(command_name(command)) + ": " + err);
  }

  const std::size_t expected = reply_payload_bytes + 1;
  const std::vector<uint8_t> raw =
      transport_->read_exact(expected, options_.read_timeout);

  if (options_.debug) {
    std::cerr << "[BusEngine] " << command_name(command) << " <- ["
              << hex_dump(raw) << "]\n";
  }

  st = wire::decode_reply(raw, expected, reply_payload);
  switch (st.code) {
  case ErrorCode::DeviceRejected:
    std::cerr << "[BusEngine] " << command_name(command)
              << " rejected by device\n";
    break;
  case ErrorCode::OutOfSync:
    std::cerr << "[BusEngine] " << command_name(command)
              << " out of sync: " << st.message << "\n";
    resync_locked();
    break;
  default:
    break;
  }

  if (!st.ok()) {
    st.message = std::string(command_name(command)) + ": " + st.message;
  }
  return st;
}

// The wire carries no framing marker; the only way back into step is to let
// the board go quiet and drop whatever is still buffered.
void BusEngine::resync_locked() {
  state_ = SyncState::Resyncing;
  std::this_thread::sleep_for(options_.resync_settle);
  transport_->flush_input();
  ++resync_count_;
  state_ = SyncState::Synced;
}

Status BusEngine::simple(Command command, const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> reply;
  return execute(command, payload, 0, reply);
}

Result<uint8_t> BusEngine::read_byte(Command command,
                                     const std::vector<uint8_t> &payload) {
  std::vector<uint8_t> reply;
  Status st = execute(command, payload, 1, reply);
  if (!st.ok()) {
    return Result<uint8_t>::failure(st);
  }
  return Result<uint8_t>::success(reply[0]);
}

Result<VersionInfo> BusEngine::get_version() {
  std::vector<uint8_t> reply;
  Status st = execute(Command::Version, {}, kVersionNameBytes + 1, reply);
  if (!st.ok()) {
    return Result<VersionInfo>::failure(st);
  }

  VersionInfo info;
  info.name.assign(reply.begin(),
                   reply.begin() + static_cast<std::ptrdiff_t>(kVersionNameBytes));
  info.version = reply[kVersionNameBytes];
  return Result<VersionInfo>::success(info);
}

Status BusEngine::reset() { return simple(Command::Reset); }

Status BusEngine::load_registers(const RegisterSnapshot &regs) {
  return simple(Command::Load, wire::encode_registers(regs));
}

Status BusEngine::step_cycle() { return simple(Command::Cycle); }

Result<uint32_t> BusEngine::read_address() {
  std::vector<uint8_t> reply;
  Status st = execute(Command::ReadAddress, {}, 3, reply);
  if (!st.ok()) {
    return Result<uint32_t>::failure(st);
  }
  return Result<uint32_t>::success(wire::decode_u24_le(reply.data()));
}

Result<uint8_t> BusEngine::read_status() {
  return read_byte(Command::ReadStatus);
}

Result<uint8_t> BusEngine::read_8288_command() {
  return read_byte(Command::Read8288Command);
}

Result<uint8_t> BusEngine::read_8288_control() {
  return read_byte(Command::Read8288Control);
}

Result<uint8_t> BusEngine::read_data_bus() {
  return read_byte(Command::ReadDataBus);
}

Status BusEngine::write_data_bus(uint8_t value) {
  return simple(Command::WriteDataBus, {value});
}

Status BusEngine::finalize() { return simple(Command::Finalize); }

Status BusEngine::begin_store() { return simple(Command::BeginStore); }

Result<RegisterSnapshot> BusEngine::store_registers() {
  std::vector<uint8_t> reply;
  Status st = execute(Command::Store, {}, kRegisterSnapshotBytes, reply);
  if (!st.ok()) {
    return Result<RegisterSnapshot>::failure(st);
  }
  return Result<RegisterSnapshot>::success(wire::decode_registers(reply.data()));
}

Result<uint8_t> BusEngine::queue_length() {
  return read_byte(Command::QueueLen);
}

Result<std::vector<uint8_t>> BusEngine::queue_bytes(std::size_t count) {
  if (count > kMaxQueueBytes) {
    return Result<std::vector<uint8_t>>::failure(
        usage("QueueBytes: count " + std::to_string(count) + " exceeds " +
              std::to_string(kMaxQueueBytes)));
  }

  std::vector<uint8_t> reply;
  Status st = execute(Command::QueueBytes, {}, count, reply);
  if (!st.ok()) {
    return Result<std::vector<uint8_t>>::failure(st);
  }
  return Result<std::vector<uint8_t>>::success(reply);
}

Status BusEngine::write_pin(InputPin pin, bool level) {
  return simple(Command::WritePin,
                {static_cast<uint8_t>(pin), static_cast<uint8_t>(level ? 1 : 0)});
}

Result<bool> BusEngine::read_pin(InputPin pin) {
  auto r = read_byte(Command::ReadPin, {static_cast<uint8_t>(pin)});
  if (!r.ok()) {
    return Result<bool>::failure(r.status);
  }
  return Result<bool>::success((*r & 0x01) != 0);
}

Result<uint8_t> BusEngine::get_program_state() {
  return read_byte(Command::GetProgramState);
}

Result<std::string> BusEngine::last_error(std::size_t length) {
  std::vector<uint8_t> reply;
  Status st = execute(Command::LastError, {}, length, reply);
  if (!st.ok()) {
    return Result<std::string>::failure(st);
  }
  return Result<std::string>::success(std::string(reply.begin(), reply.end()));
}

Result<CycleStatus> BusEngine::get_cycle_status() {
  std::vector<uint8_t> reply;
  Status st = execute(Command::GetCycleStatus, {}, kCycleStatusBytes, reply);
  if (!st.ok()) {
    return Result<CycleStatus>::failure(st);
  }

  CycleStatus cs;
  cs.program_state = static_cast<uint8_t>(reply[0] >> 4);
  cs.control_bits = static_cast<uint8_t>(reply[0] & 0x0F);
  cs.status = reply[1];
  cs.command_bits = reply[2];
  cs.data_bus = wire::decode_u16_le(&reply[3]);
  return Result<CycleStatus>::success(cs);
}

SyncState BusEngine::sync_state() const { return state_.load(); }

std::size_t BusEngine::resync_count() const { return resync_count_.load(); }

void BusEngine::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (transport_) {
    transport_->close();
  }
}

} // namespace ard8088
