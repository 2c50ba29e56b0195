#include "handlers.hpp"

#include <array>
#include <optional>
#include <string>
#include <vector>

namespace handlers {

using ard8088::BusEngine;
using ard8088::ErrorCode;
using ard8088::InputPin;
using ard8088::RegisterSnapshot;
using ard8088::Result;
using ard8088::bridge::v1::LastErrorRequest;
using ard8088::bridge::v1::LoadRegistersRequest;
using ard8088::bridge::v1::QueueBytesRequest;
using ard8088::bridge::v1::RawCommandRequest;
using ard8088::bridge::v1::ReadPinRequest;
using ard8088::bridge::v1::Registers;
using ard8088::bridge::v1::Request;
using ard8088::bridge::v1::Response;
using ard8088::bridge::v1::Status;
using ard8088::bridge::v1::WriteDataBusRequest;
using ard8088::bridge::v1::WritePinRequest;

// Upper bounds on caller-supplied reply lengths.
static constexpr uint32_t kMaxLastErrorBytes = 64;
static constexpr uint32_t kMaxRawReplyBytes = 64;

Status::Code to_status_code(ErrorCode code) {
  switch (code) {
  case ErrorCode::Ok:
    return Status::CODE_OK;
  case ErrorCode::ProtocolUsage:
    return Status::CODE_PROTOCOL_USAGE;
  case ErrorCode::TransportTimeout:
    return Status::CODE_TRANSPORT_TIMEOUT;
  case ErrorCode::DeviceRejected:
    return Status::CODE_DEVICE_REJECTED;
  case ErrorCode::OutOfSync:
    return Status::CODE_OUT_OF_SYNC;
  case ErrorCode::TransportError:
    return Status::CODE_TRANSPORT_ERROR;
  }
  return Status::CODE_INTERNAL;
}

static inline void set_status(Response &resp, Status::Code code,
                              const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

static inline void set_status(Response &resp, const ard8088::Status &st) {
  set_status(resp, to_status_code(st.code), st.message);
}

// Wire registers are uint32 in protobuf; anything above 0xFFFF is a caller bug.
static bool registers_from_proto(const Registers &in, RegisterSnapshot &out,
                                 std::string &err) {
  const uint32_t values[ard8088::kRegisterCount] = {
      in.ax(), in.bx(), in.cx(), in.dx(), in.ss(), in.sp(), in.flags(),
      in.ip(), in.cs(), in.ds(), in.es(), in.bp(), in.si(), in.di()};

  std::array<uint16_t, ard8088::kRegisterCount> narrowed{};
  for (std::size_t i = 0; i < ard8088::kRegisterCount; ++i) {
    if (values[i] > 0xFFFF) {
      err = std::string(ard8088::kRegisterNames[i]) + " exceeds 16 bits";
      return false;
    }
    narrowed[i] = static_cast<uint16_t>(values[i]);
  }
  out = ard8088::from_wire_order(narrowed);
  return true;
}

static void registers_to_proto(const RegisterSnapshot &in, Registers &out) {
  out.set_ax(in.ax);
  out.set_bx(in.bx);
  out.set_cx(in.cx);
  out.set_dx(in.dx);
  out.set_ss(in.ss);
  out.set_sp(in.sp);
  out.set_flags(in.flags);
  out.set_ip(in.ip);
  out.set_cs(in.cs);
  out.set_ds(in.ds);
  out.set_es(in.es);
  out.set_bp(in.bp);
  out.set_si(in.si);
  out.set_di(in.di);
}

static bool pin_from_proto(int pin, InputPin &out) {
  switch (pin) {
  case ard8088::bridge::v1::PIN_READY:
    out = InputPin::Ready;
    return true;
  case ard8088::bridge::v1::PIN_TEST:
    out = InputPin::Test;
    return true;
  case ard8088::bridge::v1::PIN_INTR:
    out = InputPin::Intr;
    return true;
  case ard8088::bridge::v1::PIN_NMI:
    out = InputPin::Nmi;
    return true;
  default:
    return false;
  }
}

static void reply_value(Response &resp, const Result<uint8_t> &r) {
  set_status(resp, r.status);
  if (r.ok()) {
    resp.set_value(*r);
  }
}

void handle_load_registers(BusEngine &engine, const LoadRegistersRequest &req,
                           Response &resp) {
  if (!req.has_registers()) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "registers are required");
    return;
  }

  RegisterSnapshot regs;
  std::string err;
  if (!registers_from_proto(req.registers(), regs, err)) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, err);
    return;
  }

  set_status(resp, engine.load_registers(regs));
}

void handle_write_data_bus(BusEngine &engine, const WriteDataBusRequest &req,
                           Response &resp) {
  if (req.value() > 0xFF) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               "data bus value exceeds 8 bits");
    return;
  }
  set_status(resp, engine.write_data_bus(static_cast<uint8_t>(req.value())));
}

void handle_queue_bytes(BusEngine &engine, const QueueBytesRequest &req,
                        Response &resp) {
  const auto r = engine.queue_bytes(req.count());
  set_status(resp, r.status);
  if (r.ok()) {
    resp.set_data(std::string(r->begin(), r->end()));
  }
}

void handle_write_pin(BusEngine &engine, const WritePinRequest &req,
                      Response &resp) {
  InputPin pin;
  if (!pin_from_proto(req.pin(), pin)) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "unknown pin");
    return;
  }
  set_status(resp, engine.write_pin(pin, req.level()));
}

void handle_read_pin(BusEngine &engine, const ReadPinRequest &req,
                     Response &resp) {
  InputPin pin;
  if (!pin_from_proto(req.pin(), pin)) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "unknown pin");
    return;
  }
  const auto r = engine.read_pin(pin);
  set_status(resp, r.status);
  if (r.ok()) {
    resp.set_level(*r);
  }
}

void handle_last_error(BusEngine &engine, const LastErrorRequest &req,
                       Response &resp) {
  if (req.length() > kMaxLastErrorBytes) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "length too large");
    return;
  }
  const auto r = engine.last_error(req.length());
  set_status(resp, r.status);
  if (r.ok()) {
    resp.set_text(*r);
  }
}

void handle_raw(BusEngine &engine, const RawCommandRequest &req,
                Response &resp) {
  const auto command = req.opcode() <= 0xFF
                           ? ard8088::command_from_opcode(
                                 static_cast<uint8_t>(req.opcode()))
                           : std::nullopt;
  if (!command) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               "opcode " + std::to_string(req.opcode()) + " is not in the command table");
    return;
  }
  if (req.reply_bytes() > kMaxRawReplyBytes) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, "reply_bytes too large");
    return;
  }

  const std::vector<uint8_t> payload(req.payload().begin(),
                                     req.payload().end());
  std::vector<uint8_t> reply;
  const auto st = engine.execute(*command, payload, req.reply_bytes(), reply);
  set_status(resp, st);
  if (st.ok()) {
    resp.set_data(std::string(reply.begin(), reply.end()));
  }
}

void handle_unimplemented(Response &resp) {
  set_status(resp, Status::CODE_UNIMPLEMENTED, "request has no command set");
}

void dispatch(BusEngine &engine, const Request &req, Response &resp) {
  resp.Clear();
  resp.set_request_id(req.request_id());
  set_status(resp, Status::CODE_INTERNAL, "uninitialized");

  switch (req.command_case()) {
  case Request::kGetVersion: {
    const auto r = engine.get_version();
    set_status(resp, r.status);
    if (r.ok()) {
      resp.mutable_version()->set_name(r->name);
      resp.mutable_version()->set_version(r->version);
    }
    break;
  }
  case Request::kReset:
    set_status(resp, engine.reset());
    break;
  case Request::kLoadRegisters:
    handle_load_registers(engine, req.load_registers(), resp);
    break;
  case Request::kStepCycle:
    set_status(resp, engine.step_cycle());
    break;
  case Request::kReadAddress: {
    const auto r = engine.read_address();
    set_status(resp, r.status);
    if (r.ok()) {
      resp.set_value(*r);
    }
    break;
  }
  case Request::kReadStatus:
    reply_value(resp, engine.read_status());
    break;
  case Request::kRead8288Command:
    reply_value(resp, engine.read_8288_command());
    break;
  case Request::kRead8288Control:
    reply_value(resp, engine.read_8288_control());
    break;
  case Request::kReadDataBus:
    reply_value(resp, engine.read_data_bus());
    break;
  case Request::kWriteDataBus:
    handle_write_data_bus(engine, req.write_data_bus(), resp);
    break;
  case Request::kFinalize:
    set_status(resp, engine.finalize());
    break;
  case Request::kBeginStore:
    set_status(resp, engine.begin_store());
    break;
  case Request::kStoreRegisters: {
    const auto r = engine.store_registers();
    set_status(resp, r.status);
    if (r.ok()) {
      registers_to_proto(*r, *resp.mutable_registers());
    }
    break;
  }
  case Request::kQueueLength:
    reply_value(resp, engine.queue_length());
    break;
  case Request::kQueueBytes:
    handle_queue_bytes(engine, req.queue_bytes(), resp);
    break;
  case Request::kWritePin:
    handle_write_pin(engine, req.write_pin(), resp);
    break;
  case Request::kReadPin:
    handle_read_pin(engine, req.read_pin(), resp);
    break;
  case Request::kGetProgramState:
    reply_value(resp, engine.get_program_state());
    break;
  case Request::kLastError:
    handle_last_error(engine, req.last_error(), resp);
    break;
  case Request::kGetCycleStatus: {
    const auto r = engine.get_cycle_status();
    set_status(resp, r.status);
    if (r.ok()) {
      auto *out = resp.mutable_cycle_status();
      out->set_program_state(r->program_state);
      out->set_control_bits(r->control_bits);
      out->set_status(r->status);
      out->set_command_bits(r->command_bits);
      out->set_data_bus(r->data_bus);
    }
    break;
  }
  case Request::kRaw:
    handle_raw(engine, req.raw(), resp);
    break;
  case Request::COMMAND_NOT_SET:
  default:
    handle_unimplemented(resp);
    break;
  }
}

} // namespace handlers
