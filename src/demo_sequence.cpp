#include "demo_sequence.hpp"

#include <iomanip>
#include <sstream>
#include <string>

namespace ard8088_host {

namespace {

std::string hex(uint32_t v, int width) {
  std::ostringstream os;
  os << "0x" << std::hex << std::setw(width) << std::setfill('0') << v;
  return os.str();
}

std::string failure(const ard8088::Status &st) {
  return std::string("FAILED (") + ard8088::error_code_name(st.code) + ": " +
         st.message + ")";
}

std::string describe(const ard8088::Status &st) {
  return st.ok() ? "ok" : failure(st);
}

template <typename T, typename Fmt>
std::string describe(const ard8088::Result<T> &r, Fmt fmt) {
  return r.ok() ? fmt(*r) : failure(r.status);
}

} // namespace

bool run_demo_sequence(ard8088::BusEngine &engine, std::ostream &out) {
  bool all_ok = true;
  auto step = [&](const char *label, bool ok, const std::string &text) {
    out << label << ": " << text << "\n";
    all_ok = all_ok && ok;
  };
  auto byte_fmt = [](uint8_t v) { return hex(v, 2); };

  const auto version = engine.get_version();
  step("version", version.ok(),
       describe(version, [](const ard8088::VersionInfo &v) {
         return v.name + " v" + std::to_string(v.version);
       }));

  const auto reset = engine.reset();
  step("reset", reset.ok(), describe(reset));

  ard8088::RegisterSnapshot regs;
  regs.ax = 1;
  regs.bx = 2;
  regs.cx = 3;
  regs.dx = 4;
  regs.ss = 5;
  regs.sp = 6;
  regs.flags = 7;
  regs.ip = 8;
  regs.cs = 9;
  regs.ds = 10;
  regs.es = 11;
  regs.bp = 12;
  regs.si = 13;
  regs.di = 14;
  const auto load = engine.load_registers(regs);
  step("load", load.ok(), describe(load));

  const auto cycle = engine.step_cycle();
  step("cycle", cycle.ok(), describe(cycle));

  const auto address = engine.read_address();
  step("read address", address.ok(),
       describe(address, [](uint32_t v) { return hex(v, 6); }));

  const auto status = engine.read_status();
  step("read status", status.ok(), describe(status, byte_fmt));

  const auto command = engine.read_8288_command();
  step("read 8288 command", command.ok(), describe(command, byte_fmt));

  const auto control = engine.read_8288_control();
  step("read 8288 control", control.ok(), describe(control, byte_fmt));

  const auto store = engine.store_registers();
  step("store", store.ok(),
       describe(store, [](const ard8088::RegisterSnapshot &r) {
         const auto values = ard8088::to_wire_order(r);
         std::string s;
         for (std::size_t i = 0; i < values.size(); ++i) {
           if (i > 0) {
             s += ' ';
           }
           s += std::string(ard8088::kRegisterNames[i]) + "=" +
                hex(values[i], 4);
         }
         return s;
       }));

  return all_ok;
}

} // namespace ard8088_host
