#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace ard8088 {

constexpr std::size_t kRegisterCount = 14;
constexpr std::size_t kRegisterSnapshotBytes = kRegisterCount * 2;

// Wire order for Load and Store.
constexpr std::array<const char *, kRegisterCount> kRegisterNames = {
    "AX", "BX", "CX", "DX", "SS", "SP", "FLAGS",
    "IP", "CS", "DS", "ES", "BP", "SI", "DI"};

// Full 8088 register file as transferred by Load/Store.
struct RegisterSnapshot {
  uint16_t ax = 0;
  uint16_t bx = 0;
  uint16_t cx = 0;
  uint16_t dx = 0;
  uint16_t ss = 0;
  uint16_t sp = 0;
  uint16_t flags = 0;
  uint16_t ip = 0;
  uint16_t cs = 0;
  uint16_t ds = 0;
  uint16_t es = 0;
  uint16_t bp = 0;
  uint16_t si = 0;
  uint16_t di = 0;
};

inline std::array<uint16_t, kRegisterCount>
to_wire_order(const RegisterSnapshot &r) {
  return {r.ax, r.bx, r.cx, r.dx, r.ss, r.sp, r.flags,
          r.ip, r.cs, r.ds, r.es, r.bp, r.si, r.di};
}

inline RegisterSnapshot
from_wire_order(const std::array<uint16_t, kRegisterCount> &v) {
  RegisterSnapshot r;
  r.ax = v[0];
  r.bx = v[1];
  r.cx = v[2];
  r.dx = v[3];
  r.ss = v[4];
  r.sp = v[5];
  r.flags = v[6];
  r.ip = v[7];
  r.cs = v[8];
  r.ds = v[9];
  r.es = v[10];
  r.bp = v[11];
  r.si = v[12];
  r.di = v[13];
  return r;
}

inline bool operator==(const RegisterSnapshot &a, const RegisterSnapshot &b) {
  return to_wire_order(a) == to_wire_order(b);
}

inline bool operator!=(const RegisterSnapshot &a, const RegisterSnapshot &b) {
  return !(a == b);
}

} // namespace ard8088
