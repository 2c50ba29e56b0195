#pragma once

#include <ostream>

#include "protocol/bus_engine.hpp"

namespace ard8088_host {

// Runs version, reset, load, cycle, the bus/status reads and store against
// the board, printing one line per step. Returns true when every step
// succeeded.
bool run_demo_sequence(ard8088::BusEngine &engine, std::ostream &out);

} // namespace ard8088_host
