#pragma once

#include "protocol.pb.h"
#include "protocol/bus_engine.hpp"

namespace handlers {

// Routes one bridge request to the engine and fills resp. Always sets
// resp.request_id and resp.status.
void dispatch(ard8088::BusEngine &engine,
              const ard8088::bridge::v1::Request &req,
              ard8088::bridge::v1::Response &resp);

void handle_load_registers(
    ard8088::BusEngine &engine,
    const ard8088::bridge::v1::LoadRegistersRequest &req,
    ard8088::bridge::v1::Response &resp);

void handle_write_data_bus(
    ard8088::BusEngine &engine,
    const ard8088::bridge::v1::WriteDataBusRequest &req,
    ard8088::bridge::v1::Response &resp);

void handle_queue_bytes(ard8088::BusEngine &engine,
                        const ard8088::bridge::v1::QueueBytesRequest &req,
                        ard8088::bridge::v1::Response &resp);

void handle_write_pin(ard8088::BusEngine &engine,
                      const ard8088::bridge::v1::WritePinRequest &req,
                      ard8088::bridge::v1::Response &resp);

void handle_read_pin(ard8088::BusEngine &engine,
                     const ard8088::bridge::v1::ReadPinRequest &req,
                     ard8088::bridge::v1::Response &resp);

void handle_last_error(ard8088::BusEngine &engine,
                       const ard8088::bridge::v1::LastErrorRequest &req,
                       ard8088::bridge::v1::Response &resp);

void handle_raw(ard8088::BusEngine &engine,
                const ard8088::bridge::v1::RawCommandRequest &req,
                ard8088::bridge::v1::Response &resp);

void handle_unimplemented(ard8088::bridge::v1::Response &resp);

ard8088::bridge::v1::Status::Code to_status_code(ard8088::ErrorCode code);

} // namespace handlers
