// src/transport/byte_transport.hpp
#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace transport
{

    // Raw byte channel to the bus-interface board.
    class ByteTransport
    {
    public:
        virtual ~ByteTransport() = default;

        // Writes all len bytes. Returns false on error and sets err.
        virtual bool write(const uint8_t *data, size_t len, std::string &err) = 0;

        // Blocks until n bytes arrived or timeout elapsed.
        // Returns what was received; fewer than n bytes means timeout or I/O failure.
        virtual std::vector<uint8_t> read_exact(size_t n, std::chrono::milliseconds timeout) = 0;

        // Discards any bytes received but not yet read.
        virtual void flush_input() = 0;

        virtual bool is_open() const = 0;
        virtual void close() = 0;
    };

} // namespace transport
