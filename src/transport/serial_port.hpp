// src/transport/serial_port.hpp
#pragma once

#include <cstdint>
#include <string>

#include "byte_transport.hpp"

namespace transport
{

    // Raw 8N1 tty without flow control.
    class SerialPort : public ByteTransport
    {
    public:
        // Opens and configures the device. Throws std::runtime_error on failure.
        SerialPort(const std::string &device, uint32_t baud_rate);
        ~SerialPort() override;

        SerialPort(const SerialPort &) = delete;
        SerialPort &operator=(const SerialPort &) = delete;

        bool write(const uint8_t *data, size_t len, std::string &err) override;
        std::vector<uint8_t> read_exact(size_t n, std::chrono::milliseconds timeout) override;
        void flush_input() override;

        bool is_open() const override { return fd_ >= 0; }
        void close() override;

        const std::string &device() const { return device_; }

    private:
        std::string device_;
        int fd_ = -1;
    };

    // True when baud_rate maps to a termios speed constant.
    bool is_supported_baud_rate(uint32_t baud_rate);

} // namespace transport
