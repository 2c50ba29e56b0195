// src/transport/serial_port.cpp
#include "serial_port.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <stdexcept>

#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace transport
{

    static bool baud_to_speed(uint32_t baud_rate, speed_t &out)
    {
        switch (baud_rate)
        {
        case 9600:
            out = B9600;
            return true;
        case 19200:
            out = B19200;
            return true;
        case 38400:
            out = B38400;
            return true;
        case 57600:
            out = B57600;
            return true;
        case 115200:
            out = B115200;
            return true;
        case 230400:
            out = B230400;
            return true;
#ifdef B460800
        case 460800:
            out = B460800;
            return true;
#endif
#ifdef B500000
        case 500000:
            out = B500000;
            return true;
#endif
#ifdef B921600
        case 921600:
            out = B921600;
            return true;
#endif
#ifdef B1000000
        case 1000000:
            out = B1000000;
            return true;
#endif
#ifdef B2000000
        case 2000000:
            out = B2000000;
            return true;
#endif
#ifdef B4000000
        case 4000000:
            out = B4000000;
            return true;
#endif
        default:
            return false;
        }
    }

    bool is_supported_baud_rate(uint32_t baud_rate)
    {
        speed_t unused;
        return baud_to_speed(baud_rate, unused);
    }

    SerialPort::SerialPort(const std::string &device, uint32_t baud_rate)
        : device_(device)
    {
        speed_t speed;
        if (!baud_to_speed(baud_rate, speed))
        {
            throw std::runtime_error("unsupported baud rate: " + std::to_string(baud_rate));
        }

        fd_ = ::open(device.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC);
        if (fd_ < 0)
        {
            throw std::runtime_error("failed to open " + device + ": " + std::strerror(errno));
        }

        termios tty{};
        if (tcgetattr(fd_, &tty) != 0)
        {
            const std::string reason = std::strerror(errno);
            close();
            throw std::runtime_error("tcgetattr failed on " + device + ": " + reason);
        }

        cfmakeraw(&tty);
        tty.c_cflag |= (CLOCAL | CREAD);
        tty.c_cflag &= ~(PARENB | CSTOPB | CRTSCTS | CSIZE);
        tty.c_cflag |= CS8;
        tty.c_iflag &= ~(IXON | IXOFF | IXANY);

        // Reads are driven by poll(); never block inside read().
        tty.c_cc[VMIN] = 0;
        tty.c_cc[VTIME] = 0;

        cfsetispeed(&tty, speed);
        cfsetospeed(&tty, speed);

        if (tcsetattr(fd_, TCSANOW, &tty) != 0)
        {
            const std::string reason = std::strerror(errno);
            close();
            throw std::runtime_error("tcsetattr failed on " + device + ": " + reason);
        }

        tcflush(fd_, TCIOFLUSH);
    }

    SerialPort::~SerialPort() { close(); }

    void SerialPort::close()
    {
        if (fd_ >= 0)
        {
            ::close(fd_);
            fd_ = -1;
        }
    }

    bool SerialPort::write(const uint8_t *data, size_t len, std::string &err)
    {
        err.clear();

        if (fd_ < 0)
        {
            err = "serial port is closed";
            return false;
        }

        size_t sent = 0;
        while (sent < len)
        {
            const ssize_t w = ::write(fd_, data + sent, len - sent);
            if (w < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                err = std::string("write failed: ") + std::strerror(errno);
                return false;
            }
            sent += static_cast<size_t>(w);
        }

        if (tcdrain(fd_) != 0)
        {
            err = std::string("tcdrain failed: ") + std::strerror(errno);
            return false;
        }
        return true;
    }

    std::vector<uint8_t> SerialPort::read_exact(size_t n, std::chrono::milliseconds timeout)
    {
        std::vector<uint8_t> out;
        out.reserve(n);

        if (fd_ < 0)
        {
            return out;
        }

        const auto deadline = std::chrono::steady_clock::now() + timeout;
        uint8_t buf[64];

        while (out.size() < n)
        {
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline)
            {
                break;
            }
            const auto remaining =
                std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);

            pollfd pfd{};
            pfd.fd = fd_;
            pfd.events = POLLIN;
            const int pr = ::poll(&pfd, 1, static_cast<int>(remaining.count()) + 1);
            if (pr < 0)
            {
                if (errno == EINTR)
                    continue;
                std::cerr << "[SerialPort] poll failed on " << device_ << ": "
                          << std::strerror(errno) << "\n";
                break;
            }
            if (pr == 0)
            {
                break;
            }
            if (pfd.revents & (POLLERR | POLLHUP | POLLNVAL))
            {
                std::cerr << "[SerialPort] device error on " << device_ << "\n";
                break;
            }

            const size_t want = std::min(sizeof(buf), n - out.size());
            const ssize_t r = ::read(fd_, buf, want);
            if (r < 0)
            {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                std::cerr << "[SerialPort] read failed on " << device_ << ": "
                          << std::strerror(errno) << "\n";
                break;
            }
            out.insert(out.end(), buf, buf + r);
        }

        return out;
    }

    void SerialPort::flush_input()
    {
        if (fd_ >= 0)
        {
            tcflush(fd_, TCIFLUSH);
        }
    }

} // namespace transport
