// src/transport/framed_stdio.hpp
#pragma once

#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace transport
{

    // Bridge messages are small; 64 KiB leaves ample room.
    constexpr uint32_t kMaxFrameBytes = 64u * 1024u;

    // Reads up to n bytes into buf and returns how many arrived before EOF.
    size_t read_up_to(std::istream &in, uint8_t *buf, size_t n);

    // Reads one frame (uint32_le length + payload).
    // Returns:
    //  - true  => out holds the payload
    //  - false => clean EOF before any header byte (err empty) or a framing/IO error (err set)
    bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err,
                    uint32_t max_len = kMaxFrameBytes);

    // Writes one frame and flushes. Returns false on error and sets err.
    bool write_frame(std::ostream &out, const std::string &payload, std::string &err,
                     uint32_t max_len = kMaxFrameBytes);

} // namespace transport
