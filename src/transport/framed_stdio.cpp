// src/transport/framed_stdio.cpp
#include "framed_stdio.hpp"

namespace transport
{

    static constexpr size_t kHeaderBytes = 4;

    static inline uint32_t header_length(const uint8_t h[kHeaderBytes])
    {
        uint32_t len = 0;
        for (size_t i = 0; i < kHeaderBytes; ++i)
        {
            len |= static_cast<uint32_t>(h[i]) << (8 * i);
        }
        return len;
    }

    size_t read_up_to(std::istream &in, uint8_t *buf, size_t n)
    {
        size_t got = 0;
        while (got < n && in.good())
        {
            in.read(reinterpret_cast<char *>(buf + got), static_cast<std::streamsize>(n - got));
            const std::streamsize r = in.gcount();
            if (r <= 0)
            {
                break;
            }
            got += static_cast<size_t>(r);
        }
        return got;
    }

    bool read_frame(std::istream &in, std::vector<uint8_t> &out, std::string &err, uint32_t max_len)
    {
        err.clear();
        out.clear();

        uint8_t hdr[kHeaderBytes] = {0, 0, 0, 0};
        const size_t hdr_got = read_up_to(in, hdr, kHeaderBytes);
        if (hdr_got == 0)
        {
            return false;
        }
        if (hdr_got < kHeaderBytes)
        {
            err = "truncated frame header (" + std::to_string(hdr_got) + " of 4 bytes)";
            return false;
        }

        const uint32_t len = header_length(hdr);
        if (len > max_len)
        {
            err = "frame length " + std::to_string(len) + " exceeds max " + std::to_string(max_len);
            return false;
        }

        // Zero-length frames are legal: an all-default protobuf message serializes to nothing.
        out.resize(len);
        if (len > 0 && read_up_to(in, out.data(), len) < len)
        {
            err = "truncated frame payload";
            return false;
        }

        return true;
    }

    bool write_frame(std::ostream &out, const std::string &payload, std::string &err, uint32_t max_len)
    {
        err.clear();

        if (payload.size() > max_len)
        {
            err = "frame length " + std::to_string(payload.size()) + " exceeds max " + std::to_string(max_len);
            return false;
        }

        const uint32_t len = static_cast<uint32_t>(payload.size());
        char hdr[kHeaderBytes];
        for (size_t i = 0; i < kHeaderBytes; ++i)
        {
            hdr[i] = static_cast<char>((len >> (8 * i)) & 0xFF);
        }

        out.write(hdr, kHeaderBytes);
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();
        if (!out.good())
        {
            err = "failed writing frame";
            return false;
        }

        return true;
    }

} // namespace transport
