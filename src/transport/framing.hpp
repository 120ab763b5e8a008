// src/transport/framing.hpp
#pragma once

#include <cstddef>
#include <cstdint>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

namespace fleetspeak_client
{
    namespace transport
    {

        // Terminates every frame and is the whole of the handshake record.
        constexpr uint32_t kMagic = 0xF1EE1001u;

        // Largest length the u32 prefix can describe.
        constexpr uint32_t kMaxFrameLength = 0xFFFFFFFFu;

        inline uint32_t decode_u32_le(const uint8_t b[4])
        {
            return (static_cast<uint32_t>(b[0])) |
                   (static_cast<uint32_t>(b[1]) << 8) |
                   (static_cast<uint32_t>(b[2]) << 16) |
                   (static_cast<uint32_t>(b[3]) << 24);
        }

        inline void encode_u32_le(uint32_t v, uint8_t b[4])
        {
            b[0] = static_cast<uint8_t>(v & 0xFF);
            b[1] = static_cast<uint8_t>((v >> 8) & 0xFF);
            b[2] = static_cast<uint8_t>((v >> 16) & 0xFF);
            b[3] = static_cast<uint8_t>((v >> 24) & 0xFF);
        }

        // Reads exactly n bytes into buf. Returns false on EOF or stream failure before n bytes.
        bool read_exact(std::istream &in, uint8_t *buf, size_t n);

        // Throws IoError on failure.
        void write_u32_le(std::ostream &out, uint32_t v);
        uint32_t read_u32_le(std::istream &in, const char *what);

        void write_magic(std::ostream &out);

        // Throws FramingError carrying the value read if it is not kMagic.
        void read_magic(std::istream &in);

        // Writes the magic, flushes, then expects the magic back from the peer.
        // Throws IoError if either side fails, FramingError on a mismatch.
        void handshake(std::istream &in, std::ostream &out);

        // Builds one frame (uint32_le length + payload + uint32_le magic).
        // Throws EncodeError if the payload is longer than max_len.
        std::vector<uint8_t> build_frame(const std::string &payload,
                                         uint32_t max_len = kMaxFrameLength);

        // Writes a complete frame and flushes. Throws IoError.
        void write_frame(std::ostream &out, const std::vector<uint8_t> &frame);

        // Reads one frame and returns its payload once the trailing magic has
        // been verified. Throws IoError on EOF or stream failure and
        // FramingError on a bad magic or a length above max_len.
        std::string read_frame(std::istream &in, uint32_t max_len = kMaxFrameLength);

    } // namespace transport
} // namespace fleetspeak_client
