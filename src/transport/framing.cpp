// src/transport/framing.cpp
#include "framing.hpp"

#include <algorithm>

#include "errors.hpp"
#include "fd_stream.hpp"

namespace fleetspeak_client
{
    namespace transport
    {

        bool read_exact(std::istream &in, uint8_t *buf, size_t n)
        {
            size_t got = 0;
            while (got < n)
            {
                in.read(reinterpret_cast<char *>(buf + got), static_cast<std::streamsize>(n - got));
                const std::streamsize r = in.gcount();

                if (r > 0)
                {
                    got += static_cast<size_t>(r);
                    continue;
                }

                // No bytes read: either EOF or error
                return false;
            }
            return true;
        }

        void write_u32_le(std::ostream &out, uint32_t v)
        {
            uint8_t b[4];
            encode_u32_le(v, b);

            out.write(reinterpret_cast<const char *>(b), 4);
            if (!out.good())
            {
                throw IoError("failed writing u32" + describe_errno(out));
            }
        }

        uint32_t read_u32_le(std::istream &in, const char *what)
        {
            uint8_t b[4] = {0, 0, 0, 0};
            if (!read_exact(in, b, 4))
            {
                throw IoError(std::string("unexpected EOF while reading ") + what +
                              describe_errno(in));
            }
            return decode_u32_le(b);
        }

        void write_magic(std::ostream &out)
        {
            write_u32_le(out, kMagic);
        }

        void read_magic(std::istream &in)
        {
            const uint32_t magic = read_u32_le(in, "magic");
            if (magic != kMagic)
            {
                throw FramingError(magic);
            }
        }

        void handshake(std::istream &in, std::ostream &out)
        {
            write_magic(out);
            out.flush();
            if (!out.good())
            {
                throw IoError("failed flushing handshake magic" + describe_errno(out));
            }

            read_magic(in);
        }

        std::vector<uint8_t> build_frame(const std::string &payload, uint32_t max_len)
        {
            if (payload.size() > max_len)
            {
                throw EncodeError("frame length " + std::to_string(payload.size()) +
                                  " exceeds max " + std::to_string(max_len));
            }

            std::vector<uint8_t> frame(4 + payload.size() + 4);
            encode_u32_le(static_cast<uint32_t>(payload.size()), frame.data());
            std::copy(payload.begin(), payload.end(), frame.begin() + 4);
            encode_u32_le(kMagic, frame.data() + 4 + payload.size());
            return frame;
        }

        void write_frame(std::ostream &out, const std::vector<uint8_t> &frame)
        {
            out.write(reinterpret_cast<const char *>(frame.data()), static_cast<std::streamsize>(frame.size()));
            if (!out.good())
            {
                throw IoError("failed writing frame" + describe_errno(out));
            }

            out.flush();
            if (!out.good())
            {
                throw IoError("failed flushing output" + describe_errno(out));
            }
        }

        std::string read_frame(std::istream &in, uint32_t max_len)
        {
            const uint32_t len = read_u32_le(in, "frame header");
            if (len > max_len)
            {
                throw FramingError("frame length " + std::to_string(len) +
                                   " exceeds max " + std::to_string(max_len));
            }

            std::string payload(len, '\0');
            if (len > 0 && !read_exact(in, reinterpret_cast<uint8_t *>(&payload[0]), len))
            {
                throw IoError("unexpected EOF while reading frame payload" +
                              describe_errno(in));
            }

            read_magic(in);
            return payload;
        }

    } // namespace transport
} // namespace fleetspeak_client
