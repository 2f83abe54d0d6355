#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "doctest.h"

#include "tftpkit/engine/transfer_engine.h"
#include "tftpkit/protocol/tftp_packet.h"
#include "tftpkit/protocol/tftp_types.h"

namespace tftpkit::tests {

using tftpkit::engine::Role;
using tftpkit::engine::TransferEngine;
using tftpkit::engine::TransferError;
using tftpkit::engine::TransferResult;
using tftpkit::protocol::ByteBuffer;
using tftpkit::protocol::ErrorCode;
using tftpkit::protocol::MAX_DATA_SIZE;
using tftpkit::protocol::MAX_PACKET_SIZE;
using tftpkit::protocol::Mode;
using tftpkit::protocol::PacketBuffer;

inline ByteBuffer to_vec(const std::string& s)
{
    return ByteBuffer(s.begin(), s.end());
}

inline ByteBuffer pattern_file(std::size_t size)
{
    ByteBuffer file(size);
    for (std::size_t i = 0; i < size; ++i) {
        file[i] = static_cast<std::uint8_t>((i * 7 + 3) & 0xFF);
    }
    return file;
}

// Raw datagrams built by hand so the engine is tested against the wire
// layout, not against its own encoder.
inline ByteBuffer ack_datagram(std::uint16_t block)
{
    return ByteBuffer{0, 4, static_cast<std::uint8_t>(block >> 8), static_cast<std::uint8_t>(block & 0xFF)};
}

inline ByteBuffer data_datagram(std::uint16_t block, const ByteBuffer& payload)
{
    ByteBuffer d{0, 3, static_cast<std::uint8_t>(block >> 8), static_cast<std::uint8_t>(block & 0xFF)};
    d.insert(d.end(), payload.begin(), payload.end());
    return d;
}

inline ByteBuffer error_datagram(std::uint16_t code, const std::string& msg, bool terminate = true)
{
    ByteBuffer d{0, 5, static_cast<std::uint8_t>(code >> 8), static_cast<std::uint8_t>(code & 0xFF)};
    d.insert(d.end(), msg.begin(), msg.end());
    if (terminate) d.push_back(0);
    return d;
}

inline ByteBuffer request_datagram(std::uint8_t opcode, const std::string& filename, const std::string& mode)
{
    ByteBuffer d{0, opcode};
    d.insert(d.end(), filename.begin(), filename.end());
    d.push_back(0);
    d.insert(d.end(), mode.begin(), mode.end());
    d.push_back(0);
    return d;
}

inline ByteBuffer sent(const PacketBuffer& out, const TransferResult& res)
{
    return ByteBuffer(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(res.length));
}

inline TransferResult feed(TransferEngine& engine, const ByteBuffer& datagram, PacketBuffer& out)
{
    return engine.process(datagram.data(), datagram.size(), out);
}

} // namespace tftpkit::tests
