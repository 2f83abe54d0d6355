#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "tftpkit/protocol/tftp_types.h"

namespace tftpkit::protocol {

// Stateless encode/decode of the TFTP wire packets.
//
// Encoders write into a caller-owned PacketBuffer and return the datagram
// length; 0 means the packet could not be built and nothing usable was written.
// Decoders take exactly the received bytes, never read past `length`, and
// return false for anything structurally invalid (including an opcode of the
// wrong kind).

struct RequestPacket {
    RequestType type{RequestType::Read};
    std::string filename;
    Mode        mode{Mode::Binary};
};

// Payload is a view into the decoded datagram.
struct DataPacket {
    std::uint16_t       block{0};
    const std::uint8_t* payload{nullptr};
    std::size_t         length{0};
};

struct AckPacket {
    std::uint16_t block{0};
};

struct ErrorPacket {
    ErrorCode   code{ErrorCode::Undefined};
    std::string message;
};

// Reads and validates the leading opcode.
bool peek_opcode(const std::uint8_t* data, std::size_t length, Opcode& out) noexcept;

// opcode | filename NUL | mode NUL
std::size_t encode_request(PacketBuffer& out, RequestType type, Mode mode, std::string_view filename);
bool decode_request(const std::uint8_t* data, std::size_t length, RequestPacket& out);

// opcode | block | payload
// Payload is file[(block-1)*MAX_DATA_SIZE, +min(MAX_DATA_SIZE, remaining)).
// Block 0, or a block starting beyond the end of file, cannot be encoded.
std::size_t encode_data(PacketBuffer& out, std::uint16_t block, const ByteBuffer& file);

// Byte count block `block` of a file of `fileSize` bytes carries.
std::size_t data_payload_size(std::uint16_t block, std::size_t fileSize) noexcept;

bool decode_data(const std::uint8_t* data, std::size_t length, DataPacket& out) noexcept;

// opcode | block
std::size_t encode_ack(PacketBuffer& out, std::uint16_t block) noexcept;
bool decode_ack(const std::uint8_t* data, std::size_t length, AckPacket& out) noexcept;

// opcode | code | message NUL
// The message is truncated so the datagram stays within MAX_PACKET_SIZE.
std::size_t encode_error(PacketBuffer& out, ErrorCode code, std::string_view message);
bool decode_error(const std::uint8_t* data, std::size_t length, ErrorPacket& out);

} // namespace tftpkit::protocol
