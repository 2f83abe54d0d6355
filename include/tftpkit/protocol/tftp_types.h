#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace tftpkit::protocol {

// RFC 1350 datagram budget.
constexpr std::size_t MAX_PACKET_SIZE = 512;

// opcode(2) + block(2) for DATA/ACK, opcode(2) + code(2) for ERROR.
constexpr std::size_t HEADER_SIZE = 4;

constexpr std::size_t MAX_DATA_SIZE = MAX_PACKET_SIZE - HEADER_SIZE;

// opcode(2) + filename NUL + mode NUL
constexpr std::size_t FIXED_REQUEST_BYTES = 4;

constexpr std::uint16_t MAX_BLOCK = 0xFFFF;

// Largest file whose blocks can be numbered with a 16-bit counter.
constexpr std::size_t MAX_FILE_SIZE = static_cast<std::size_t>(MAX_BLOCK) * MAX_DATA_SIZE;

constexpr std::string_view TEXT_MODE   = "NETASCII";
constexpr std::string_view BINARY_MODE = "OCTET";

using ByteBuffer   = std::vector<std::uint8_t>;
using PacketBuffer = std::array<std::uint8_t, MAX_PACKET_SIZE>;

enum class Opcode : std::uint16_t {
    ReadRequest     = 1,
    WriteRequest    = 2,
    Data            = 3,
    Acknowledgement = 4,
    Error           = 5,
};

// Transfer representation, carried on the wire as a case-insensitive string.
enum class Mode : std::uint8_t {
    Text,    // NETASCII
    Binary,  // OCTET
};

enum class RequestType : std::uint8_t {
    Read  = static_cast<std::uint8_t>(Opcode::ReadRequest),
    Write = static_cast<std::uint8_t>(Opcode::WriteRequest),
};

enum class ErrorCode : std::uint16_t {
    Undefined         = 0,
    FileNotFound      = 1,
    AccessViolation   = 2,
    DiskFull          = 3,
    IllegalOperation  = 4,
    UnknownTransferId = 5,
    FileAlreadyExists = 6,
    NoSuchUser        = 7,
};

// Wire value -> Opcode. Returns false for anything outside 1..5.
bool opcode_from_wire(std::uint16_t value, Opcode& out) noexcept;

// Unrecognized wire values map to ErrorCode::Undefined.
ErrorCode error_code_from_wire(std::uint16_t value) noexcept;

constexpr Opcode request_opcode(RequestType type) noexcept
{
    return type == RequestType::Read ? Opcode::ReadRequest : Opcode::WriteRequest;
}

std::string_view mode_string(Mode mode) noexcept;

// Case-insensitive match against NETASCII / OCTET.
bool parse_mode(std::string_view text, Mode& out) noexcept;

// Longest filename a request in this mode can carry.
constexpr std::size_t max_filename_size(Mode mode) noexcept
{
    return MAX_PACKET_SIZE - FIXED_REQUEST_BYTES
        - (mode == Mode::Text ? TEXT_MODE.size() : BINARY_MODE.size());
}

constexpr bool request_fits(Mode mode, std::size_t filenameSize) noexcept
{
    return filenameSize <= max_filename_size(mode);
}

const char* to_string(Opcode op) noexcept;
const char* to_string(Mode mode) noexcept;
const char* to_string(RequestType type) noexcept;
const char* to_string(ErrorCode code) noexcept;

} // namespace tftpkit::protocol
