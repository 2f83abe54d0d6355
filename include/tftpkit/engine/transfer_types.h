#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "tftpkit/protocol/tftp_types.h"

namespace tftpkit::engine {

// Caller-assigned label for one engine (e.g. the local UDP port).
using TransferId = std::uint16_t;

// Local perspective: a Reader receives DATA and sends ACK,
// a Writer sends DATA and receives ACK.
enum class Role : std::uint8_t {
    Idle = 0,
    Reader,
    Writer,
};

enum class TransferError : std::uint8_t {
    None = 0,
    BadRequestAttempted,  // oversized filename or file, nothing sent
    BadPacketReceived,    // inbound datagram rejected, state unchanged
    Busy,                 // needs Idle, or a request arrived mid-transfer
    NoConnection,         // needs an active transfer in the right role
    NoFile,               // no file attached yet
    ErrorResponse,        // peer sent ERROR; see last_peer_error()
    Terminated,           // engine ended the transfer itself
};

struct PeerError {
    protocol::ErrorCode code{protocol::ErrorCode::Undefined};
    std::string         message;
};

// `length` is the number of bytes written to the outbound buffer that must be
// transmitted, whatever `error` says.
struct TransferResult {
    TransferError error{TransferError::None};
    std::size_t   length{0};

    bool ok() const noexcept { return error == TransferError::None; }
};

struct ListenResult {
    TransferError error{TransferError::None};
    std::string   filename;

    bool ok() const noexcept { return error == TransferError::None; }
};

const char* to_string(Role role) noexcept;
const char* to_string(TransferError error) noexcept;

} // namespace tftpkit::engine
