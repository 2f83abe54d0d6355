#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "tftpkit/config/engine_config.h"
#include "tftpkit/engine/transfer_types.h"
#include "tftpkit/protocol/tftp_types.h"

namespace tftpkit::engine {

// Single-transfer TFTP state machine.
//
// Synchronous and network-agnostic: the caller receives datagrams, hands them
// to the engine, and transmits whatever the engine writes into the outbound
// buffer. Timing and retries are the caller's; resend_last() hands back the
// previous datagram when retainLastPacket is enabled.
//
// The file buffer passed to initiate_*/reply_* is borrowed, not owned. It must
// outlive the transfer and must not be touched by the caller until the engine
// is Idle again. The engine drops the reference whenever it returns to Idle.
//
// Not thread-safe; one engine per peer.
class TransferEngine {
public:
    explicit TransferEngine(TransferId id, config::EngineConfig cfg = {});

    // Send a WRQ for `filename` and serve `file` once the peer ACKs block 0.
    TransferResult initiate_write(std::string_view filename,
                                  const protocol::ByteBuffer& file,
                                  protocol::PacketBuffer& out);

    // Send an RRQ for `filename`; received data is appended to `file`.
    TransferResult initiate_read(std::string_view filename,
                                 protocol::ByteBuffer& file,
                                 protocol::PacketBuffer& out);

    // Parse an inbound RRQ/WRQ while Idle. The local role is the inverse of
    // the peer's request. Follow up with reply_as_writer/reply_as_reader.
    ListenResult listen_for_request(const std::uint8_t* data, std::size_t length);

    // Answer a peer RRQ: attach `file` and send DATA block 1.
    TransferResult reply_as_writer(const protocol::ByteBuffer& file, protocol::PacketBuffer& out);

    // Answer a peer WRQ: attach `file` and send ACK 0.
    TransferResult reply_as_reader(protocol::ByteBuffer& file, protocol::PacketBuffer& out);

    // Per-datagram step while a transfer is active.
    TransferResult process(const std::uint8_t* data, std::size_t length, protocol::PacketBuffer& out);

    // Send ERROR(code, message) and return to Idle. Valid in any state.
    TransferResult abort(protocol::ErrorCode code, std::string_view message, protocol::PacketBuffer& out);

    // Copy the last datagram of the current (or just completed) transfer
    // into `out`.
    TransferResult resend_last(protocol::PacketBuffer& out) const;

    // Return to Idle, release the file buffer and drop the resend cache.
    void reset();

    TransferError set_mode(protocol::Mode mode);

    protocol::Mode mode() const { return _mode; }
    Role role() const { return _role; }
    bool is_busy() const { return _role != Role::Idle; }
    bool has_file() const { return _outgoing != nullptr || _incoming != nullptr; }
    std::uint16_t expected_block() const { return _block; }
    std::uint64_t bytes_transferred() const { return _bytes; }
    TransferId transfer_id() const { return _id; }
    const config::EngineConfig& config() const { return _cfg; }

    // Set when the peer ends a transfer with ERROR; cleared when the next
    // transfer starts.
    const std::optional<PeerError>& last_peer_error() const { return _peerError; }

private:
    void begin(Role role, std::uint16_t expectedBlock);

    // Back to Idle after a completed transfer; keeps the last datagram.
    void finish();

    TransferResult emit(protocol::PacketBuffer& out, std::size_t length);
    TransferResult fail_transfer(protocol::ErrorCode code, std::string_view message,
                                 protocol::PacketBuffer& out);

    TransferResult send_block(protocol::PacketBuffer& out);
    TransferResult send_ack(std::uint16_t block, protocol::PacketBuffer& out);

    TransferResult handle_ack(const std::uint8_t* data, std::size_t length, protocol::PacketBuffer& out);
    TransferResult handle_data(const std::uint8_t* data, std::size_t length, protocol::PacketBuffer& out);
    TransferResult handle_error(const std::uint8_t* data, std::size_t length);

    const TransferId     _id;
    config::EngineConfig _cfg;

    Role           _role{Role::Idle};
    protocol::Mode _mode{protocol::Mode::Binary};
    std::uint16_t  _block{0};
    std::uint64_t  _bytes{0};

    // Payload size of the last DATA block sent (writer only).
    std::size_t _lastPayload{protocol::MAX_DATA_SIZE};

    const protocol::ByteBuffer* _outgoing{nullptr};
    protocol::ByteBuffer*       _incoming{nullptr};

    protocol::PacketBuffer _lastTx{};
    std::size_t            _lastTxLength{0};

    std::optional<PeerError> _peerError;
};

} // namespace tftpkit::engine
