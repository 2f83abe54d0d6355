#include "tftpkit/engine/transfer_engine.h"

#include "tftpkit/core/logging.h"
#include "tftpkit/protocol/tftp_packet.h"

#include <algorithm>

namespace tftpkit::engine {

using protocol::ByteBuffer;
using protocol::ErrorCode;
using protocol::MAX_BLOCK;
using protocol::MAX_DATA_SIZE;
using protocol::MAX_FILE_SIZE;
using protocol::MAX_PACKET_SIZE;
using protocol::Opcode;
using protocol::PacketBuffer;
using protocol::RequestType;

static constexpr const char* TAG = "engine";

const char* to_string(Role role) noexcept
{
    switch (role) {
    case Role::Idle:   return "idle";
    case Role::Reader: return "reader";
    case Role::Writer: return "writer";
    }
    return "?";
}

const char* to_string(TransferError error) noexcept
{
    switch (error) {
    case TransferError::None:                return "ok";
    case TransferError::BadRequestAttempted: return "request is badly formed";
    case TransferError::BadPacketReceived:   return "packet received failed to parse";
    case TransferError::Busy:                return "transfer already active";
    case TransferError::NoConnection:        return "no active transfer";
    case TransferError::NoFile:              return "no file attached";
    case TransferError::ErrorResponse:       return "peer sent error";
    case TransferError::Terminated:          return "transfer terminated";
    }
    return "?";
}

TransferEngine::TransferEngine(TransferId id, config::EngineConfig cfg)
    : _id(id)
    , _cfg(std::move(cfg))
    , _mode(_cfg.defaultMode)
{
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

void TransferEngine::begin(Role role, std::uint16_t expectedBlock)
{
    _role         = role;
    _block        = expectedBlock;
    _bytes        = 0;
    _lastPayload  = MAX_DATA_SIZE;
    _lastTxLength = 0;
    _outgoing     = nullptr;
    _incoming     = nullptr;
    _peerError.reset();
}

void TransferEngine::finish()
{
    _role     = Role::Idle;
    _block    = 0;
    _outgoing = nullptr;
    _incoming = nullptr;
}

void TransferEngine::reset()
{
    finish();
    _lastTxLength = 0;
}

TransferError TransferEngine::set_mode(protocol::Mode mode)
{
    if (is_busy()) {
        return TransferError::Busy;
    }
    _mode = mode;
    return TransferError::None;
}

TransferResult TransferEngine::emit(PacketBuffer& out, std::size_t length)
{
    if (_cfg.retainLastPacket && length > 0) {
        std::copy_n(out.begin(), length, _lastTx.begin());
        _lastTxLength = length;
    }
    return TransferResult{TransferError::None, length};
}

TransferResult TransferEngine::fail_transfer(ErrorCode code, std::string_view message, PacketBuffer& out)
{
    const std::size_t n = protocol::encode_error(out, code, message);
    TFTPKIT_LOGI(TAG, "[%u] terminating transfer: %s", _id, protocol::to_string(code));
    reset();
    return TransferResult{TransferError::Terminated, n};
}

// ---------------------------------------------------------------------------
// Locally initiated transfers
// ---------------------------------------------------------------------------

TransferResult TransferEngine::initiate_write(std::string_view filename,
                                              const ByteBuffer& file,
                                              PacketBuffer& out)
{
    if (is_busy()) {
        return TransferResult{TransferError::Busy, 0};
    }
    // Block numbers are 16 bits.
    if (file.size() > MAX_FILE_SIZE) {
        TFTPKIT_LOGW(TAG, "[%u] file of %zu bytes is too large to send", _id, file.size());
        return TransferResult{TransferError::BadRequestAttempted, 0};
    }

    const std::size_t n = protocol::encode_request(out, RequestType::Write, _mode, filename);
    if (n == 0) {
        return TransferResult{TransferError::BadRequestAttempted, 0};
    }

    // The first ACK expected is block 0, for the request itself.
    begin(Role::Writer, 0);
    _outgoing = &file;

    TFTPKIT_LOGI(TAG, "[%u] WRQ '%.*s' (%s, %zu bytes)", _id,
                 static_cast<int>(filename.size()), filename.data(),
                 protocol::to_string(_mode), file.size());
    return emit(out, n);
}

TransferResult TransferEngine::initiate_read(std::string_view filename,
                                             ByteBuffer& file,
                                             PacketBuffer& out)
{
    if (is_busy()) {
        return TransferResult{TransferError::Busy, 0};
    }
    if (file.size() > MAX_FILE_SIZE) {
        return TransferResult{TransferError::BadRequestAttempted, 0};
    }

    const std::size_t n = protocol::encode_request(out, RequestType::Read, _mode, filename);
    if (n == 0) {
        return TransferResult{TransferError::BadRequestAttempted, 0};
    }

    begin(Role::Reader, 1);
    _incoming = &file;

    TFTPKIT_LOGI(TAG, "[%u] RRQ '%.*s' (%s)", _id,
                 static_cast<int>(filename.size()), filename.data(),
                 protocol::to_string(_mode));
    return emit(out, n);
}

// ---------------------------------------------------------------------------
// Peer initiated transfers
// ---------------------------------------------------------------------------

ListenResult TransferEngine::listen_for_request(const std::uint8_t* data, std::size_t length)
{
    ListenResult res;

    if (is_busy()) {
        res.error = TransferError::Busy;
        return res;
    }

    Opcode op{};
    if (!protocol::peek_opcode(data, length, op)) {
        res.error = TransferError::BadPacketReceived;
        return res;
    }
    if (op != Opcode::ReadRequest && op != Opcode::WriteRequest) {
        // Transfer traffic or an error with nothing pending.
        TFTPKIT_LOGD(TAG, "[%u] %s received while idle", _id, protocol::to_string(op));
        res.error = TransferError::NoConnection;
        return res;
    }

    protocol::RequestPacket req;
    if (!protocol::decode_request(data, length, req)) {
        TFTPKIT_LOGW(TAG, "[%u] malformed %s", _id, protocol::to_string(op));
        res.error = TransferError::BadPacketReceived;
        return res;
    }

    // The peer's write is our read and vice versa.
    begin(req.type == RequestType::Write ? Role::Reader : Role::Writer, 0);
    _mode = req.mode;

    TFTPKIT_LOGI(TAG, "[%u] %s '%s' (%s), local role %s", _id,
                 protocol::to_string(op), req.filename.c_str(),
                 protocol::to_string(_mode), to_string(_role));

    res.filename = std::move(req.filename);
    return res;
}

TransferResult TransferEngine::reply_as_writer(const ByteBuffer& file, PacketBuffer& out)
{
    if (_role != Role::Writer) {
        return TransferResult{TransferError::NoConnection, 0};
    }
    if (has_file()) {
        return TransferResult{TransferError::Busy, 0};
    }
    if (file.size() > MAX_FILE_SIZE) {
        return fail_transfer(ErrorCode::Undefined, "File too large", out);
    }

    _outgoing = &file;
    _block    = 1;
    return send_block(out);
}

TransferResult TransferEngine::reply_as_reader(ByteBuffer& file, PacketBuffer& out)
{
    if (_role != Role::Reader) {
        return TransferResult{TransferError::NoConnection, 0};
    }
    if (has_file()) {
        return TransferResult{TransferError::Busy, 0};
    }

    _incoming = &file;
    _block    = 0;
    auto res  = send_ack(_block, out);

    // ACK 0 invites DATA block 1.
    _block = 1;
    return res;
}

// ---------------------------------------------------------------------------
// Transfer traffic
// ---------------------------------------------------------------------------

TransferResult TransferEngine::process(const std::uint8_t* data, std::size_t length, PacketBuffer& out)
{
    if (!is_busy()) {
        return TransferResult{TransferError::NoConnection, 0};
    }

    if (length > MAX_PACKET_SIZE) {
        TFTPKIT_LOGW(TAG, "[%u] oversized datagram (%zu bytes)", _id, length);
        return fail_transfer(ErrorCode::IllegalOperation, protocol::to_string(ErrorCode::IllegalOperation), out);
    }

    Opcode op{};
    if (!protocol::peek_opcode(data, length, op)) {
        TFTPKIT_LOGW(TAG, "[%u] datagram with illegal opcode dropped", _id);
        return TransferResult{TransferError::BadPacketReceived, 0};
    }

    switch (op) {
    case Opcode::Error:
        return handle_error(data, length);

    case Opcode::ReadRequest:
    case Opcode::WriteRequest:
        TFTPKIT_LOGW(TAG, "[%u] %s received mid-transfer", _id, protocol::to_string(op));
        return TransferResult{TransferError::Busy, 0};

    case Opcode::Acknowledgement:
        if (_role != Role::Writer) {
            return TransferResult{TransferError::BadPacketReceived, 0};
        }
        if (!_outgoing) {
            return TransferResult{TransferError::NoFile, 0};
        }
        return handle_ack(data, length, out);

    case Opcode::Data:
        if (_role != Role::Reader) {
            return TransferResult{TransferError::BadPacketReceived, 0};
        }
        if (!_incoming) {
            return TransferResult{TransferError::NoFile, 0};
        }
        return handle_data(data, length, out);
    }

    return TransferResult{TransferError::BadPacketReceived, 0};
}

TransferResult TransferEngine::abort(ErrorCode code, std::string_view message, PacketBuffer& out)
{
    if (message.empty()) {
        message = _cfg.defaultErrorMessage;
    }

    const std::size_t n = protocol::encode_error(out, code, message);
    if (is_busy()) {
        TFTPKIT_LOGI(TAG, "[%u] aborted: %s", _id, protocol::to_string(code));
    }
    reset();
    return TransferResult{TransferError::None, n};
}

TransferResult TransferEngine::resend_last(PacketBuffer& out) const
{
    if (_lastTxLength == 0) {
        return TransferResult{TransferError::NoConnection, 0};
    }
    std::copy_n(_lastTx.begin(), _lastTxLength, out.begin());
    return TransferResult{TransferError::None, _lastTxLength};
}

// ---------------------------------------------------------------------------
// Writer side
// ---------------------------------------------------------------------------

TransferResult TransferEngine::send_block(PacketBuffer& out)
{
    const std::size_t n = protocol::encode_data(out, _block, *_outgoing);
    if (n == 0) {
        // Block starts past the end of the file.
        reset();
        return TransferResult{TransferError::Terminated, 0};
    }

    _lastPayload = n - protocol::HEADER_SIZE;
    _bytes += _lastPayload;

    TFTPKIT_LOGV(TAG, "[%u] DATA #%u (%zu bytes)", _id, _block, _lastPayload);
    return emit(out, n);
}

TransferResult TransferEngine::handle_ack(const std::uint8_t* data, std::size_t length, PacketBuffer& out)
{
    protocol::AckPacket ack;
    if (!protocol::decode_ack(data, length, ack)) {
        return TransferResult{TransferError::BadPacketReceived, 0};
    }
    if (ack.block != _block) {
        TFTPKIT_LOGW(TAG, "[%u] ACK #%u while expecting #%u", _id, ack.block, _block);
        return TransferResult{TransferError::BadPacketReceived, 0};
    }

    // A short block has been acknowledged: all data delivered.
    if (_block != 0 && _lastPayload < MAX_DATA_SIZE) {
        TFTPKIT_LOGI(TAG, "[%u] write complete, %llu bytes", _id,
                     static_cast<unsigned long long>(_bytes));
        finish();
        return TransferResult{TransferError::None, 0};
    }

    // Never reuse a block number.
    if (_block == MAX_BLOCK) {
        TFTPKIT_LOGW(TAG, "[%u] block counter exhausted, stopping", _id);
        reset();
        return TransferResult{TransferError::Terminated, 0};
    }

    ++_block;
    return send_block(out);
}

// ---------------------------------------------------------------------------
// Reader side
// ---------------------------------------------------------------------------

TransferResult TransferEngine::send_ack(std::uint16_t block, PacketBuffer& out)
{
    const std::size_t n = protocol::encode_ack(out, block);
    TFTPKIT_LOGV(TAG, "[%u] ACK #%u", _id, block);
    return emit(out, n);
}

TransferResult TransferEngine::handle_data(const std::uint8_t* data, std::size_t length, PacketBuffer& out)
{
    protocol::DataPacket pkt;
    if (!protocol::decode_data(data, length, pkt)) {
        return TransferResult{TransferError::BadPacketReceived, 0};
    }
    if (pkt.block != _block) {
        TFTPKIT_LOGW(TAG, "[%u] DATA #%u while expecting #%u", _id, pkt.block, _block);
        return TransferResult{TransferError::BadPacketReceived, 0};
    }

    if (_cfg.maxReceiveBytes != 0 && _bytes + pkt.length > _cfg.maxReceiveBytes) {
        TFTPKIT_LOGW(TAG, "[%u] max receive size %llu exceeded", _id,
                     static_cast<unsigned long long>(_cfg.maxReceiveBytes));
        return fail_transfer(ErrorCode::DiskFull, protocol::to_string(ErrorCode::DiskFull), out);
    }

    _incoming->insert(_incoming->end(), pkt.payload, pkt.payload + pkt.length);
    _bytes += pkt.length;

    auto res = send_ack(pkt.block, out);

    if (pkt.length < MAX_DATA_SIZE || _block == MAX_BLOCK) {
        TFTPKIT_LOGI(TAG, "[%u] read complete, %llu bytes", _id,
                     static_cast<unsigned long long>(_bytes));
        // The final ACK stays available to resend_last().
        finish();
    } else {
        ++_block;
    }
    return res;
}

// ---------------------------------------------------------------------------
// Peer errors
// ---------------------------------------------------------------------------

TransferResult TransferEngine::handle_error(const std::uint8_t* data, std::size_t length)
{
    protocol::ErrorPacket err;
    if (!protocol::decode_error(data, length, err)) {
        // Still an ERROR opcode; end the transfer regardless.
        err = protocol::ErrorPacket{};
    }

    TFTPKIT_LOGI(TAG, "[%u] peer error %u: %s", _id,
                 static_cast<unsigned>(err.code), err.message.c_str());

    // Never answer an ERROR with an ERROR.
    reset();
    _peerError = PeerError{err.code, std::move(err.message)};
    return TransferResult{TransferError::ErrorResponse, 0};
}

} // namespace tftpkit::engine
