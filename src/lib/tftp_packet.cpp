#include "tftpkit/protocol/tftp_packet.h"

#include "tftpkit/core/logging.h"
#include "tftpkit/protocol/byte_codec.h"

#include <algorithm>

namespace tftpkit::protocol {

using bytecodec::Reader;
using bytecodec::Writer;

static constexpr const char* TAG = "codec";

namespace {

constexpr std::uint16_t wire(Opcode op) noexcept
{
    return static_cast<std::uint16_t>(op);
}

// Reads the opcode and checks it is `expected`.
bool expect_opcode(Reader& r, Opcode expected)
{
    std::uint16_t raw = 0;
    if (!r.read_u16be(raw)) return false;

    Opcode op{};
    if (!opcode_from_wire(raw, op)) {
        TFTPKIT_LOGV(TAG, "illegal opcode %u", static_cast<unsigned>(raw));
        return false;
    }
    return op == expected;
}

} // namespace

bool peek_opcode(const std::uint8_t* data, std::size_t length, Opcode& out) noexcept
{
    if (!data || length < 2) return false;
    Reader r(data, length);
    std::uint16_t raw = 0;
    return r.read_u16be(raw) && opcode_from_wire(raw, out);
}

// ---------------------------------------------------------------------------
// Request
// ---------------------------------------------------------------------------

std::size_t encode_request(PacketBuffer& out, RequestType type, Mode mode, std::string_view filename)
{
    if (!request_fits(mode, filename.size())) {
        TFTPKIT_LOGD(TAG, "%s filename of %zu bytes does not fit", to_string(type), filename.size());
        return 0;
    }

    Writer w(out.data(), out.size());
    w.write_u16be(wire(request_opcode(type)));
    w.write_cstring(filename);
    w.write_cstring(mode_string(mode));
    return w.ok() ? w.size() : 0;
}

bool decode_request(const std::uint8_t* data, std::size_t length, RequestPacket& out)
{
    if (!data || length > MAX_PACKET_SIZE) return false;

    Reader r(data, length);
    std::uint16_t raw = 0;
    Opcode op{};
    if (!r.read_u16be(raw) || !opcode_from_wire(raw, op)) return false;

    if (op != Opcode::ReadRequest && op != Opcode::WriteRequest) return false;

    std::string_view filename;
    std::string_view modeText;
    if (!r.read_cstring(filename) || !r.read_cstring(modeText)) {
        TFTPKIT_LOGV(TAG, "request strings are not terminated");
        return false;
    }

    Mode mode{};
    if (!parse_mode(modeText, mode)) {
        TFTPKIT_LOGV(TAG, "unsupported mode '%.*s'",
                     static_cast<int>(modeText.size()), modeText.data());
        return false;
    }

    out.type     = op == Opcode::ReadRequest ? RequestType::Read : RequestType::Write;
    out.filename = std::string(filename);
    out.mode     = mode;
    return true;
}

// ---------------------------------------------------------------------------
// Data
// ---------------------------------------------------------------------------

std::size_t data_payload_size(std::uint16_t block, std::size_t fileSize) noexcept
{
    if (block == 0) return 0;
    const std::size_t offset = static_cast<std::size_t>(block - 1) * MAX_DATA_SIZE;
    if (offset >= fileSize) return 0;
    return std::min(MAX_DATA_SIZE, fileSize - offset);
}

std::size_t encode_data(PacketBuffer& out, std::uint16_t block, const ByteBuffer& file)
{
    if (block == 0) return 0;

    const std::size_t offset = static_cast<std::size_t>(block - 1) * MAX_DATA_SIZE;
    if (offset > file.size()) return 0;

    const std::size_t n = data_payload_size(block, file.size());

    Writer w(out.data(), out.size());
    w.write_u16be(wire(Opcode::Data));
    w.write_u16be(block);
    w.write_bytes(file.data() + offset, n);
    return w.ok() ? w.size() : 0;
}

bool decode_data(const std::uint8_t* data, std::size_t length, DataPacket& out) noexcept
{
    if (!data || length < HEADER_SIZE || length > MAX_PACKET_SIZE) return false;

    Reader r(data, length);
    std::uint16_t block = 0;
    if (!expect_opcode(r, Opcode::Data) || !r.read_u16be(block)) return false;

    out.block   = block;
    out.length  = length - HEADER_SIZE;
    out.payload = data + HEADER_SIZE;
    return true;
}

// ---------------------------------------------------------------------------
// Acknowledgement
// ---------------------------------------------------------------------------

std::size_t encode_ack(PacketBuffer& out, std::uint16_t block) noexcept
{
    Writer w(out.data(), out.size());
    w.write_u16be(wire(Opcode::Acknowledgement));
    w.write_u16be(block);
    return w.ok() ? w.size() : 0;
}

bool decode_ack(const std::uint8_t* data, std::size_t length, AckPacket& out) noexcept
{
    if (!data || length != HEADER_SIZE) return false;

    Reader r(data, length);
    std::uint16_t block = 0;
    if (!expect_opcode(r, Opcode::Acknowledgement) || !r.read_u16be(block)) return false;

    out.block = block;
    return true;
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

std::size_t encode_error(PacketBuffer& out, ErrorCode code, std::string_view message)
{
    // Room for the message plus its terminator.
    constexpr std::size_t maxMessage = MAX_PACKET_SIZE - HEADER_SIZE - 1;
    if (message.size() > maxMessage) {
        message = message.substr(0, maxMessage);
    }

    Writer w(out.data(), out.size());
    w.write_u16be(wire(Opcode::Error));
    w.write_u16be(static_cast<std::uint16_t>(code));
    w.write_cstring(message);
    return w.ok() ? w.size() : 0;
}

bool decode_error(const std::uint8_t* data, std::size_t length, ErrorPacket& out)
{
    if (!data || length < HEADER_SIZE || length > MAX_PACKET_SIZE) return false;

    Reader r(data, length);
    std::uint16_t code = 0;
    if (!expect_opcode(r, Opcode::Error) || !r.read_u16be(code)) return false;

    // Peers that omit the terminator end the message at the datagram length.
    const std::string_view message = r.read_trailing_string();

    out.code    = error_code_from_wire(code);
    out.message = std::string(message);
    return true;
}

} // namespace tftpkit::protocol
