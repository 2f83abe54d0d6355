#include "tftpkit/protocol/tftp_types.h"

#include <cctype>

namespace tftpkit::protocol {

bool opcode_from_wire(std::uint16_t value, Opcode& out) noexcept
{
    switch (value) {
    case 1: out = Opcode::ReadRequest;     return true;
    case 2: out = Opcode::WriteRequest;    return true;
    case 3: out = Opcode::Data;            return true;
    case 4: out = Opcode::Acknowledgement; return true;
    case 5: out = Opcode::Error;           return true;
    default:
        return false;
    }
}

ErrorCode error_code_from_wire(std::uint16_t value) noexcept
{
    switch (value) {
    case 1: return ErrorCode::FileNotFound;
    case 2: return ErrorCode::AccessViolation;
    case 3: return ErrorCode::DiskFull;
    case 4: return ErrorCode::IllegalOperation;
    case 5: return ErrorCode::UnknownTransferId;
    case 6: return ErrorCode::FileAlreadyExists;
    case 7: return ErrorCode::NoSuchUser;
    default:
        return ErrorCode::Undefined;
    }
}

std::string_view mode_string(Mode mode) noexcept
{
    return mode == Mode::Text ? TEXT_MODE : BINARY_MODE;
}

static bool iequals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size()) return false;
    for (std::size_t i = 0; i < a.size(); ++i) {
        const auto ca = static_cast<unsigned char>(a[i]);
        const auto cb = static_cast<unsigned char>(b[i]);
        if (std::toupper(ca) != std::toupper(cb)) return false;
    }
    return true;
}

bool parse_mode(std::string_view text, Mode& out) noexcept
{
    if (iequals(text, TEXT_MODE)) {
        out = Mode::Text;
        return true;
    }
    if (iequals(text, BINARY_MODE)) {
        out = Mode::Binary;
        return true;
    }
    return false;
}

const char* to_string(Opcode op) noexcept
{
    switch (op) {
    case Opcode::ReadRequest:     return "RRQ";
    case Opcode::WriteRequest:    return "WRQ";
    case Opcode::Data:            return "DATA";
    case Opcode::Acknowledgement: return "ACK";
    case Opcode::Error:           return "ERROR";
    }
    return "?";
}

const char* to_string(Mode mode) noexcept
{
    switch (mode) {
    case Mode::Text:   return "netascii";
    case Mode::Binary: return "octet";
    }
    return "?";
}

const char* to_string(RequestType type) noexcept
{
    switch (type) {
    case RequestType::Read:  return "read";
    case RequestType::Write: return "write";
    }
    return "?";
}

const char* to_string(ErrorCode code) noexcept
{
    switch (code) {
    case ErrorCode::Undefined:         return "Not defined";
    case ErrorCode::FileNotFound:      return "File not found";
    case ErrorCode::AccessViolation:   return "Access violation";
    case ErrorCode::DiskFull:          return "Disk full or allocation exceeded";
    case ErrorCode::IllegalOperation:  return "Illegal TFTP operation";
    case ErrorCode::UnknownTransferId: return "Unknown transfer ID";
    case ErrorCode::FileAlreadyExists: return "File already exists";
    case ErrorCode::NoSuchUser:        return "No such user";
    }
    return "?";
}

} // namespace tftpkit::protocol
