#pragma once

#include <cstdint>
#include <cstddef>
#include <cstring>
#include <string_view>

namespace tftpkit::protocol::bytecodec {

// Bounds-checked reader over a received datagram.
// TFTP integers are big-endian (network order).
class Reader {
public:
    Reader(const std::uint8_t* data, std::size_t size)
        : _begin(data), _p(data), _end(data + size) {}

    bool read_u16be(std::uint16_t& out) {
        if (remaining() < 2) return false;
        out = static_cast<std::uint16_t>((_p[0] << 8) | _p[1]);
        _p += 2;
        return true;
    }

    bool read_bytes(const std::uint8_t*& ptr, std::size_t n) {
        if (remaining() < n) return false;
        ptr = _p;
        _p += n;
        return true;
    }

    // NUL-terminated ASCII string; the view excludes the terminator,
    // the cursor is left just past it. Fails if no NUL before the end.
    bool read_cstring(std::string_view& out) {
        if (remaining() == 0) return false;
        const void* nul = std::memchr(_p, 0, remaining());
        if (!nul) return false;
        const auto* stop = static_cast<const std::uint8_t*>(nul);
        out = std::string_view(reinterpret_cast<const char*>(_p),
                               static_cast<std::size_t>(stop - _p));
        _p = stop + 1;
        return true;
    }

    // Everything left, up to the first NUL if there is one.
    std::string_view read_trailing_string() {
        if (remaining() == 0) return {};
        const void* nul = std::memchr(_p, 0, remaining());
        const auto* stop = nul ? static_cast<const std::uint8_t*>(nul) : _end;
        std::string_view out(reinterpret_cast<const char*>(_p),
                             static_cast<std::size_t>(stop - _p));
        _p = _end;
        return out;
    }

    std::size_t remaining() const { return (std::size_t)(_end - _p); }
    std::size_t pos() const { return (std::size_t)(_p - _begin); }

private:
    const std::uint8_t* _begin{};
    const std::uint8_t* _p{};
    const std::uint8_t* _end{};
};

// Bounds-checked writer into a fixed-capacity datagram buffer.
// Once a write does not fit, the writer stays failed and writes nothing more.
class Writer {
public:
    Writer(std::uint8_t* data, std::size_t capacity)
        : _begin(data), _p(data), _end(data + capacity) {}

    bool write_u16be(std::uint16_t v) {
        if (!_ok || remaining() < 2) return fail();
        *_p++ = static_cast<std::uint8_t>((v >> 8) & 0xFF);
        *_p++ = static_cast<std::uint8_t>(v & 0xFF);
        return true;
    }

    bool write_bytes(const void* data, std::size_t n) {
        if (!_ok || remaining() < n) return fail();
        if (n) std::memcpy(_p, data, n);
        _p += n;
        return true;
    }

    bool write_cstring(std::string_view s) {
        if (!_ok || remaining() < s.size() + 1) return fail();
        write_bytes(s.data(), s.size());
        *_p++ = 0;
        return true;
    }

    std::size_t remaining() const { return (std::size_t)(_end - _p); }
    std::size_t size() const { return (std::size_t)(_p - _begin); }
    bool ok() const { return _ok; }

private:
    bool fail() { _ok = false; return false; }

    std::uint8_t* _begin{};
    std::uint8_t* _p{};
    std::uint8_t* _end{};
    bool _ok{true};
};

} // namespace tftpkit::protocol::bytecodec
