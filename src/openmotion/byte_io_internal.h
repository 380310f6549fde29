#pragma once

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

// Bounds-checked fixed-width readers and appenders shared by the box, sample
// table and telemetry codecs. Readers return false instead of reading past
// the end of \p bytes.

namespace openmotion {

static constexpr uint8_t
u8(std::byte b) noexcept
{
    return static_cast<uint8_t>(b);
}


inline bool
read_u8(std::span<const std::byte> bytes, uint64_t offset,
        uint8_t* out) noexcept
{
    if (!out || offset >= bytes.size()) {
        return false;
    }
    *out = u8(bytes[offset]);
    return true;
}


inline bool
read_u16be(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!out || offset + 2 > bytes.size()) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 8)
                                 | (u8(bytes[offset + 1]) << 0));
    return true;
}


inline bool
read_u24be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!out || offset + 3 > bytes.size()) {
        return false;
    }
    *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 16)
           | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
           | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 0);
    return true;
}


inline bool
read_u32be(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!out || offset + 4 > bytes.size()) {
        return false;
    }
    uint32_t v = 0;
    v |= static_cast<uint32_t>(u8(bytes[offset + 0])) << 24;
    v |= static_cast<uint32_t>(u8(bytes[offset + 1])) << 16;
    v |= static_cast<uint32_t>(u8(bytes[offset + 2])) << 8;
    v |= static_cast<uint32_t>(u8(bytes[offset + 3])) << 0;
    *out = v;
    return true;
}


inline bool
read_u64be(std::span<const std::byte> bytes, uint64_t offset,
           uint64_t* out) noexcept
{
    if (!out || offset + 8 > bytes.size()) {
        return false;
    }
    uint64_t v = 0;
    for (uint32_t i = 0; i < 8; ++i) {
        v = (v << 8) | static_cast<uint64_t>(u8(bytes[offset + i]));
    }
    *out = v;
    return true;
}


inline bool
read_u16le(std::span<const std::byte> bytes, uint64_t offset,
           uint16_t* out) noexcept
{
    if (!out || offset + 2 > bytes.size()) {
        return false;
    }
    *out = static_cast<uint16_t>((u8(bytes[offset + 0]) << 0)
                                 | (u8(bytes[offset + 1]) << 8));
    return true;
}


inline bool
read_u32le(std::span<const std::byte> bytes, uint64_t offset,
           uint32_t* out) noexcept
{
    if (!out || offset + 4 > bytes.size()) {
        return false;
    }
    uint32_t v = 0;
    v |= static_cast<uint32_t>(u8(bytes[offset + 0])) << 0;
    v |= static_cast<uint32_t>(u8(bytes[offset + 1])) << 8;
    v |= static_cast<uint32_t>(u8(bytes[offset + 2])) << 16;
    v |= static_cast<uint32_t>(u8(bytes[offset + 3])) << 24;
    *out = v;
    return true;
}


inline bool
read_u64le(std::span<const std::byte> bytes, uint64_t offset,
           uint64_t* out) noexcept
{
    if (!out || offset + 8 > bytes.size()) {
        return false;
    }
    uint64_t v = 0;
    for (uint32_t i = 0; i < 8; ++i) {
        v |= static_cast<uint64_t>(u8(bytes[offset + i])) << (8 * i);
    }
    *out = v;
    return true;
}


inline bool
read_f32le(std::span<const std::byte> bytes, uint64_t offset,
           float* out) noexcept
{
    uint32_t bits = 0;
    if (!out || !read_u32le(bytes, offset, &bits)) {
        return false;
    }
    *out = std::bit_cast<float>(bits);
    return true;
}


inline bool
read_f64le(std::span<const std::byte> bytes, uint64_t offset,
           double* out) noexcept
{
    uint64_t bits = 0;
    if (!out || !read_u64le(bytes, offset, &bits)) {
        return false;
    }
    *out = std::bit_cast<double>(bits);
    return true;
}


inline bool
read_f32be(std::span<const std::byte> bytes, uint64_t offset,
           float* out) noexcept
{
    uint32_t bits = 0;
    if (!out || !read_u32be(bytes, offset, &bits)) {
        return false;
    }
    *out = std::bit_cast<float>(bits);
    return true;
}


inline bool
read_f64be(std::span<const std::byte> bytes, uint64_t offset,
           double* out) noexcept
{
    uint64_t bits = 0;
    if (!out || !read_u64be(bytes, offset, &bits)) {
        return false;
    }
    *out = std::bit_cast<double>(bits);
    return true;
}


inline void
append_u8(std::vector<std::byte>* out, uint8_t v)
{
    out->push_back(std::byte { v });
}


inline void
append_u16be(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u24be(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u32be(std::vector<std::byte>* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
}


inline void
append_u64be(std::vector<std::byte>* out, uint64_t v)
{
    for (int shift = 56; shift >= 0; shift -= 8) {
        out->push_back(std::byte { static_cast<uint8_t>((v >> shift) & 0xFF) });
    }
}


inline void
append_u16le(std::vector<std::byte>* out, uint16_t v)
{
    out->push_back(std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) });
    out->push_back(std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) });
}


inline void
append_u32le(std::vector<std::byte>* out, uint32_t v)
{
    for (int shift = 0; shift < 32; shift += 8) {
        out->push_back(std::byte { static_cast<uint8_t>((v >> shift) & 0xFF) });
    }
}


inline void
append_u64le(std::vector<std::byte>* out, uint64_t v)
{
    for (int shift = 0; shift < 64; shift += 8) {
        out->push_back(std::byte { static_cast<uint8_t>((v >> shift) & 0xFF) });
    }
}


inline void
append_f32le(std::vector<std::byte>* out, float v)
{
    append_u32le(out, std::bit_cast<uint32_t>(v));
}


inline void
append_f64le(std::vector<std::byte>* out, double v)
{
    append_u64le(out, std::bit_cast<uint64_t>(v));
}


inline void
append_zeros(std::vector<std::byte>* out, size_t count)
{
    out->insert(out->end(), count, std::byte { 0 });
}


inline void
patch_u32be(std::vector<std::byte>* out, size_t offset, uint32_t v) noexcept
{
    (*out)[offset + 0] = std::byte { static_cast<uint8_t>((v >> 24) & 0xFF) };
    (*out)[offset + 1] = std::byte { static_cast<uint8_t>((v >> 16) & 0xFF) };
    (*out)[offset + 2] = std::byte { static_cast<uint8_t>((v >> 8) & 0xFF) };
    (*out)[offset + 3] = std::byte { static_cast<uint8_t>((v >> 0) & 0xFF) };
}


// Strict UTF-8 check (no overlongs, surrogates or code points past U+10FFFF).
inline bool
bytes_valid_utf8(std::span<const std::byte> bytes) noexcept
{
    size_t i = 0;
    while (i < bytes.size()) {
        const uint8_t c0 = u8(bytes[i]);
        if ((c0 & 0x80U) == 0U) {
            i += 1;
            continue;
        }

        uint32_t needed = 0;
        uint32_t min_cp = 0;
        uint32_t cp     = 0;
        if ((c0 & 0xE0U) == 0xC0U) {
            needed = 1;
            min_cp = 0x80U;
            cp     = c0 & 0x1FU;
        } else if ((c0 & 0xF0U) == 0xE0U) {
            needed = 2;
            min_cp = 0x800U;
            cp     = c0 & 0x0FU;
        } else if ((c0 & 0xF8U) == 0xF0U) {
            needed = 3;
            min_cp = 0x10000U;
            cp     = c0 & 0x07U;
        } else {
            return false;
        }

        if (i + needed >= bytes.size()) {
            return false;
        }
        for (uint32_t j = 0; j < needed; ++j) {
            const uint8_t cx = u8(bytes[i + 1U + j]);
            if ((cx & 0xC0U) != 0x80U) {
                return false;
            }
            cp = (cp << 6) | static_cast<uint32_t>(cx & 0x3FU);
        }
        if (cp < min_cp || cp > 0x10FFFFU) {
            return false;
        }
        if (cp >= 0xD800U && cp <= 0xDFFFU) {
            return false;
        }
        i += 1U + needed;
    }
    return true;
}


// Copies bytes into a string when they are valid UTF-8; otherwise empty.
inline std::string
utf8_or_empty(std::span<const std::byte> bytes)
{
    if (!bytes_valid_utf8(bytes)) {
        return std::string();
    }
    return std::string(reinterpret_cast<const char*>(bytes.data()),
                       bytes.size());
}


// Trims ASCII whitespace at both ends.
inline std::string
trim_ascii(std::string_view s)
{
    size_t b = 0;
    size_t e = s.size();
    while (b < e
           && (s[b] == ' ' || s[b] == '\t' || s[b] == '\r' || s[b] == '\n'
               || s[b] == '\v' || s[b] == '\f')) {
        b += 1;
    }
    while (e > b
           && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r'
               || s[e - 1] == '\n' || s[e - 1] == '\v' || s[e - 1] == '\f')) {
        e -= 1;
    }
    return std::string(s.substr(b, e - b));
}

}  // namespace openmotion
