#include "types.hh"
#include <algorithm>
#include <atomic>
#include <bit>
#include <cstring>

namespace mesh {

// ============================================================================
// Append Helpers
// ============================================================================

void append_u8(bytes_t& out, std::uint8_t val) {
    out.push_back(val);
}

void append_u32(bytes_t& out, std::uint32_t val) {
    std::array<std::uint8_t, 4> buf;
    encode_u32(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_u64(bytes_t& out, std::uint64_t val) {
    std::array<std::uint8_t, 8> buf;
    encode_u64(buf.data(), val);
    out.insert(out.end(), buf.begin(), buf.end());
}

void append_i64(bytes_t& out, std::int64_t val) {
    append_u64(out, static_cast<std::uint64_t>(val));
}

void append_f64(bytes_t& out, double val) {
    append_u64(out, std::bit_cast<std::uint64_t>(val));
}

void append_bytes(bytes_t& out, std::span<const std::uint8_t> data) {
    out.insert(out.end(), data.begin(), data.end());
}

void append_blob(bytes_t& out, std::span<const std::uint8_t> data) {
    append_u32(out, static_cast<std::uint32_t>(data.size()));
    append_bytes(out, data);
}

void append_string(bytes_t& out, std::string_view str) {
    append_u32(out, static_cast<std::uint32_t>(str.size()));
    out.insert(out.end(), str.begin(), str.end());
}

// ============================================================================
// ByteReader Implementation
// ============================================================================

bool ByteReader::read_u8(std::uint8_t& out) {
    if (remaining() < 1) return false;
    out = data_[offset_++];
    return true;
}

bool ByteReader::read_u32(std::uint32_t& out) {
    if (remaining() < 4) return false;
    out = decode_u32(data_.data() + offset_);
    offset_ += 4;
    return true;
}

bool ByteReader::read_u64(std::uint64_t& out) {
    if (remaining() < 8) return false;
    out = decode_u64(data_.data() + offset_);
    offset_ += 8;
    return true;
}

bool ByteReader::read_i64(std::int64_t& out) {
    std::uint64_t raw = 0;
    if (!read_u64(raw)) return false;
    out = static_cast<std::int64_t>(raw);
    return true;
}

bool ByteReader::read_f64(double& out) {
    std::uint64_t raw = 0;
    if (!read_u64(raw)) return false;
    out = std::bit_cast<double>(raw);
    return true;
}

bool ByteReader::read_bytes(std::uint8_t* out, std::size_t len) {
    if (remaining() < len) return false;
    std::memcpy(out, data_.data() + offset_, len);
    offset_ += len;
    return true;
}

bool ByteReader::read_blob(bytes_t& out, std::size_t max_len) {
    std::uint32_t len = 0;
    if (!read_u32(len)) return false;
    if (len > max_len || remaining() < len) return false;
    out.assign(data_.begin() + static_cast<std::ptrdiff_t>(offset_),
               data_.begin() + static_cast<std::ptrdiff_t>(offset_ + len));
    offset_ += len;
    return true;
}

bool ByteReader::read_string(std::string& out, std::size_t max_len) {
    std::uint32_t len = 0;
    if (!read_u32(len)) return false;
    if (len > max_len || remaining() < len) return false;
    out.assign(reinterpret_cast<const char*>(data_.data() + offset_), len);
    offset_ += len;
    return true;
}

// ============================================================================
// Hex Encoding/Decoding
// ============================================================================

std::string bytes_to_hex(std::span<const std::uint8_t> bytes) {
    static constexpr char hex_chars[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (auto byte : bytes) {
        result.push_back(hex_chars[byte >> 4]);
        result.push_back(hex_chars[byte & 0x0F]);
    }
    return result;
}

std::optional<std::vector<std::uint8_t>> hex_to_bytes(std::string_view hex) {
    // Skip optional 0x prefix
    if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X')) {
        hex = hex.substr(2);
    }

    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    std::vector<std::uint8_t> result;
    result.reserve(hex.size() / 2);

    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = nibble(hex[i]);
        int low = nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        result.push_back(static_cast<std::uint8_t>((high << 4) | low));
    }

    return result;
}

std::string short_id(const peer_id_t& id) {
    return bytes_to_hex(std::span<const std::uint8_t>(id.data(), 6));
}

std::optional<peer_id_t> peer_id_from_hex(std::string_view hex) {
    auto bytes_opt = hex_to_bytes(hex);
    if (!bytes_opt || bytes_opt->size() != PEER_ID_SIZE) {
        return std::nullopt;
    }
    peer_id_t id;
    std::copy(bytes_opt->begin(), bytes_opt->end(), id.begin());
    return id;
}

// ============================================================================
// Secure Zero
// ============================================================================

void secure_zero(void* ptr, std::size_t len) {
    volatile std::uint8_t* p = static_cast<volatile std::uint8_t*>(ptr);
    while (len--) {
        *p++ = 0;
    }
    std::atomic_thread_fence(std::memory_order_seq_cst);
}

}  // namespace mesh
