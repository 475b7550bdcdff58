#pragma once

/** \file bytes.hpp
 *  \brief Little-endian byte buffer writer/reader for on-disk payloads.
 *
 * ByteReader never reads past the end: every getter returns false once the buffer is
 * exhausted and the reader stays failed, so callers check ok() once at the end.
 */

#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cairn::core {

/** \brief Little-endian integer load/store, independent of host byte order. */
template <typename T>
inline void store_le(std::uint8_t* p, T v) noexcept {
    for (std::size_t i = 0; i < sizeof(T); ++i) p[i] = static_cast<std::uint8_t>(v >> (8 * i));
}

template <typename T>
inline auto load_le(const std::uint8_t* p) noexcept -> T {
    T v = 0;
    for (std::size_t i = 0; i < sizeof(T); ++i) v |= static_cast<T>(p[i]) << (8 * i);
    return v;
}

inline auto load_le32(const std::uint8_t* p) noexcept -> std::uint32_t { return load_le<std::uint32_t>(p); }

// Floats are copied as stored in memory; on-disk files assume an IEEE-754 little-endian host.
class ByteWriter {
public:
    void put_u8(std::uint8_t v) { buf_.push_back(v); }
    void put_u16(std::uint16_t v) { put_int(v); }
    void put_u32(std::uint32_t v) { put_int(v); }
    void put_u64(std::uint64_t v) { put_int(v); }
    void put_f32(float v) { put_raw(&v, sizeof(v)); }
    void put_floats(std::span<const float> v) { put_raw(v.data(), v.size_bytes()); }
    void put_string(std::string_view s) {
        put_u32(static_cast<std::uint32_t>(s.size()));
        put_raw(s.data(), s.size());
    }

    [[nodiscard]] auto bytes() const noexcept -> std::span<const std::uint8_t> { return buf_; }
    [[nodiscard]] auto take() noexcept -> std::vector<std::uint8_t> { return std::move(buf_); }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return buf_.size(); }

private:
    template <typename T>
    void put_int(T v) {
        std::uint8_t tmp[sizeof(T)];
        store_le(tmp, v);
        buf_.insert(buf_.end(), tmp, tmp + sizeof(T));
    }

    void put_raw(const void* p, std::size_t n) {
        if (n == 0) return;
        const auto* b = static_cast<const std::uint8_t*>(p);
        buf_.insert(buf_.end(), b, b + n);
    }

    std::vector<std::uint8_t> buf_;
};

class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> bytes) noexcept : bytes_(bytes) {}

    bool get_u8(std::uint8_t& v) noexcept { return get_raw(&v, sizeof(v)); }
    bool get_u16(std::uint16_t& v) noexcept { return get_int(v); }
    bool get_u32(std::uint32_t& v) noexcept { return get_int(v); }
    bool get_u64(std::uint64_t& v) noexcept { return get_int(v); }
    bool get_floats(float* out, std::size_t n) noexcept { return get_raw(out, n * sizeof(float)); }
    bool get_string(std::string& out) {
        std::uint32_t n = 0;
        if (!get_u32(n) || n > remaining()) { ok_ = false; return false; }
        out.assign(reinterpret_cast<const char*>(bytes_.data() + off_), n);
        off_ += n;
        return true;
    }

    [[nodiscard]] auto remaining() const noexcept -> std::size_t { return bytes_.size() - off_; }
    [[nodiscard]] auto ok() const noexcept -> bool { return ok_; }
    [[nodiscard]] auto at_end() const noexcept -> bool { return ok_ && off_ == bytes_.size(); }

private:
    template <typename T>
    bool get_int(T& v) noexcept {
        if (!ok_ || sizeof(T) > remaining()) { ok_ = false; return false; }
        v = load_le<T>(bytes_.data() + off_);
        off_ += sizeof(T);
        return true;
    }

    bool get_raw(void* out, std::size_t n) noexcept {
        if (!ok_ || n > remaining()) { ok_ = false; return false; }
        if (n > 0) std::memcpy(out, bytes_.data() + off_, n);
        off_ += n;
        return true;
    }

    std::span<const std::uint8_t> bytes_;
    std::size_t off_{0};
    bool ok_{true};
};

} // namespace cairn::core
