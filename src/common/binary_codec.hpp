#pragma once

#include <cstdint>
#include <cstring>
#include <span>
#include <vector>
#include <expected>
#include <array>
#include <utility>
#include "common/errors.hpp"

namespace stunlink::wire {

// ============================================================================
// Binary Encoding Rules
// ============================================================================
// | Type          | Encoding                              |
// |---------------|---------------------------------------|
// | uint8/16/32   | Big Endian (network byte order)       |
// | bytes         | raw, caller supplies the length       |
// ============================================================================

// ============================================================================
// BinaryWriter - Serialize data to binary format
// ============================================================================
class BinaryWriter {
public:
    BinaryWriter() = default;
    explicit BinaryWriter(size_t reserve_size) {
        buffer_.reserve(reserve_size);
    }

    void write_u8(uint8_t value) {
        buffer_.push_back(value);
    }

    void write_u16(uint16_t value) {
        buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    void write_u32(uint32_t value) {
        buffer_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
        buffer_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
        buffer_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
        buffer_.push_back(static_cast<uint8_t>(value & 0xFF));
    }

    // Write fixed-size bytes (no length prefix)
    void write_fixed_bytes(std::span<const uint8_t> data) {
        buffer_.insert(buffer_.end(), data.begin(), data.end());
    }

    std::vector<uint8_t>& data() { return buffer_; }
    const std::vector<uint8_t>& data() const { return buffer_; }

    std::vector<uint8_t> take() { return std::move(buffer_); }

    size_t size() const { return buffer_.size(); }

private:
    std::vector<uint8_t> buffer_;
};

// ============================================================================
// BinaryReader - Deserialize data from binary format
// ============================================================================
// Every read is bounds checked and fails with SHORT_BUFFER instead of
// reading past the end of the span.
class BinaryReader {
public:
    explicit BinaryReader(std::span<const uint8_t> data)
        : data_(data), pos_(0) {}

    bool has_remaining(size_t count) const {
        return count <= data_.size() - pos_;
    }

    std::expected<uint8_t, ErrorCode> read_u8() {
        if (!has_remaining(1)) {
            return std::unexpected(ErrorCode::SHORT_BUFFER);
        }
        return data_[pos_++];
    }

    std::expected<uint16_t, ErrorCode> read_u16() {
        if (!has_remaining(2)) {
            return std::unexpected(ErrorCode::SHORT_BUFFER);
        }
        uint16_t value = (static_cast<uint16_t>(data_[pos_]) << 8) |
                         static_cast<uint16_t>(data_[pos_ + 1]);
        pos_ += 2;
        return value;
    }

    std::expected<uint32_t, ErrorCode> read_u32() {
        if (!has_remaining(4)) {
            return std::unexpected(ErrorCode::SHORT_BUFFER);
        }
        uint32_t value = (static_cast<uint32_t>(data_[pos_]) << 24) |
                         (static_cast<uint32_t>(data_[pos_ + 1]) << 16) |
                         (static_cast<uint32_t>(data_[pos_ + 2]) << 8) |
                         static_cast<uint32_t>(data_[pos_ + 3]);
        pos_ += 4;
        return value;
    }

    // Read fixed-size bytes (no length prefix)
    std::expected<std::vector<uint8_t>, ErrorCode> read_fixed_bytes(size_t count) {
        if (!has_remaining(count)) {
            return std::unexpected(ErrorCode::SHORT_BUFFER);
        }

        std::vector<uint8_t> bytes(data_.begin() + pos_, data_.begin() + pos_ + count);
        pos_ += count;
        return bytes;
    }

    template<size_t N>
    std::expected<std::array<uint8_t, N>, ErrorCode> read_fixed_array() {
        if (!has_remaining(N)) {
            return std::unexpected(ErrorCode::SHORT_BUFFER);
        }

        std::array<uint8_t, N> arr;
        std::memcpy(arr.data(), data_.data() + pos_, N);
        pos_ += N;
        return arr;
    }

    bool skip(size_t count) {
        if (!has_remaining(count)) return false;
        pos_ += count;
        return true;
    }

private:
    std::span<const uint8_t> data_;
    size_t pos_;
};

} // namespace stunlink::wire
