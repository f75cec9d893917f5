// ZKGAS - Serialization Framework
// Copyright (c) 2025 ZKGAS Developers
// MIT License
//
// In-memory byte stream with big-endian, fixed-width encoders. All wire
// formats in ZKGAS (authorization payloads, validation contexts, proof
// records) are fixed-offset big-endian layouts built on this stream.

#ifndef ZKGAS_CORE_SERIALIZE_H
#define ZKGAS_CORE_SERIALIZE_H

#include "zkgas/core/types.h"

#include <cstdint>
#include <cstring>
#include <ios>
#include <vector>

namespace zkgas {

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

class DataStream {
public:
    using value_type = uint8_t;
    using size_type = std::size_t;

    DataStream() = default;

    explicit DataStream(const std::vector<uint8_t>& data) : data_(data), read_pos_(0) {}

    explicit DataStream(std::vector<uint8_t>&& data) : data_(std::move(data)), read_pos_(0) {}

    DataStream(const uint8_t* data, size_type len) : data_(data, data + len), read_pos_(0) {}

    /// Returns unread bytes remaining
    size_type size() const noexcept { return data_.size() - read_pos_; }

    bool empty() const noexcept { return size() == 0; }

    /// Whole buffer (including bytes already read)
    const std::vector<uint8_t>& Data() const noexcept { return data_; }

    void Write(const uint8_t* src, size_type len) {
        data_.insert(data_.end(), src, src + len);
    }

    /// Throws std::ios_base::failure when fewer than len bytes remain
    void Read(uint8_t* dst, size_type len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream::Read(): end of data");
        }
        if (len > 0) {
            std::memcpy(dst, data_.data() + read_pos_, len);
        }
        read_pos_ += len;
    }

    /// Consume and return all unread bytes
    std::vector<uint8_t> ReadRemaining() {
        std::vector<uint8_t> rest(data_.begin() + read_pos_, data_.end());
        read_pos_ = data_.size();
        return rest;
    }

private:
    std::vector<uint8_t> data_;
    size_type read_pos_ = 0;
};

// ============================================================================
// Big-endian primitives
// ============================================================================

template<typename Stream>
void WriteUint8(Stream& s, uint8_t v) {
    s.Write(&v, 1);
}

template<typename Stream>
uint8_t ReadUint8(Stream& s) {
    uint8_t v = 0;
    s.Read(&v, 1);
    return v;
}

template<typename Stream>
void WriteBE64(Stream& s, uint64_t v) {
    uint8_t buf[8];
    for (int i = 7; i >= 0; --i) {
        buf[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
    s.Write(buf, 8);
}

template<typename Stream>
uint64_t ReadBE64(Stream& s) {
    uint8_t buf[8];
    s.Read(buf, 8);
    uint64_t v = 0;
    for (int i = 0; i < 8; ++i) {
        v = (v << 8) | buf[i];
    }
    return v;
}

template<typename Stream, size_t N>
void WriteFixed(Stream& s, const FixedBytes<N>& value) {
    s.Write(value.data(), N);
}

template<typename Stream>
Uint256 ReadUint256(Stream& s) {
    Uint256 value;
    s.Read(value.data(), Uint256::SIZE);
    return value;
}

template<typename Stream>
Address ReadAddress(Stream& s) {
    Address value;
    s.Read(value.data(), Address::SIZE);
    return value;
}

} // namespace zkgas

#endif // ZKGAS_CORE_SERIALIZE_H
