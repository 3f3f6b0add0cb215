// REVGUARD - Serialization Header
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Binary record encoding for the ledger store. Integers are little-endian,
// booleans one byte, account ids their 20 raw bytes, and sequences a uint32
// element count followed by the elements.

#ifndef REVGUARD_CORE_SERIALIZE_H
#define REVGUARD_CORE_SERIALIZE_H

#include "revguard/core/types.h"

#include <cstddef>
#include <cstdint>
#include <ios>
#include <string>
#include <type_traits>
#include <vector>

namespace revguard {

/// Largest element count accepted when decoding a sequence
constexpr uint32_t MAX_RECORD_ELEMENTS = 1u << 20;

class RecordWriter {
public:
    void WriteBytes(const void* src, size_t len) {
        bytes_.append(static_cast<const char*>(src), len);
    }

    const std::string& Bytes() const { return bytes_; }

    template<typename T>
    RecordWriter& operator<<(const T& value);

private:
    std::string bytes_;
};

/// Decodes from a borrowed buffer; `bytes` must outlive the reader
class RecordReader {
public:
    explicit RecordReader(const std::string& bytes) : bytes_(bytes) {}

    /// @throws std::ios_base::failure when fewer than `len` bytes remain
    void ReadBytes(void* dst, size_t len) {
        if (len > bytes_.size() - pos_) {
            throw std::ios_base::failure("record truncated");
        }
        bytes_.copy(static_cast<char*>(dst), len, pos_);
        pos_ += len;
    }

    size_t Remaining() const { return bytes_.size() - pos_; }

    template<typename T>
    RecordReader& operator>>(T& value);

private:
    const std::string& bytes_;
    size_t pos_{0};
};

template<typename UInt>
void WriteLE(RecordWriter& w, UInt value) {
    static_assert(std::is_unsigned<UInt>::value, "WriteLE takes unsigned integers");
    uint8_t buf[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        buf[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    w.WriteBytes(buf, sizeof(buf));
}

template<typename UInt>
UInt ReadLE(RecordReader& r) {
    static_assert(std::is_unsigned<UInt>::value, "ReadLE takes unsigned integers");
    uint8_t buf[sizeof(UInt)];
    r.ReadBytes(buf, sizeof(buf));
    UInt value = 0;
    for (size_t i = sizeof(UInt); i-- > 0;) {
        value = static_cast<UInt>((value << 8) | buf[i]);
    }
    return value;
}

inline void WriteCount(RecordWriter& w, size_t count) {
    WriteLE<uint32_t>(w, static_cast<uint32_t>(count));
}

inline uint32_t ReadCount(RecordReader& r) {
    uint32_t count = ReadLE<uint32_t>(r);
    if (count > MAX_RECORD_ELEMENTS) {
        throw std::ios_base::failure("record element count " + std::to_string(count));
    }
    return count;
}

// ============================================================================
// Field encoders
// ============================================================================

inline void Encode(RecordWriter& w, uint32_t v) { WriteLE(w, v); }
inline void Decode(RecordReader& r, uint32_t& v) { v = ReadLE<uint32_t>(r); }

inline void Encode(RecordWriter& w, uint64_t v) { WriteLE(w, v); }
inline void Decode(RecordReader& r, uint64_t& v) { v = ReadLE<uint64_t>(r); }

inline void Encode(RecordWriter& w, int64_t v) { WriteLE(w, static_cast<uint64_t>(v)); }
inline void Decode(RecordReader& r, int64_t& v) { v = static_cast<int64_t>(ReadLE<uint64_t>(r)); }

inline void Encode(RecordWriter& w, bool v) { WriteLE(w, static_cast<uint8_t>(v ? 1 : 0)); }

inline void Decode(RecordReader& r, bool& v) {
    uint8_t byte = ReadLE<uint8_t>(r);
    if (byte > 1) {
        throw std::ios_base::failure("invalid boolean");
    }
    v = byte == 1;
}

inline void Encode(RecordWriter& w, const AccountId& id) { w.WriteBytes(id.data(), AccountId::SIZE); }
inline void Decode(RecordReader& r, AccountId& id) { r.ReadBytes(id.data(), AccountId::SIZE); }

template<typename T>
void Encode(RecordWriter& w, const std::vector<T>& items) {
    WriteCount(w, items.size());
    for (const T& item : items) {
        w << item;
    }
}

template<typename T>
void Decode(RecordReader& r, std::vector<T>& items) {
    uint32_t count = ReadCount(r);
    items.clear();
    items.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
        T item{};
        r >> item;
        items.push_back(std::move(item));
    }
}

template<typename T>
RecordWriter& RecordWriter::operator<<(const T& value) {
    Encode(*this, value);
    return *this;
}

template<typename T>
RecordReader& RecordReader::operator>>(T& value) {
    Decode(*this, value);
    return *this;
}

/// Encode one record into a database value
template<typename T>
std::string ToBytes(const T& record) {
    RecordWriter w;
    w << record;
    return w.Bytes();
}

/// Decode a whole database value. False on truncation, invalid fields or
/// trailing bytes; `out` is left untouched then.
template<typename T>
bool FromBytes(const std::string& bytes, T& out) {
    T decoded{};
    RecordReader r(bytes);
    try {
        r >> decoded;
    } catch (const std::ios_base::failure&) {
        return false;
    }
    if (r.Remaining() != 0) {
        return false;
    }
    out = std::move(decoded);
    return true;
}

} // namespace revguard

#endif // REVGUARD_CORE_SERIALIZE_H
