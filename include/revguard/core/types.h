// REVGUARD - Core Types Header
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// Amounts, timestamps and participant identities shared by every module.

#ifndef REVGUARD_CORE_TYPES_H
#define REVGUARD_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace revguard {

using Byte = uint8_t;

/// Collateral amount in indivisible token units
using Amount = int64_t;

/// Unix epoch seconds
using Timestamp = int64_t;

/// Venue identifier assigned by the venue registry
using VenueId = uint64_t;

/// Upper bound on any single balance or supply
constexpr Amount MAX_MONEY = 2100000000000000000LL;

/// Basis point denominator
constexpr int64_t BPS_DENOMINATOR = 10000;

inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

/// floor(a * b / c) without intermediate overflow. Requires a, b >= 0 and c > 0.
inline Amount MulDiv(Amount a, Amount b, Amount c) {
    if (c <= 0) {
        throw std::invalid_argument("MulDiv: non-positive divisor");
    }
    unsigned __int128 product = static_cast<unsigned __int128>(a) *
                                static_cast<unsigned __int128>(b);
    return static_cast<Amount>(product / static_cast<unsigned __int128>(c));
}

/// 32-byte SHA-256 output
using Digest256 = std::array<Byte, 32>;

/**
 * Identity of a protocol participant: underwriter, venue owner, operator,
 * vault or engine. Twenty opaque bytes, printed as hex in storage order.
 */
class AccountId {
public:
    static constexpr size_t SIZE = 20;

    AccountId() noexcept { bytes_.fill(0); }

    /// Takes the first SIZE bytes of `data`; `len` must be at least SIZE
    AccountId(const Byte* data, size_t len);

    bool IsNull() const noexcept;

    const Byte* data() const noexcept { return bytes_.data(); }
    Byte* data() noexcept { return bytes_.data(); }
    Byte operator[](size_t idx) const { return bytes_[idx]; }

    bool operator==(const AccountId& other) const noexcept { return bytes_ == other.bytes_; }
    bool operator!=(const AccountId& other) const noexcept { return bytes_ != other.bytes_; }
    bool operator<(const AccountId& other) const noexcept { return bytes_ < other.bytes_; }

    std::string ToHex() const;

    /// First 8 hex characters, for log lines
    std::string ToShortHex() const { return ToHex().substr(0, 8); }

    /// @throws std::invalid_argument unless `hex` is exactly 40 hex digits
    static AccountId FromHex(const std::string& hex);

private:
    std::array<Byte, SIZE> bytes_;
};

/// Derive an account identity from a human-readable label (first 20 bytes of SHA-256)
AccountId AccountIdFromLabel(const std::string& label);

} // namespace revguard

#endif // REVGUARD_CORE_TYPES_H
