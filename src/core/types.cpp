// REVGUARD - Core Types Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/core/types.h"
#include "revguard/crypto/sha256.h"

#include <algorithm>
#include <cstring>

namespace revguard {

namespace {

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

AccountId::AccountId(const Byte* data, size_t len) {
    if (data == nullptr || len < SIZE) {
        throw std::invalid_argument("AccountId needs " + std::to_string(SIZE) + " bytes");
    }
    std::memcpy(bytes_.data(), data, SIZE);
}

bool AccountId::IsNull() const noexcept {
    return std::all_of(bytes_.begin(), bytes_.end(), [](Byte b) { return b == 0; });
}

std::string AccountId::ToHex() const {
    static const char digits[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(SIZE * 2);
    for (Byte b : bytes_) {
        hex.push_back(digits[b >> 4]);
        hex.push_back(digits[b & 0x0F]);
    }
    return hex;
}

AccountId AccountId::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2) {
        throw std::invalid_argument("account id must be " + std::to_string(SIZE * 2) +
                                    " hex digits");
    }
    AccountId id;
    for (size_t i = 0; i < SIZE; ++i) {
        int high = HexValue(hex[2 * i]);
        int low = HexValue(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("invalid hex digit in account id");
        }
        id.bytes_[i] = static_cast<Byte>((high << 4) | low);
    }
    return id;
}

AccountId AccountIdFromLabel(const std::string& label) {
    Digest256 digest = SHA256Hash(reinterpret_cast<const Byte*>(label.data()), label.size());
    return AccountId(digest.data(), AccountId::SIZE);
}

} // namespace revguard
