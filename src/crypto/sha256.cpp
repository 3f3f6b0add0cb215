// REVGUARD - SHA256 Digest Implementation
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/crypto/sha256.h"

#include <openssl/evp.h>

#include <stdexcept>

namespace revguard {

Digest256 SHA256Hash(const Byte* data, size_t len) {
    Digest256 digest{};
    unsigned int written = 0;
    static const Byte kEmpty = 0;
    if (EVP_Digest(data != nullptr ? data : &kEmpty, len, digest.data(), &written,
                   EVP_sha256(), nullptr) != 1 || written != digest.size()) {
        throw std::runtime_error("SHA256Hash: EVP_Digest failed");
    }
    return digest;
}

} // namespace revguard
