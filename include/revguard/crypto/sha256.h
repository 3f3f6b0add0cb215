// REVGUARD - SHA256 Digest
// Copyright (c) 2024 REVGUARD Developers
// MIT License
//
// SHA-256 via OpenSSL's EVP interface. Used to derive account identities
// from scenario labels.

#ifndef REVGUARD_CRYPTO_SHA256_H
#define REVGUARD_CRYPTO_SHA256_H

#include "revguard/core/types.h"

#include <cstddef>

namespace revguard {

/// @throws std::runtime_error if the OpenSSL digest fails
Digest256 SHA256Hash(const Byte* data, size_t len);

} // namespace revguard

#endif // REVGUARD_CRYPTO_SHA256_H
