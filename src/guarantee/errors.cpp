// REVGUARD - Guarantee Protocol Errors
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#include "revguard/guarantee/errors.h"

namespace revguard {
namespace guarantee {

const char* ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Authorization:        return "Authorization";
        case ErrorKind::NotVenueOwner:        return "NotVenueOwner";
        case ErrorKind::NotFound:             return "NotFound";
        case ErrorKind::State:                return "State";
        case ErrorKind::InsufficientResource: return "InsufficientResource";
        case ErrorKind::Transfer:             return "Transfer";
        case ErrorKind::Validation:           return "Validation";
        case ErrorKind::NoShortfall:          return "NoShortfall";
        default:                              return "Unknown";
    }
}

} // namespace guarantee
} // namespace revguard
