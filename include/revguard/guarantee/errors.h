// REVGUARD - Guarantee Protocol Errors
// Copyright (c) 2024 REVGUARD Developers
// MIT License

#ifndef REVGUARD_GUARANTEE_ERRORS_H
#define REVGUARD_GUARANTEE_ERRORS_H

#include <stdexcept>
#include <string>

namespace revguard {
namespace guarantee {

/// Failure classes of pool and engine operations
enum class ErrorKind {
    Authorization,          ///< Caller lacks the required role or registration
    NotVenueOwner,          ///< Caller is not the registry owner of the venue
    NotFound,               ///< Venue, assignment, report or member does not exist
    State,                  ///< Operation not valid in the current state
    InsufficientResource,   ///< Not enough stake, escrow or commitment
    Transfer,               ///< Collateral asset refused a movement
    Validation,             ///< Malformed argument
    NoShortfall,            ///< Report has nothing to settle
};

/// Convert error kind to string
const char* ErrorKindToString(ErrorKind kind);

/**
 * Base of every protocol failure. An operation that throws has left no
 * partial mutation behind.
 */
class GuaranteeError : public std::runtime_error {
public:
    GuaranteeError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind Kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

#define REVGUARD_DEFINE_ERROR(Name, KindValue)                                 \
    class Name : public GuaranteeError {                                       \
    public:                                                                    \
        explicit Name(const std::string& message)                              \
            : GuaranteeError(ErrorKind::KindValue, message) {}                 \
    };

REVGUARD_DEFINE_ERROR(AuthorizationError, Authorization)
REVGUARD_DEFINE_ERROR(NotVenueOwnerError, NotVenueOwner)
REVGUARD_DEFINE_ERROR(NotFoundError, NotFound)
REVGUARD_DEFINE_ERROR(StateError, State)
REVGUARD_DEFINE_ERROR(InsufficientResourceError, InsufficientResource)
REVGUARD_DEFINE_ERROR(TransferError, Transfer)
REVGUARD_DEFINE_ERROR(ValidationError, Validation)
REVGUARD_DEFINE_ERROR(NoShortfallError, NoShortfall)

#undef REVGUARD_DEFINE_ERROR

} // namespace guarantee
} // namespace revguard

#endif // REVGUARD_GUARANTEE_ERRORS_H
