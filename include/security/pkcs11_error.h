#pragma once

#include "security/cryptoki.h"

#include <stdexcept>
#include <string>
#include <utility>

namespace p11mux {
namespace security {

/**
 * @brief Failure categories reported by the PKCS#11 layer
 */
enum class ErrorCode {
    NotConfigured,        // Operation needs a configured context, none exists
    CannotOpenModule,     // Library could not be loaded or initialized
    TokenNotFound,        // No slot holds a token with the requested serial/label
    KeyNotFound,          // Key lookup matched no object
    CannotGetRandomData,  // Module failed to produce random bytes
    UnsupportedKeyType,   // Object has a CKA_KEY_TYPE we cannot represent
    InvalidConfiguration, // Configuration missing, unreadable or inconsistent
    UnknownSlot,          // No session pool exists for the slot
    ModuleError           // Any other failing PKCS#11 call
};

const char* errorCodeName(ErrorCode code);

/**
 * @brief Human readable text for a PKCS#11 return value
 *
 * Falls back to "CKR_0x<hex>" for values without a mapping.
 */
std::string describeRv(CK_RV rv);

/**
 * @brief Exception thrown by every failing operation of the PKCS#11 layer
 *
 * Carries the failure category and, where a native call failed, the
 * returned CK_RV and the name of that call (e.g. "C_OpenSession").
 */
class Pkcs11Exception : public std::runtime_error {
public:
    Pkcs11Exception(ErrorCode code, const std::string& message)
        : std::runtime_error(message)
        , code_(code)
        , rv_(CKR_OK)
    {}

    Pkcs11Exception(ErrorCode code, const std::string& message, std::string operation, CK_RV rv)
        : std::runtime_error(message)
        , code_(code)
        , rv_(rv)
        , operation_(std::move(operation))
    {}

    ErrorCode code() const { return code_; }
    CK_RV rv() const { return rv_; }
    const std::string& operation() const { return operation_; }

private:
    ErrorCode code_;
    CK_RV rv_;
    std::string operation_;
};

/**
 * @brief Throw a ModuleError for a failed native call
 *
 * @param rv Value returned by the call; CKR_OK is a no-op
 * @param operation Name of the PKCS#11 function, used in the message
 * @throws Pkcs11Exception with ErrorCode::ModuleError
 */
void checkRv(CK_RV rv, const char* operation);

} // namespace security
} // namespace p11mux
