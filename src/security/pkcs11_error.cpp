#include "security/pkcs11_error.h"

#include <sstream>

namespace p11mux { namespace security {

const char* errorCodeName(ErrorCode code){
    switch(code){
        case ErrorCode::NotConfigured: return "NotConfigured";
        case ErrorCode::CannotOpenModule: return "CannotOpenModule";
        case ErrorCode::TokenNotFound: return "TokenNotFound";
        case ErrorCode::KeyNotFound: return "KeyNotFound";
        case ErrorCode::CannotGetRandomData: return "CannotGetRandomData";
        case ErrorCode::UnsupportedKeyType: return "UnsupportedKeyType";
        case ErrorCode::InvalidConfiguration: return "InvalidConfiguration";
        case ErrorCode::UnknownSlot: return "UnknownSlot";
        case ErrorCode::ModuleError: return "ModuleError";
    }
    return "Unknown";
}

std::string describeRv(CK_RV rv){
    switch(rv){
        case CKR_OK: return "OK";
        case CKR_HOST_MEMORY: return "Host memory";
        case CKR_SLOT_ID_INVALID: return "Slot ID invalid";
        case CKR_GENERAL_ERROR: return "General error";
        case CKR_FUNCTION_FAILED: return "Function failed";
        case CKR_ARGUMENTS_BAD: return "Bad arguments";
        case CKR_ATTRIBUTE_TYPE_INVALID: return "Attribute type invalid";
        case CKR_DEVICE_ERROR: return "Device error";
        case CKR_DEVICE_REMOVED: return "Device removed";
        case CKR_FUNCTION_NOT_SUPPORTED: return "Function not supported";
        case CKR_KEY_HANDLE_INVALID: return "Key handle invalid";
        case CKR_MECHANISM_INVALID: return "Mechanism invalid";
        case CKR_OBJECT_HANDLE_INVALID: return "Object handle invalid";
        case CKR_OPERATION_ACTIVE: return "Operation active";
        case CKR_OPERATION_NOT_INITIALIZED: return "Operation not initialized";
        case CKR_PIN_INCORRECT: return "PIN incorrect";
        case CKR_PIN_LOCKED: return "PIN locked";
        case CKR_SESSION_COUNT: return "Session count exceeded";
        case CKR_SESSION_HANDLE_INVALID: return "Session handle invalid";
        case CKR_SIGNATURE_INVALID: return "Signature invalid";
        case CKR_TOKEN_NOT_PRESENT: return "Token not present";
        case CKR_TOKEN_NOT_RECOGNIZED: return "Token not recognized";
        case CKR_USER_ALREADY_LOGGED_IN: return "User already logged in";
        case CKR_USER_NOT_LOGGED_IN: return "User not logged in";
        case CKR_RANDOM_NO_RNG: return "No random number generator";
        case CKR_BUFFER_TOO_SMALL: return "Buffer too small";
        case CKR_CRYPTOKI_NOT_INITIALIZED: return "Cryptoki not initialized";
        case CKR_CRYPTOKI_ALREADY_INITIALIZED: return "Cryptoki already initialized";
        default: {
            std::ostringstream oss; oss << "CKR_0x" << std::hex << rv; return oss.str();
        }
    }
}

void checkRv(CK_RV rv, const char* operation){
    if(rv == CKR_OK) return;
    throw Pkcs11Exception(ErrorCode::ModuleError,
                          std::string(operation) + " failed: " + describeRv(rv),
                          operation, rv);
}

} } // namespace p11mux::security
