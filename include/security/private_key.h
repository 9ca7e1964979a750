#pragma once

#include "security/cryptoki.h"
#include "security/object_reference.h"
#include "security/public_key.h"

#include <cstdint>
#include <string>
#include <vector>

namespace p11mux {
namespace security {

class HsmContext;

/**
 * Private key stored on a token
 *
 * The public half is read from the token once, when the handle is built,
 * so publicKey() never has to talk to the module. Every operation borrows
 * a session from the pool of the slot the key lives on; the handle never
 * keeps a session of its own and can be shared between threads.
 *
 * Example Usage:
 * ```cpp
 * auto key = findKeyPair(*ctx, {}, "signing-key");
 * auto sig = key.sign(*ctx, CKM_SHA256_RSA_PKCS, payload);
 * ```
 */
class PrivateKeyHandle {
public:
    PrivateKeyHandle(ObjectReference object, PublicKey public_key, CK_KEY_TYPE key_type,
                     std::vector<uint8_t> id, std::string label);

    const ObjectReference& object() const { return object_; }
    const PublicKey& publicKey() const { return public_key_; }
    CK_KEY_TYPE keyType() const { return key_type_; }
    const std::vector<uint8_t>& id() const { return id_; }
    const std::string& label() const { return label_; }

    /**
     * @throws Pkcs11Exception(ErrorCode::ModuleError) if C_SignInit/C_Sign fail
     * @throws Pkcs11Exception(ErrorCode::UnknownSlot) if ctx has no pool for the key's slot
     */
    std::vector<uint8_t> sign(const HsmContext& ctx, CK_MECHANISM mechanism,
                              const std::vector<uint8_t>& data) const;
    std::vector<uint8_t> sign(const HsmContext& ctx, CK_MECHANISM_TYPE mechanism,
                              const std::vector<uint8_t>& data) const;

    std::vector<uint8_t> decrypt(const HsmContext& ctx, CK_MECHANISM mechanism,
                                 const std::vector<uint8_t>& ciphertext) const;
    std::vector<uint8_t> decrypt(const HsmContext& ctx, CK_MECHANISM_TYPE mechanism,
                                 const std::vector<uint8_t>& ciphertext) const;

private:
    ObjectReference object_;
    PublicKey public_key_;
    CK_KEY_TYPE key_type_;
    std::vector<uint8_t> id_;
    std::string label_;
};

} // namespace security
} // namespace p11mux
