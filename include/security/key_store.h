#pragma once

#include "security/cryptoki.h"
#include "security/object_reference.h"
#include "security/private_key.h"

#include <cstdint>
#include <string>
#include <vector>

namespace p11mux {
namespace security {

class HsmContext;

/**
 * Look up a key pair on the context's default slot
 *
 * The private key is matched by CKA_ID and/or CKA_LABEL (whichever are
 * given, both must match). Its public key is the CKO_PUBLIC_KEY object with
 * the same CKA_ID; when the private key has no id, or no public key carries
 * it, the public key with the same label is used instead.
 *
 * @throws Pkcs11Exception(ErrorCode::InvalidConfiguration) if id and label are both empty
 * @throws Pkcs11Exception(ErrorCode::KeyNotFound) if either half is missing
 * @throws Pkcs11Exception(ErrorCode::UnsupportedKeyType) for keys other than RSA and EC
 */
PrivateKeyHandle findKeyPair(const HsmContext& ctx,
                             const std::vector<uint8_t>& id,
                             const std::string& label);

/**
 * Build a handle for a private key object produced elsewhere (generation,
 * unwrapping). Reads the key's attributes and its public half.
 *
 * @throws Pkcs11Exception(ErrorCode::KeyNotFound) if the public half is missing
 * @throws Pkcs11Exception(ErrorCode::UnsupportedKeyType) for keys other than RSA and EC
 */
PrivateKeyHandle loadKeyPair(const HsmContext& ctx, const ObjectReference& private_key);

} // namespace security
} // namespace p11mux
