#pragma once

#include "security/cryptoki.h"

#include <cstdint>
#include <memory>
#include <vector>

#include <openssl/evp.h>

namespace p11mux {
namespace security {

/**
 * Public half of a token-held key pair, held as an OpenSSL EVP_PKEY
 *
 * Built once from the public key object's attributes and immutable
 * afterwards; copies share the underlying key.
 */
class PublicKey {
public:
    PublicKey() = default;

    /**
     * @param modulus CKA_MODULUS (big-endian)
     * @param public_exponent CKA_PUBLIC_EXPONENT (big-endian)
     * @throws Pkcs11Exception(ErrorCode::UnsupportedKeyType) if OpenSSL rejects the values
     */
    static PublicKey fromRsa(const std::vector<uint8_t>& modulus,
                             const std::vector<uint8_t>& public_exponent);

    /**
     * @param ec_params CKA_EC_PARAMS, DER encoded named-curve OID
     * @param ec_point CKA_EC_POINT, DER OCTET STRING or raw encoded point
     * @throws Pkcs11Exception(ErrorCode::UnsupportedKeyType) for unknown curves or bad points
     */
    static PublicKey fromEc(const std::vector<uint8_t>& ec_params,
                            const std::vector<uint8_t>& ec_point);

    // Takes ownership of pkey
    static PublicKey fromEvp(EVP_PKEY* pkey, CK_KEY_TYPE key_type);

    bool valid() const { return pkey_ != nullptr; }
    CK_KEY_TYPE keyType() const { return key_type_; }
    int bits() const;
    EVP_PKEY* get() const { return pkey_.get(); }

    // DER SubjectPublicKeyInfo
    std::vector<uint8_t> toDer() const;

    bool equals(const PublicKey& other) const;

private:
    std::shared_ptr<EVP_PKEY> pkey_;
    CK_KEY_TYPE key_type_ = CKK_RSA;
};

} // namespace security
} // namespace p11mux
