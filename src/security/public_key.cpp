#include "security/public_key.h"
#include "security/pkcs11_error.h"

#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/objects.h>
#include <openssl/param_build.h>
#include <openssl/x509.h>

#include <string>

namespace p11mux { namespace security {

namespace {

struct BnFree { void operator()(BIGNUM* p) const { BN_free(p); } };
struct ParamBldFree { void operator()(OSSL_PARAM_BLD* p) const { OSSL_PARAM_BLD_free(p); } };
struct ParamFree { void operator()(OSSL_PARAM* p) const { OSSL_PARAM_free(p); } };
struct PkeyCtxFree { void operator()(EVP_PKEY_CTX* p) const { EVP_PKEY_CTX_free(p); } };
struct Asn1ObjectFree { void operator()(ASN1_OBJECT* p) const { ASN1_OBJECT_free(p); } };
struct OctetStringFree { void operator()(ASN1_OCTET_STRING* p) const { ASN1_OCTET_STRING_free(p); } };

[[noreturn]] void unsupported(const std::string& why){
    throw Pkcs11Exception(ErrorCode::UnsupportedKeyType, why);
}

EVP_PKEY* buildPublicKey(const char* algorithm, OSSL_PARAM_BLD* bld){
    std::unique_ptr<OSSL_PARAM, ParamFree> params(OSSL_PARAM_BLD_to_param(bld));
    std::unique_ptr<EVP_PKEY_CTX, PkeyCtxFree> ctx(EVP_PKEY_CTX_new_from_name(nullptr, algorithm, nullptr));
    if(!params || !ctx) unsupported(std::string("OpenSSL cannot build ") + algorithm + " keys");
    EVP_PKEY* pkey = nullptr;
    if(EVP_PKEY_fromdata_init(ctx.get()) <= 0 ||
       EVP_PKEY_fromdata(ctx.get(), &pkey, EVP_PKEY_PUBLIC_KEY, params.get()) <= 0 || !pkey){
        unsupported(std::string("Invalid ") + algorithm + " public key material");
    }
    return pkey;
}

} // namespace

PublicKey PublicKey::fromEvp(EVP_PKEY* pkey, CK_KEY_TYPE key_type){
    PublicKey k;
    k.pkey_ = std::shared_ptr<EVP_PKEY>(pkey, EVP_PKEY_free);
    k.key_type_ = key_type;
    return k;
}

PublicKey PublicKey::fromRsa(const std::vector<uint8_t>& modulus,
                             const std::vector<uint8_t>& public_exponent){
    if(modulus.empty() || public_exponent.empty()) unsupported("RSA public key without modulus or exponent");
    std::unique_ptr<BIGNUM, BnFree> n(BN_bin2bn(modulus.data(), static_cast<int>(modulus.size()), nullptr));
    std::unique_ptr<BIGNUM, BnFree> e(BN_bin2bn(public_exponent.data(), static_cast<int>(public_exponent.size()), nullptr));
    std::unique_ptr<OSSL_PARAM_BLD, ParamBldFree> bld(OSSL_PARAM_BLD_new());
    if(!n || !e || !bld ||
       !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_N, n.get()) ||
       !OSSL_PARAM_BLD_push_BN(bld.get(), OSSL_PKEY_PARAM_RSA_E, e.get())){
        unsupported("Cannot encode RSA public key parameters");
    }
    return fromEvp(buildPublicKey("RSA", bld.get()), CKK_RSA);
}

PublicKey PublicKey::fromEc(const std::vector<uint8_t>& ec_params,
                            const std::vector<uint8_t>& ec_point){
    if(ec_params.empty() || ec_point.empty()) unsupported("EC public key without parameters or point");

    // CKA_EC_PARAMS: only the namedCurve choice is supported
    const unsigned char* p = ec_params.data();
    std::unique_ptr<ASN1_OBJECT, Asn1ObjectFree> oid(d2i_ASN1_OBJECT(nullptr, &p, static_cast<long>(ec_params.size())));
    if(!oid) unsupported("CKA_EC_PARAMS is not a named curve");
    const char* curve = OBJ_nid2sn(OBJ_obj2nid(oid.get()));
    if(!curve) unsupported("Unknown EC curve");

    // CKA_EC_POINT is specified as a DER OCTET STRING, some modules return the raw point
    std::vector<uint8_t> point;
    const unsigned char* q = ec_point.data();
    std::unique_ptr<ASN1_OCTET_STRING, OctetStringFree> os(
        d2i_ASN1_OCTET_STRING(nullptr, &q, static_cast<long>(ec_point.size())));
    if(os && q == ec_point.data() + ec_point.size()){
        const unsigned char* d = ASN1_STRING_get0_data(os.get());
        point.assign(d, d + ASN1_STRING_length(os.get()));
    } else {
        point = ec_point;
    }

    std::unique_ptr<OSSL_PARAM_BLD, ParamBldFree> bld(OSSL_PARAM_BLD_new());
    if(!bld ||
       !OSSL_PARAM_BLD_push_utf8_string(bld.get(), OSSL_PKEY_PARAM_GROUP_NAME, curve, 0) ||
       !OSSL_PARAM_BLD_push_octet_string(bld.get(), OSSL_PKEY_PARAM_PUB_KEY, point.data(), point.size())){
        unsupported("Cannot encode EC public key parameters");
    }
    return fromEvp(buildPublicKey("EC", bld.get()), CKK_EC);
}

int PublicKey::bits() const {
    return pkey_ ? EVP_PKEY_get_bits(pkey_.get()) : 0;
}

std::vector<uint8_t> PublicKey::toDer() const {
    if(!pkey_) return {};
    int len = i2d_PUBKEY(pkey_.get(), nullptr);
    if(len <= 0) return {};
    std::vector<uint8_t> der(static_cast<size_t>(len));
    unsigned char* out = der.data();
    i2d_PUBKEY(pkey_.get(), &out);
    return der;
}

bool PublicKey::equals(const PublicKey& other) const {
    if(!pkey_ || !other.pkey_) return pkey_ == other.pkey_;
    return EVP_PKEY_eq(pkey_.get(), other.pkey_.get()) == 1;
}

} } // namespace p11mux::security
