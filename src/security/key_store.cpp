#include "security/key_store.h"
#include "security/hsm_context.h"
#include "security/pkcs11_error.h"

#include <cstring>
#include <string>

namespace p11mux { namespace security {

namespace {

const CK_OBJECT_CLASS kPrivateKeyClass = CKO_PRIVATE_KEY;
const CK_OBJECT_CLASS kPublicKeyClass = CKO_PUBLIC_KEY;

CK_ATTRIBUTE attribute(CK_ATTRIBUTE_TYPE type, const void* value, size_t len){
    CK_ATTRIBUTE a;
    a.type = type;
    a.pValue = const_cast<void*>(value);
    a.ulValueLen = static_cast<CK_ULONG>(len);
    return a;
}

std::string hex(const std::vector<uint8_t>& bytes){
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(bytes.size() * 2);
    for(uint8_t b : bytes){
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

CK_KEY_TYPE readKeyType(const Module& module, CK_SESSION_HANDLE session, CK_OBJECT_HANDLE object){
    auto raw = module.attributeValue(session, object, CKA_KEY_TYPE);
    if(raw.size() != sizeof(CK_KEY_TYPE)){
        throw Pkcs11Exception(ErrorCode::UnsupportedKeyType, "Malformed CKA_KEY_TYPE attribute");
    }
    CK_KEY_TYPE type;
    std::memcpy(&type, raw.data(), sizeof(type));
    if(type != CKK_RSA && type != CKK_EC){
        throw Pkcs11Exception(ErrorCode::UnsupportedKeyType,
                              "Unsupported key type " + std::to_string(type));
    }
    return type;
}

CK_OBJECT_HANDLE findPublicKey(const Module& module, CK_SESSION_HANDLE session,
                               const std::vector<uint8_t>& id, const std::string& label){
    if(id.empty() && label.empty()){
        throw Pkcs11Exception(ErrorCode::KeyNotFound, "Private key has neither CKA_ID nor CKA_LABEL");
    }
    const CK_ATTRIBUTE keyClass = attribute(CKA_CLASS, &kPublicKeyClass, sizeof(kPublicKeyClass));
    if(!id.empty()){
        std::vector<CK_ATTRIBUTE> tmpl{ keyClass, attribute(CKA_ID, id.data(), id.size()) };
        auto found = module.findObjects(session, tmpl, 1);
        if(!found.empty()) return found.front();
    }
    if(!label.empty()){
        std::vector<CK_ATTRIBUTE> tmpl{ keyClass, attribute(CKA_LABEL, label.data(), label.size()) };
        auto found = module.findObjects(session, tmpl, 1);
        if(!found.empty()) return found.front();
    }
    throw Pkcs11Exception(ErrorCode::KeyNotFound,
                          "No public key for id '" + hex(id) + "' label '" + label + "'");
}

PrivateKeyHandle readKeyPair(const Module& module, CK_SESSION_HANDLE session, const ObjectReference& ref){
    CK_KEY_TYPE type = readKeyType(module, session, ref.handle);
    auto id = module.attributeValue(session, ref.handle, CKA_ID);
    auto rawLabel = module.attributeValue(session, ref.handle, CKA_LABEL);
    std::string label(rawLabel.begin(), rawLabel.end());

    CK_OBJECT_HANDLE pub = findPublicKey(module, session, id, label);
    PublicKey publicKey = type == CKK_RSA
        ? PublicKey::fromRsa(module.attributeValue(session, pub, CKA_MODULUS),
                             module.attributeValue(session, pub, CKA_PUBLIC_EXPONENT))
        : PublicKey::fromEc(module.attributeValue(session, pub, CKA_EC_PARAMS),
                            module.attributeValue(session, pub, CKA_EC_POINT));
    return PrivateKeyHandle(ref, std::move(publicKey), type, std::move(id), std::move(label));
}

} // namespace

PrivateKeyHandle findKeyPair(const HsmContext& ctx,
                             const std::vector<uint8_t>& id,
                             const std::string& label){
    if(id.empty() && label.empty()){
        throw Pkcs11Exception(ErrorCode::InvalidConfiguration, "Key lookup needs an id or a label");
    }
    const Module& module = *ctx.module();
    CK_SLOT_ID slot = ctx.defaultSlot();
    return ctx.withSession(slot, [&](CK_SESSION_HANDLE session){
        std::vector<CK_ATTRIBUTE> tmpl{ attribute(CKA_CLASS, &kPrivateKeyClass, sizeof(kPrivateKeyClass)) };
        if(!id.empty()) tmpl.push_back(attribute(CKA_ID, id.data(), id.size()));
        if(!label.empty()) tmpl.push_back(attribute(CKA_LABEL, label.data(), label.size()));
        auto found = module.findObjects(session, tmpl, 1);
        if(found.empty()){
            throw Pkcs11Exception(ErrorCode::KeyNotFound,
                                  "No private key for id '" + hex(id) + "' label '" + label + "'");
        }
        ObjectReference ref;
        ref.handle = found.front();
        ref.slot = slot;
        return readKeyPair(module, session, ref);
    });
}

PrivateKeyHandle loadKeyPair(const HsmContext& ctx, const ObjectReference& private_key){
    if(!private_key.valid()){
        throw Pkcs11Exception(ErrorCode::KeyNotFound, "Invalid private key reference");
    }
    const Module& module = *ctx.module();
    return ctx.withSession(private_key.slot, [&](CK_SESSION_HANDLE session){
        try {
            return readKeyPair(module, session, private_key);
        } catch(const Pkcs11Exception& e) {
            if(e.rv() != CKR_OBJECT_HANDLE_INVALID) throw;
            throw Pkcs11Exception(ErrorCode::KeyNotFound,
                                  "Private key object " + std::to_string(private_key.handle) + " not found",
                                  e.operation(), e.rv());
        }
    });
}

} } // namespace p11mux::security
