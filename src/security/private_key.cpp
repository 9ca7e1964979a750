#include "security/private_key.h"
#include "security/hsm_context.h"

namespace p11mux { namespace security {

namespace {

CK_MECHANISM plainMechanism(CK_MECHANISM_TYPE type){
    CK_MECHANISM m;
    m.mechanism = type;
    m.pParameter = nullptr;
    m.ulParameterLen = 0;
    return m;
}

} // namespace

PrivateKeyHandle::PrivateKeyHandle(ObjectReference object, PublicKey public_key, CK_KEY_TYPE key_type,
                                   std::vector<uint8_t> id, std::string label)
    : object_(object)
    , public_key_(std::move(public_key))
    , key_type_(key_type)
    , id_(std::move(id))
    , label_(std::move(label))
{}

std::vector<uint8_t> PrivateKeyHandle::sign(const HsmContext& ctx, CK_MECHANISM mechanism,
                                            const std::vector<uint8_t>& data) const {
    return ctx.withSession(object_.slot, [&](CK_SESSION_HANDLE session){
        return ctx.module()->sign(session, mechanism, object_.handle, data);
    });
}

std::vector<uint8_t> PrivateKeyHandle::sign(const HsmContext& ctx, CK_MECHANISM_TYPE mechanism,
                                            const std::vector<uint8_t>& data) const {
    return sign(ctx, plainMechanism(mechanism), data);
}

std::vector<uint8_t> PrivateKeyHandle::decrypt(const HsmContext& ctx, CK_MECHANISM mechanism,
                                               const std::vector<uint8_t>& ciphertext) const {
    return ctx.withSession(object_.slot, [&](CK_SESSION_HANDLE session){
        return ctx.module()->decrypt(session, mechanism, object_.handle, ciphertext);
    });
}

std::vector<uint8_t> PrivateKeyHandle::decrypt(const HsmContext& ctx, CK_MECHANISM_TYPE mechanism,
                                               const std::vector<uint8_t>& ciphertext) const {
    return decrypt(ctx, plainMechanism(mechanism), ciphertext);
}

} } // namespace p11mux::security
