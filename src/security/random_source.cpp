#include "security/random_source.h"
#include "security/hsm_context.h"
#include "security/pkcs11_error.h"

#include <string>

namespace p11mux { namespace security {

std::vector<uint8_t> generateRandom(const HsmContext& ctx, CK_SLOT_ID slot, size_t length){
    std::vector<uint8_t> out(length);
    if(length == 0) return out;
    CK_RV rv = CKR_OK;
    try {
        rv = ctx.withSession(slot, [&](CK_SESSION_HANDLE session){
            return ctx.module()->generateRandom(session, out.data(), out.size());
        });
    } catch(const Pkcs11Exception& e) {
        if(e.code() != ErrorCode::ModuleError) throw;
        throw Pkcs11Exception(ErrorCode::CannotGetRandomData,
                              std::string("Cannot get random data: ") + e.what(), e.operation(), e.rv());
    }
    if(rv != CKR_OK){
        throw Pkcs11Exception(ErrorCode::CannotGetRandomData,
                              "Cannot get random data: C_GenerateRandom failed: " + describeRv(rv),
                              "C_GenerateRandom", rv);
    }
    return out;
}

std::vector<uint8_t> generateRandom(const HsmContext& ctx, size_t length){
    return generateRandom(ctx, ctx.defaultSlot(), length);
}

} } // namespace p11mux::security
