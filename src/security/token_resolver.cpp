#include "security/token_resolver.h"
#include "security/pkcs11_error.h"

#include <utility>

namespace p11mux { namespace security {

TokenMatch resolveToken(const Module& module,
                        const std::vector<CK_SLOT_ID>& slots,
                        const std::string& serial,
                        const std::string& label){
    // A serial match ends the scan at once; a label match has to wait until
    // every slot has been checked for the serial.
    bool haveLabelMatch = false;
    TokenMatch labelMatch;
    for(CK_SLOT_ID slot : slots){
        TokenInfo info = module.tokenInfo(slot);
        if(!serial.empty() && info.serial_number == serial){
            CK_FLAGS flags = info.flags;
            return TokenMatch{slot, flags, std::move(info)};
        }
        if(!haveLabelMatch && !label.empty() && info.label == label){
            labelMatch.slot = slot;
            labelMatch.flags = info.flags;
            labelMatch.info = std::move(info);
            haveLabelMatch = true;
        }
    }
    if(haveLabelMatch) return labelMatch;
    throw Pkcs11Exception(ErrorCode::TokenNotFound,
                          "Could not find PKCS#11 token (serial='" + serial + "', label='" + label + "')");
}

} } // namespace p11mux::security
