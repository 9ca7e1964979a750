#pragma once

#include "security/cryptoki.h"
#include "security/pkcs11_module.h"

#include <string>
#include <vector>

namespace p11mux {
namespace security {

struct TokenMatch {
    CK_SLOT_ID slot = 0;
    CK_FLAGS flags = 0;   // CK_TOKEN_INFO.flags of the matched token
    TokenInfo info;
};

/**
 * Find the slot hosting the requested token
 *
 * Slots are visited in the order given. A serial-number match anywhere
 * beats a label match; among equal matches the first slot wins. Empty
 * serial/label never match. A failing C_GetTokenInfo aborts the search;
 * slots after a serial match are never read.
 *
 * @throws Pkcs11Exception(ErrorCode::TokenNotFound) if nothing matches
 * @throws Pkcs11Exception(ErrorCode::ModuleError) if token info cannot be read
 */
TokenMatch resolveToken(const Module& module,
                        const std::vector<CK_SLOT_ID>& slots,
                        const std::string& serial,
                        const std::string& label);

} // namespace security
} // namespace p11mux
