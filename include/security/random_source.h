#pragma once

#include "security/cryptoki.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace p11mux {
namespace security {

class HsmContext;

/**
 * Random bytes from the token's generator, through a pooled session
 *
 * @throws Pkcs11Exception(ErrorCode::CannotGetRandomData) if the module fails,
 *         carrying the CK_RV of the failing call
 * @throws Pkcs11Exception(ErrorCode::UnknownSlot) if ctx has no pool for slot
 */
std::vector<uint8_t> generateRandom(const HsmContext& ctx, CK_SLOT_ID slot, size_t length);

// Same, on the context's default slot
std::vector<uint8_t> generateRandom(const HsmContext& ctx, size_t length);

} // namespace security
} // namespace p11mux
