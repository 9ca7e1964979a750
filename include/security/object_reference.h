#pragma once

#include "security/cryptoki.h"

namespace p11mux {
namespace security {

/**
 * Reference to an object stored on a token
 *
 * Pairs the module-assigned object handle with the slot the object lives
 * on, so later operations can borrow a session from the right pool. It
 * never holds a session itself.
 */
struct ObjectReference {
    CK_OBJECT_HANDLE handle = CK_INVALID_HANDLE;
    CK_SLOT_ID slot = 0;

    bool valid() const { return handle != CK_INVALID_HANDLE; }
};

inline bool operator==(const ObjectReference& a, const ObjectReference& b) {
    return a.handle == b.handle && a.slot == b.slot;
}

inline bool operator!=(const ObjectReference& a, const ObjectReference& b) {
    return !(a == b);
}

} // namespace security
} // namespace p11mux
