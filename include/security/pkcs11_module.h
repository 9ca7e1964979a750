#pragma once

#include "security/cryptoki.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace p11mux {
namespace security {

/**
 * Token metadata with the blank-padded PKCS#11 fields trimmed
 */
struct TokenInfo {
    std::string label;
    std::string serial_number;
    std::string manufacturer_id;
    std::string model;
    CK_FLAGS flags = 0;

    bool loginRequired() const { return (flags & CKF_LOGIN_REQUIRED) != 0; }
};

/**
 * PKCS#11 Module
 *
 * Owns one loaded PKCS#11 library and its function list. The library is
 * initialized with CKF_OS_LOCKING_OK on construction and finalized on
 * destruction (unless another party had initialized it first).
 *
 * Every wrapper throws Pkcs11Exception(ErrorCode::ModuleError) with the
 * failing function name and CK_RV. The wrappers are stateless and safe to
 * call from several threads, but a given session handle must only be used
 * by one thread at a time; SessionPool enforces that.
 *
 * Example Usage:
 * ```cpp
 * auto module = Module::load("/usr/lib/softhsm/libsofthsm2.so");
 * for (auto slot : module->slotList(true)) {
 *     auto info = module->tokenInfo(slot);
 * }
 * ```
 */
class Module {
public:
    /**
     * Load a PKCS#11 shared library and initialize it
     * @throws Pkcs11Exception(ErrorCode::CannotOpenModule)
     */
    static std::shared_ptr<Module> load(const std::string& path);

    /**
     * Initialize an already resolved function list (statically linked or
     * simulated modules)
     * @throws Pkcs11Exception(ErrorCode::CannotOpenModule)
     */
    static std::shared_ptr<Module> attach(CK_FUNCTION_LIST_PTR functions,
                                          const std::string& description = "<attached>");

    ~Module();

    Module(const Module&) = delete;
    Module& operator=(const Module&) = delete;

    const std::string& path() const { return path_; }
    CK_FUNCTION_LIST_PTR api() const { return funcs_; }

    std::vector<CK_SLOT_ID> slotList(bool token_present) const;
    TokenInfo tokenInfo(CK_SLOT_ID slot) const;

    // Always opens a read-write serial session
    CK_SESSION_HANDLE openSession(CK_SLOT_ID slot) const;
    CK_RV closeSession(CK_SESSION_HANDLE session) const;
    void login(CK_SESSION_HANDLE session, CK_USER_TYPE user, const std::string& pin) const;

    std::vector<CK_OBJECT_HANDLE> findObjects(CK_SESSION_HANDLE session,
                                              std::vector<CK_ATTRIBUTE>& tmpl,
                                              size_t max_objects) const;
    std::vector<uint8_t> attributeValue(CK_SESSION_HANDLE session,
                                        CK_OBJECT_HANDLE object,
                                        CK_ATTRIBUTE_TYPE type) const;

    std::vector<uint8_t> sign(CK_SESSION_HANDLE session, CK_MECHANISM& mechanism,
                              CK_OBJECT_HANDLE key, const std::vector<uint8_t>& data) const;
    std::vector<uint8_t> decrypt(CK_SESSION_HANDLE session, CK_MECHANISM& mechanism,
                                 CK_OBJECT_HANDLE key, const std::vector<uint8_t>& ciphertext) const;

    // Raw C_GenerateRandom result; callers decide how to report failure
    CK_RV generateRandom(CK_SESSION_HANDLE session, uint8_t* out, size_t length) const;

private:
    Module(void* lib, CK_FUNCTION_LIST_PTR funcs, std::string path);
    void initialize();

    void* lib_ = nullptr;
    CK_FUNCTION_LIST_PTR funcs_ = nullptr;
    std::string path_;
    bool owns_initialization_ = false;
};

} // namespace security
} // namespace p11mux
