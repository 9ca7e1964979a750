#pragma once

#include "security/cryptoki.h"
#include "security/pkcs11_module.h"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace p11mux {
namespace mock {

/**
 * A simulated token in one slot
 */
struct MockSlot {
    CK_SLOT_ID id = 0;
    std::string label;
    std::string serial;
    CK_FLAGS flags = CKF_TOKEN_INITIALIZED;
    std::string pin;                   // empty accepts any PIN
    CK_RV token_info_rv = CKR_OK;      // returned by C_GetTokenInfo when not CKR_OK
};

/**
 * A token object as a plain attribute map
 */
struct MockObject {
    CK_SLOT_ID slot = 0;
    std::map<CK_ATTRIBUTE_TYPE, std::vector<uint8_t>> attributes;

    MockObject& set(CK_ATTRIBUTE_TYPE type, CK_ULONG value);
    MockObject& set(CK_ATTRIBUTE_TYPE type, const std::string& value);
    MockObject& set(CK_ATTRIBUTE_TYPE type, const std::vector<uint8_t>& value);
};

/**
 * In-process PKCS#11 module for tests and benchmarks
 *
 * Serves a complete CK_FUNCTION_LIST over configurable slots and objects.
 * Sign and decrypt are deterministic stand-ins:
 * - signature = input reversed, followed by the low byte of the key handle
 * - plaintext = ciphertext XOR 0x5A
 *
 * Failures can be injected per call type, and the module records what the
 * code under test did with it (sessions opened, logins, concurrent use of
 * one session handle, concurrent calls per slot).
 *
 * There is one function list per process, so the simulator is a
 * singleton; call reset() in each test's SetUp().
 */
class MockPkcs11Module {
public:
    static MockPkcs11Module& instance();

    // Drop all slots, objects, sessions, injected failures and counters
    void reset();

    void addSlot(const MockSlot& slot);
    CK_OBJECT_HANDLE addObject(const MockObject& object);

    CK_FUNCTION_LIST_PTR functionList();

    // Failure injection
    void failOpenSession(CK_SLOT_ID slot, int count, CK_RV rv = CKR_DEVICE_ERROR);
    void setInitializeResult(CK_RV rv);
    void setLoginResult(CK_RV rv);
    void setRandomResult(CK_RV rv);
    void setOperationDelay(std::chrono::milliseconds delay);

    // Observation
    bool initialized() const;
    int initializeCalls() const;
    int finalizeCalls() const;
    int openedSessions(CK_SLOT_ID slot) const;    // successful C_OpenSession calls
    int liveSessions(CK_SLOT_ID slot) const;      // opened and not yet closed
    int failedOpens(CK_SLOT_ID slot) const;
    int loginCalls() const;
    int maxConcurrentOperations(CK_SLOT_ID slot) const;
    int concurrentUseViolations() const;

private:
    friend struct MockEntry;

    struct Session {
        CK_SLOT_ID slot = 0;
        bool busy = false;
        bool finding = false;
        std::vector<CK_OBJECT_HANDLE> found;
        size_t found_pos = 0;
        CK_OBJECT_HANDLE sign_key = CK_INVALID_HANDLE;
        CK_OBJECT_HANDLE decrypt_key = CK_INVALID_HANDLE;
    };

    struct SlotCounters {
        int opened = 0;
        int live = 0;
        int failed_opens = 0;
        int pending_open_failures = 0;
        CK_RV open_failure_rv = CKR_OK;
        int active_ops = 0;
        int max_active_ops = 0;
    };

    MockPkcs11Module();

    mutable std::mutex mtx_;
    CK_FUNCTION_LIST functions_;

    std::vector<MockSlot> slots_;
    std::map<CK_OBJECT_HANDLE, MockObject> objects_;
    std::map<CK_SESSION_HANDLE, Session> sessions_;
    std::map<CK_SLOT_ID, SlotCounters> counters_;
    std::set<CK_SLOT_ID> logged_in_;

    CK_OBJECT_HANDLE next_object_ = 100;
    CK_SESSION_HANDLE next_session_ = 1;
    bool initialized_ = false;
    int initialize_calls_ = 0;
    int finalize_calls_ = 0;
    int login_calls_ = 0;
    int violations_ = 0;
    CK_RV initialize_rv_ = CKR_OK;
    CK_RV login_rv_ = CKR_OK;
    CK_RV random_rv_ = CKR_OK;
    uint8_t random_counter_ = 0;
    std::chrono::milliseconds delay_{0};
};

// Module bound to the simulator's function list
std::shared_ptr<security::Module> attachMockModule();

} // namespace mock
} // namespace p11mux
