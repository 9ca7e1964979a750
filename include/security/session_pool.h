#pragma once

#include "security/cryptoki.h"
#include "security/pkcs11_module.h"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace p11mux {
namespace security {

class SessionPool;

/**
 * Exclusive use of one pooled session
 *
 * Obtained only from SessionPool. The session goes back to the pool's
 * idle set when the lease is destroyed or reset(), exactly once. Must not
 * outlive its pool.
 */
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease() { reset(); }

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    SessionLease(SessionLease&& other) noexcept
        : pool_(other.pool_), handle_(other.handle_) {
        other.pool_ = nullptr;
        other.handle_ = CK_INVALID_HANDLE;
    }
    SessionLease& operator=(SessionLease&& other) noexcept {
        if (this != &other) {
            reset();
            pool_ = other.pool_; handle_ = other.handle_;
            other.pool_ = nullptr; other.handle_ = CK_INVALID_HANDLE;
        }
        return *this;
    }

    CK_SESSION_HANDLE handle() const { return handle_; }
    explicit operator bool() const { return pool_ != nullptr; }

    // Return the session early
    void reset() noexcept;

    // Close the session instead of returning it; its place in the pool is
    // freed for a new session
    void discard() noexcept;

private:
    friend class SessionPool;
    SessionLease(SessionPool* pool, CK_SESSION_HANDLE handle) : pool_(pool), handle_(handle) {}

    SessionPool* pool_ = nullptr;
    CK_SESSION_HANDLE handle_ = CK_INVALID_HANDLE;
};

struct SessionPoolStats {
    uint32_t max_sessions = 0;        // Configured ceiling
    uint32_t opened = 0;              // Sessions currently open
    uint32_t idle = 0;                // Sessions currently waiting in the pool
    uint32_t in_use = 0;              // Sessions currently leased
    uint32_t peak_in_use = 0;         // High-water mark of in_use
    uint64_t acquisitions = 0;        // Successful acquisitions
    uint64_t waits = 0;               // Acquisitions that had to block
    uint64_t failed_opens = 0;        // C_OpenSession failures
    uint64_t discarded = 0;           // Sessions closed after an allocation failure
};

/**
 * Per-slot pool of read-write sessions
 *
 * PKCS#11 forbids concurrent use of one session handle, while callers of
 * the signing layer expect to call from any thread. The pool hands each
 * caller a session for its exclusive use:
 * - an idle session is reused if one exists
 * - otherwise a new session is opened while fewer than max_sessions exist
 * - otherwise the caller blocks until a session is released
 *
 * Sessions are opened lazily and never closed before the pool is
 * destroyed, with one exception: a session whose operation was interrupted
 * by std::bad_alloc may still have a cryptographic operation active, so
 * withSession() closes it and the pool opens a fresh one on demand. A
 * failed C_OpenSession is reported to the caller that attempted it and is
 * not counted as an opened session.
 *
 * Thread Safety: all methods are thread-safe.
 *
 * Example Usage:
 * ```cpp
 * SessionPool pool(module, slot, 4);
 * auto sig = pool.withSession([&](CK_SESSION_HANDLE s) {
 *     return module->sign(s, mech, key, digest);
 * });
 * ```
 */
class SessionPool {
public:
    SessionPool(std::shared_ptr<Module> module, CK_SLOT_ID slot, uint32_t max_sessions);
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    /**
     * Take a session for exclusive use, blocking while the pool is exhausted
     * @throws Pkcs11Exception(ErrorCode::ModuleError) if a new session cannot be opened
     */
    SessionLease acquire();

    /**
     * As acquire(), but give up after timeout
     * @return empty if no session became available in time
     */
    std::optional<SessionLease> tryAcquireFor(std::chrono::milliseconds timeout);

    /**
     * Run fn with exclusive use of a session; the session is released on
     * every exit path, including exceptions thrown by fn. After
     * std::bad_alloc the session is closed rather than reused.
     */
    template<typename Fn>
    std::invoke_result_t<Fn&, CK_SESSION_HANDLE> withSession(Fn&& fn) {
        SessionLease lease = acquire();
        try {
            return fn(lease.handle());
        } catch(const std::bad_alloc&) {
            // May have struck between C_SignInit and C_Sign (or any other
            // Init/final pair); PKCS#11 2.40 cannot cancel the operation.
            lease.discard();
            throw;
        }
    }

    CK_SLOT_ID slot() const { return slot_; }
    uint32_t maxSessions() const { return max_sessions_; }
    const std::shared_ptr<Module>& module() const { return module_; }

    SessionPoolStats stats() const;

private:
    friend class SessionLease;

    // Either hands out an idle session, opens a new one, or returns an
    // empty lease when the caller has to wait. Called with lock held;
    // may temporarily release it while opening.
    std::optional<SessionLease> tryTake(std::unique_lock<std::mutex>& lock);
    void release(CK_SESSION_HANDLE handle) noexcept;
    void discard(CK_SESSION_HANDLE handle) noexcept;

    std::shared_ptr<Module> module_;
    const CK_SLOT_ID slot_;
    const uint32_t max_sessions_;

    mutable std::mutex mtx_;
    std::condition_variable available_;
    std::vector<CK_SESSION_HANDLE> idle_;
    uint32_t opened_ = 0;     // includes opens in progress
    uint32_t in_use_ = 0;
    uint32_t peak_in_use_ = 0;
    uint64_t acquisitions_ = 0;
    uint64_t waits_ = 0;
    uint64_t failed_opens_ = 0;
    uint64_t discarded_ = 0;
};

} // namespace security
} // namespace p11mux
