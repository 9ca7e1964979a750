#include "security/session_pool.h"
#include "security/pkcs11_error.h"
#include "utils/logger.h"

#include <algorithm>

namespace p11mux { namespace security {

void SessionLease::reset() noexcept {
    if(pool_){
        pool_->release(handle_);
        pool_ = nullptr;
        handle_ = CK_INVALID_HANDLE;
    }
}

void SessionLease::discard() noexcept {
    if(pool_){
        pool_->discard(handle_);
        pool_ = nullptr;
        handle_ = CK_INVALID_HANDLE;
    }
}

SessionPool::SessionPool(std::shared_ptr<Module> module, CK_SLOT_ID slot, uint32_t max_sessions)
    : module_(std::move(module)), slot_(slot), max_sessions_(max_sessions) {
    if(!module_){
        throw Pkcs11Exception(ErrorCode::InvalidConfiguration, "SessionPool requires a module");
    }
    if(max_sessions_ == 0){
        throw Pkcs11Exception(ErrorCode::InvalidConfiguration, "SessionPool ceiling must be greater than zero");
    }
    // release() must not allocate
    idle_.reserve(max_sessions_);
}

SessionPool::~SessionPool(){
    std::lock_guard<std::mutex> lock(mtx_);
    for(CK_SESSION_HANDLE h : idle_){
        CK_RV rv = module_->closeSession(h);
        if(rv != CKR_OK){
            P11MUX_WARN("C_CloseSession on slot {} failed: {}", slot_, describeRv(rv));
        }
    }
    idle_.clear();
}

std::optional<SessionLease> SessionPool::tryTake(std::unique_lock<std::mutex>& lock){
    if(!idle_.empty()){
        CK_SESSION_HANDLE h = idle_.back();
        idle_.pop_back();
        ++in_use_; ++acquisitions_;
        peak_in_use_ = std::max(peak_in_use_, in_use_);
        return SessionLease(this, h);
    }
    if(opened_ < max_sessions_){
        // Reserve the slot before dropping the lock so concurrent callers
        // cannot overshoot the ceiling while C_OpenSession runs.
        ++opened_;
        lock.unlock();
        CK_SESSION_HANDLE h = CK_INVALID_HANDLE;
        try {
            h = module_->openSession(slot_);
        } catch(...) {
            lock.lock();
            --opened_;
            ++failed_opens_;
            // The freed reservation may let a waiter open instead
            available_.notify_one();
            throw;
        }
        lock.lock();
        ++in_use_; ++acquisitions_;
        peak_in_use_ = std::max(peak_in_use_, in_use_);
        return SessionLease(this, h);
    }
    return std::nullopt;
}

SessionLease SessionPool::acquire(){
    std::unique_lock<std::mutex> lock(mtx_);
    bool counted_wait = false;
    for(;;){
        auto lease = tryTake(lock);
        if(lease) return std::move(*lease);
        if(!counted_wait){ ++waits_; counted_wait = true; }
        available_.wait(lock);
    }
}

std::optional<SessionLease> SessionPool::tryAcquireFor(std::chrono::milliseconds timeout){
    auto deadline = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(mtx_);
    bool counted_wait = false;
    for(;;){
        auto lease = tryTake(lock);
        if(lease) return lease;
        if(!counted_wait){ ++waits_; counted_wait = true; }
        if(available_.wait_until(lock, deadline) == std::cv_status::timeout){
            // One last look: a release may have raced with the timeout
            return tryTake(lock);
        }
    }
}

void SessionPool::release(CK_SESSION_HANDLE handle) noexcept {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        idle_.push_back(handle);
        --in_use_;
    }
    available_.notify_one();
}

void SessionPool::discard(CK_SESSION_HANDLE handle) noexcept {
    // Closing also ends whatever operation was left active on the session
    CK_RV rv = module_->closeSession(handle);
    if(rv != CKR_OK){
        P11MUX_WARN("C_CloseSession on slot {} failed: {}", slot_, describeRv(rv));
    }
    {
        std::lock_guard<std::mutex> lock(mtx_);
        --opened_;
        --in_use_;
        ++discarded_;
    }
    available_.notify_one();
}

SessionPoolStats SessionPool::stats() const {
    std::lock_guard<std::mutex> lock(mtx_);
    SessionPoolStats s;
    s.max_sessions = max_sessions_;
    s.opened = in_use_ + static_cast<uint32_t>(idle_.size());
    s.idle = static_cast<uint32_t>(idle_.size());
    s.in_use = in_use_;
    s.peak_in_use = peak_in_use_;
    s.acquisitions = acquisitions_;
    s.waits = waits_;
    s.failed_opens = failed_opens_;
    s.discarded = discarded_;
    return s;
}

} } // namespace p11mux::security
