#include <gtest/gtest.h>
#include "security/session_pool.h"
#include "security/pkcs11_error.h"
#include "mock/mock_pkcs11_module.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <new>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace p11mux::security;
using namespace p11mux::mock;

class SessionPoolTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& mock = MockPkcs11Module::instance();
        mock.reset();
        MockSlot first;
        first.id = 1;
        first.label = "TEST";
        first.serial = "0001";
        mock.addSlot(first);
        MockSlot second;
        second.id = 2;
        second.label = "OTHER";
        second.serial = "0002";
        mock.addSlot(second);
        module = attachMockModule();
    }

    MockPkcs11Module& mock() { return MockPkcs11Module::instance(); }

    std::shared_ptr<Module> module;
};

TEST_F(SessionPoolTest, RejectsZeroCeiling) {
    try {
        SessionPool pool(module, 1, 0);
        FAIL() << "expected InvalidConfiguration";
    } catch (const Pkcs11Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidConfiguration);
    }
}

TEST_F(SessionPoolTest, OpensLazily) {
    SessionPool pool(module, 1, 4);
    EXPECT_EQ(mock().openedSessions(1), 0);
    pool.withSession([](CK_SESSION_HANDLE s) { EXPECT_NE(s, CK_INVALID_HANDLE); });
    pool.withSession([](CK_SESSION_HANDLE) {});
    // Sequential use reuses the idle session
    EXPECT_EQ(mock().openedSessions(1), 1);
    auto stats = pool.stats();
    EXPECT_EQ(stats.opened, 1u);
    EXPECT_EQ(stats.idle, 1u);
    EXPECT_EQ(stats.acquisitions, 2u);
}

TEST_F(SessionPoolTest, BoundAndExclusivityUnderContention) {
    const uint32_t ceiling = 3;
    const int threads = 12;
    const int rounds = 5;
    SessionPool pool(module, 1, ceiling);

    std::atomic<int> inUse{0};
    std::atomic<int> maxInUse{0};
    std::atomic<int> duplicates{0};
    std::mutex heldMtx;
    std::set<CK_SESSION_HANDLE> held;

    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([&]() {
            for (int r = 0; r < rounds; ++r) {
                pool.withSession([&](CK_SESSION_HANDLE s) {
                    {
                        std::lock_guard<std::mutex> lock(heldMtx);
                        if (!held.insert(s).second) ++duplicates;
                    }
                    int now = ++inUse;
                    int prev = maxInUse.load();
                    while (now > prev && !maxInUse.compare_exchange_weak(prev, now)) {}
                    std::this_thread::sleep_for(std::chrono::milliseconds(2));
                    --inUse;
                    std::lock_guard<std::mutex> lock(heldMtx);
                    held.erase(s);
                });
            }
        });
    }
    for (auto& w : workers) w.join();

    EXPECT_EQ(duplicates.load(), 0);
    EXPECT_LE(maxInUse.load(), static_cast<int>(ceiling));
    EXPECT_LE(mock().openedSessions(1), static_cast<int>(ceiling));
    EXPECT_EQ(mock().concurrentUseViolations(), 0);

    auto stats = pool.stats();
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.idle, stats.opened);
    EXPECT_LE(stats.peak_in_use, ceiling);
    EXPECT_EQ(stats.acquisitions, static_cast<uint64_t>(threads * rounds));
}

TEST_F(SessionPoolTest, SessionReturnsAfterFailingOperation) {
    SessionPool pool(module, 1, 2);
    EXPECT_THROW(pool.withSession([](CK_SESSION_HANDLE) -> int {
        throw std::runtime_error("operation failed");
    }), std::runtime_error);

    auto stats = pool.stats();
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.idle, 1u);

    int value = pool.withSession([](CK_SESSION_HANDLE) { return 42; });
    EXPECT_EQ(value, 42);
    // The next acquisition was served without growing the pool
    EXPECT_EQ(mock().openedSessions(1), 1);
}

TEST_F(SessionPoolTest, SessionClosedAfterAllocationFailure) {
    MockObject key;
    key.slot = 1;
    key.set(CKA_CLASS, CKO_PRIVATE_KEY).set(CKA_KEY_TYPE, CKK_RSA);
    CK_OBJECT_HANDLE keyHandle = mock().addObject(key);

    CK_MECHANISM mech;
    mech.mechanism = CKM_SHA256_RSA_PKCS;
    mech.pParameter = nullptr;
    mech.ulParameterLen = 0;

    SessionPool pool(module, 1, 1);
    // Out of memory after C_SignInit leaves the sign operation active
    EXPECT_THROW(pool.withSession([&](CK_SESSION_HANDLE s) -> int {
        EXPECT_EQ(mock().functionList()->C_SignInit(s, &mech, keyHandle), static_cast<CK_RV>(CKR_OK));
        throw std::bad_alloc();
    }), std::bad_alloc);

    auto stats = pool.stats();
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.idle, 0u);
    EXPECT_EQ(stats.opened, 0u);
    EXPECT_EQ(stats.discarded, 1u);
    EXPECT_EQ(mock().liveSessions(1), 0);

    // A fresh session signs without CKR_OPERATION_ACTIVE
    std::vector<uint8_t> data{1, 2, 3};
    auto sig = pool.withSession([&](CK_SESSION_HANDLE s) {
        return module->sign(s, mech, keyHandle, data);
    });
    EXPECT_FALSE(sig.empty());
    EXPECT_EQ(mock().openedSessions(1), 2);
    EXPECT_EQ(pool.stats().idle, 1u);
}

TEST_F(SessionPoolTest, ExhaustionBlocksUntilRelease) {
    SessionPool pool(module, 1, 1);
    SessionLease first = pool.acquire();
    ASSERT_TRUE(first);

    std::atomic<bool> secondDone{false};
    CK_SESSION_HANDLE secondHandle = CK_INVALID_HANDLE;
    std::thread waiter([&]() {
        SessionLease second = pool.acquire();
        secondHandle = second.handle();
        secondDone = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(secondDone.load());

    CK_SESSION_HANDLE firstHandle = first.handle();
    first.reset();
    waiter.join();

    EXPECT_TRUE(secondDone.load());
    EXPECT_EQ(secondHandle, firstHandle);
    EXPECT_EQ(mock().openedSessions(1), 1);
    EXPECT_EQ(pool.stats().waits, 1u);
}

TEST_F(SessionPoolTest, FailedOpenIsNotCounted) {
    SessionPool pool(module, 1, 1);
    mock().failOpenSession(1, 1, CKR_DEVICE_REMOVED);

    try {
        pool.acquire();
        FAIL() << "expected ModuleError";
    } catch (const Pkcs11Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::ModuleError);
        EXPECT_EQ(e.rv(), static_cast<CK_RV>(CKR_DEVICE_REMOVED));
        EXPECT_EQ(e.operation(), "C_OpenSession");
    }

    auto stats = pool.stats();
    EXPECT_EQ(stats.opened, 0u);
    EXPECT_EQ(stats.failed_opens, 1u);

    // The reservation was given back, so the single slot is still usable
    SessionLease lease = pool.acquire();
    EXPECT_TRUE(lease);
    EXPECT_EQ(mock().openedSessions(1), 1);
}

TEST_F(SessionPoolTest, SlotsAreIsolated) {
    SessionPool first(module, 1, 1);
    SessionPool second(module, 2, 1);

    SessionLease busy = first.acquire();
    auto other = second.tryAcquireFor(std::chrono::milliseconds(10));
    ASSERT_TRUE(other.has_value());
    EXPECT_NE(other->handle(), busy.handle());
    EXPECT_EQ(mock().openedSessions(1), 1);
    EXPECT_EQ(mock().openedSessions(2), 1);
}

TEST_F(SessionPoolTest, TryAcquireForTimesOut) {
    SessionPool pool(module, 1, 1);
    SessionLease held = pool.acquire();

    auto start = std::chrono::steady_clock::now();
    auto lease = pool.tryAcquireFor(std::chrono::milliseconds(30));
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_FALSE(lease.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds(30));

    // The holder is unaffected by the abandoned wait
    EXPECT_TRUE(held);
    EXPECT_EQ(pool.stats().in_use, 1u);

    held.reset();
    lease = pool.tryAcquireFor(std::chrono::milliseconds(30));
    EXPECT_TRUE(lease.has_value());
}

TEST_F(SessionPoolTest, MovedLeaseReleasesOnce) {
    SessionPool pool(module, 1, 2);
    SessionLease a = pool.acquire();
    SessionLease b = std::move(a);
    EXPECT_FALSE(a);
    EXPECT_TRUE(b);
    a.reset();
    EXPECT_EQ(pool.stats().in_use, 1u);
    b.reset();
    b.reset();
    auto stats = pool.stats();
    EXPECT_EQ(stats.in_use, 0u);
    EXPECT_EQ(stats.idle, 1u);
}

TEST_F(SessionPoolTest, DestructorClosesIdleSessions) {
    {
        SessionPool pool(module, 1, 4);
        SessionLease a = pool.acquire();
        SessionLease b = pool.acquire();
        EXPECT_EQ(mock().liveSessions(1), 2);
    }
    EXPECT_EQ(mock().liveSessions(1), 0);
}
