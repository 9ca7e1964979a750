// Session pool throughput benchmark
// Measures withSession() overhead and signing throughput for different
// pool ceilings and thread counts, against the in-process simulated module.
//
// Build:
//   cmake -S . -B build -G Ninja -DP11MUX_BUILD_BENCHMARKS=ON
//   cmake --build build --target bench_session_pool -j
//
// Run:
//   ./build/bench_session_pool --benchmark_filter=Sign

#include <benchmark/benchmark.h>
#include "security/hsm_context.h"
#include "mock/mock_pkcs11_module.h"

#include <map>
#include <mutex>
#include <random>

using namespace p11mux::security;
using namespace p11mux::mock;

namespace {

constexpr CK_SLOT_ID kSlot = 1;

std::mutex g_setupMtx;
CK_OBJECT_HANDLE g_key = CK_INVALID_HANDLE;
std::map<uint32_t, std::shared_ptr<HsmContext>> g_contexts;

// One context per ceiling, shared by all benchmark threads
std::shared_ptr<HsmContext> contextFor(uint32_t ceiling) {
    std::lock_guard<std::mutex> lock(g_setupMtx);
    if (g_key == CK_INVALID_HANDLE) {
        auto& mock = MockPkcs11Module::instance();
        mock.reset();
        MockSlot slot;
        slot.id = kSlot;
        slot.label = "bench";
        slot.serial = "BENCH-0001";
        mock.addSlot(slot);
        MockObject key;
        key.slot = kSlot;
        key.set(CKA_CLASS, CKO_PRIVATE_KEY).set(CKA_KEY_TYPE, CKK_RSA).set(CKA_LABEL, std::string("bench-key"));
        g_key = mock.addObject(key);
    }
    auto& ctx = g_contexts[ceiling];
    if (!ctx) {
        HsmConfig cfg;
        cfg.module_path = "mock";
        cfg.token_label = "bench";
        cfg.max_sessions_per_slot = ceiling;
        ctx = HsmContext::create(cfg, attachMockModule());
    }
    return ctx;
}

std::vector<uint8_t> randomData(size_t size) {
    std::mt19937 rng(42);
    std::vector<uint8_t> data(size);
    for (auto& b : data) b = rng() & 0xFF;
    return data;
}

} // namespace

// Acquire and release only
static void BM_WithSession_Noop(benchmark::State& state) {
    auto ctx = contextFor(static_cast<uint32_t>(state.range(0)));
    for (auto _ : state) {
        auto h = ctx->withDefaultSession([](CK_SESSION_HANDLE s) { return s; });
        benchmark::DoNotOptimize(h);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_WithSession_Noop)->Arg(1)->Arg(4)->Arg(16)->Threads(1)->Threads(4)->Threads(8);

// Sign through the pool
static void BM_Sign(benchmark::State& state) {
    auto ctx = contextFor(static_cast<uint32_t>(state.range(0)));
    auto data = randomData(32);
    CK_MECHANISM mech;
    mech.mechanism = CKM_SHA256_RSA_PKCS;
    mech.pParameter = nullptr;
    mech.ulParameterLen = 0;
    for (auto _ : state) {
        auto sig = ctx->withDefaultSession([&](CK_SESSION_HANDLE s) {
            return ctx->module()->sign(s, mech, g_key, data);
        });
        benchmark::DoNotOptimize(sig);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Sign)->Arg(1)->Arg(2)->Arg(4)->Arg(8)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
