// Example: many threads signing through one key handle
//
// Every thread calls PrivateKeyHandle::sign(); the context hands each call
// its own session, so no more than maxSessionsPerSlot sessions are ever open
// and no session is used by two threads at once.
//
//   P11MUX_CONFIG_PATH=/etc/p11mux.yaml ./concurrent_signing signing-key

#include "security/hsm_context.h"
#include "security/key_store.h"
#include "security/pkcs11_error.h"
#include "utils/logger.h"

#include <openssl/sha.h>

#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using namespace p11mux;

int main(int argc, char* argv[]) {
    std::string label = argc > 1 ? argv[1] : "signing-key";
    utils::Logger::init("", utils::Logger::Level::INFO);

    try {
        // 1. Configure once for the whole process
        auto ctx = security::bootstrapFromEnvironment();
        if (!ctx) {
            std::cerr << "Set P11MUX_CONFIG_PATH to a configuration file\n";
            return 1;
        }

        // 2. Look the key up; its public half is cached in the handle
        auto key = security::findKeyPair(*ctx, {}, label);
        std::cout << "Key '" << key.label() << "' (" << key.publicKey().bits() << " bits)\n";

        CK_MECHANISM_TYPE mech = key.keyType() == CKK_EC ? CKM_ECDSA : CKM_SHA256_RSA_PKCS;

        // 3. Sign from several threads
        std::atomic<int> signatures{0};
        std::atomic<int> failures{0};
        std::vector<std::thread> workers;
        for (int t = 0; t < 16; ++t) {
            workers.emplace_back([&, t]() {
                for (int i = 0; i < 50; ++i) {
                    std::string msg = "message " + std::to_string(t) + "/" + std::to_string(i);
                    std::vector<uint8_t> input(msg.begin(), msg.end());
                    if (mech == CKM_ECDSA) {
                        std::vector<uint8_t> digest(SHA256_DIGEST_LENGTH);
                        SHA256(input.data(), input.size(), digest.data());
                        input = std::move(digest);
                    }
                    try {
                        key.sign(*ctx, mech, input);
                        ++signatures;
                    } catch (const security::Pkcs11Exception& e) {
                        P11MUX_WARN("Sign failed: {}", e.what());
                        ++failures;
                    }
                }
            });
        }
        for (auto& w : workers) w.join();

        // 4. Pool statistics
        auto stats = ctx->pool(key.object().slot).stats();
        std::cout << signatures.load() << " signatures, " << failures.load() << " failures\n"
                  << "sessions opened: " << stats.opened << " (max " << stats.max_sessions << ")\n"
                  << "peak in use:     " << stats.peak_in_use << "\n"
                  << "waits:           " << stats.waits << "\n";
    } catch (const security::Pkcs11Exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
