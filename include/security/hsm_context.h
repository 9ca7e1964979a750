#pragma once

#include "security/cryptoki.h"
#include "security/hsm_config.h"
#include "security/pkcs11_module.h"
#include "security/session_pool.h"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace p11mux {
namespace security {

/**
 * HSM Context
 *
 * Everything needed to run operations against one configured token: the
 * loaded module, the slot holding the token, the token's flags and one
 * SessionPool per slot in use. The module handle and slot ids never change
 * after create(); only the pools' internal state does.
 *
 * Thread Safety: all methods are thread-safe.
 *
 * Example Usage:
 * ```cpp
 * HsmConfig config;
 * config.module_path = "/usr/lib/softhsm/libsofthsm2.so";
 * config.token_label = "signing";
 * config.pin = "1234";
 *
 * auto ctx = HsmContext::create(config, Module::load(config.module_path));
 * ctx->withDefaultSession([&](CK_SESSION_HANDLE s) { ... });
 * ```
 */
class HsmContext {
public:
    /**
     * Resolve the token, create its session pool and log in if required
     *
     * @throws Pkcs11Exception(ErrorCode::TokenNotFound) if no slot matches
     * @throws Pkcs11Exception(ErrorCode::ModuleError) if enumeration, session open or login fails
     */
    static std::shared_ptr<HsmContext> create(const HsmConfig& config, std::shared_ptr<Module> module);

    HsmContext(const HsmContext&) = delete;
    HsmContext& operator=(const HsmContext&) = delete;

    const std::shared_ptr<Module>& module() const { return module_; }
    CK_SLOT_ID defaultSlot() const { return default_slot_; }
    CK_FLAGS tokenFlags() const { return token_info_.flags; }
    const TokenInfo& tokenInfo() const { return token_info_; }
    uint32_t maxSessionsPerSlot() const { return max_sessions_; }

    /**
     * Create a pool for another slot of the same module; no-op if present
     */
    SessionPool& addSlot(CK_SLOT_ID slot);

    /**
     * @throws Pkcs11Exception(ErrorCode::UnknownSlot) if no pool exists for slot
     */
    SessionPool& pool(CK_SLOT_ID slot) const;

    /**
     * Run fn with exclusive use of a session on slot; see SessionPool::withSession
     */
    template<typename Fn>
    std::invoke_result_t<Fn&, CK_SESSION_HANDLE> withSession(CK_SLOT_ID slot, Fn&& fn) const {
        return pool(slot).withSession(std::forward<Fn>(fn));
    }

    template<typename Fn>
    std::invoke_result_t<Fn&, CK_SESSION_HANDLE> withDefaultSession(Fn&& fn) const {
        return withSession(default_slot_, std::forward<Fn>(fn));
    }

private:
    HsmContext(std::shared_ptr<Module> module, CK_SLOT_ID slot, TokenInfo info, uint32_t max_sessions);

    std::shared_ptr<Module> module_;
    const CK_SLOT_ID default_slot_;
    const TokenInfo token_info_;
    const uint32_t max_sessions_;

    mutable std::mutex pools_mtx_;
    std::map<CK_SLOT_ID, std::unique_ptr<SessionPool>> pools_;
};

/**
 * Single-initialization guard for an HsmContext
 *
 * The first successful configure() wins. Later calls return the same
 * context and ignore their configuration entirely. A failed attempt leaves
 * the configurator unconfigured, so it can be retried.
 */
class Configurator {
public:
    using ModuleFactory = std::function<std::shared_ptr<Module>(const std::string& path)>;

    explicit Configurator(ModuleFactory factory = &Module::load);

    /**
     * @param config nullptr asks for the existing context
     * @throws Pkcs11Exception(ErrorCode::NotConfigured) if config is nullptr and nothing is configured
     * @throws Pkcs11Exception for any failure of the first configuration
     */
    std::shared_ptr<HsmContext> configure(const HsmConfig* config);

    /**
     * Load a JSON/YAML configuration file and configure from it. When
     * already configured the file is not read.
     */
    std::shared_ptr<HsmContext> configureFromFile(const std::string& path);

    // nullptr until configured
    std::shared_ptr<HsmContext> current() const;
    bool isConfigured() const;

private:
    ModuleFactory factory_;
    mutable std::mutex mtx_;
    std::shared_ptr<HsmContext> context_;
};

// Process-wide configuration, backed by one lazily created Configurator
std::shared_ptr<HsmContext> configure(const HsmConfig* config);
std::shared_ptr<HsmContext> configureFromFile(const std::string& path);
std::shared_ptr<HsmContext> currentContext();

/**
 * Configure from the file named by P11MUX_CONFIG_PATH, if set
 *
 * Meant to be called once by the host during startup.
 * @return nullptr if the variable is not set
 * @throws Pkcs11Exception if the file cannot be loaded or applied
 */
std::shared_ptr<HsmContext> bootstrapFromEnvironment();

} // namespace security
} // namespace p11mux
