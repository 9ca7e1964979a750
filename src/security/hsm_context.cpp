#include "security/hsm_context.h"
#include "security/pkcs11_error.h"
#include "security/token_resolver.h"
#include "utils/logger.h"

#include <cstdlib>
#include <vector>

namespace p11mux { namespace security {

HsmContext::HsmContext(std::shared_ptr<Module> module, CK_SLOT_ID slot, TokenInfo info, uint32_t max_sessions)
    : module_(std::move(module)), default_slot_(slot), token_info_(std::move(info)), max_sessions_(max_sessions) {}

std::shared_ptr<HsmContext> HsmContext::create(const HsmConfig& config, std::shared_ptr<Module> module){
    if(!module){
        throw Pkcs11Exception(ErrorCode::CannotOpenModule, "No PKCS#11 module for " + config.module_path);
    }
    std::vector<CK_SLOT_ID> slots;
    try {
        slots = module->slotList(true);
    } catch(const Pkcs11Exception& e) {
        P11MUX_ERROR("Failed to list PKCS#11 slots: {}", e.what());
        throw;
    }

    TokenMatch match;
    try {
        match = resolveToken(*module, slots, config.token_serial, config.token_label);
    } catch(const Pkcs11Exception& e) {
        P11MUX_ERROR("Failed to find token in any slot: {}", e.what());
        throw;
    }
    P11MUX_INFO("PKCS#11 token '{}' (serial '{}') found in slot {}",
                match.info.label, match.info.serial_number, match.slot);

    std::shared_ptr<HsmContext> ctx(new HsmContext(module, match.slot, match.info, config.max_sessions_per_slot));
    ctx->addSlot(match.slot);

    if(match.info.loginRequired()){
        try {
            ctx->withDefaultSession([&](CK_SESSION_HANDLE session){
                module->login(session, CKU_USER, config.pin);
            });
        } catch(const Pkcs11Exception& e) {
            P11MUX_ERROR("Failed to login into PKCS#11 token: {}", e.what());
            throw;
        }
        P11MUX_INFO("Logged into PKCS#11 token '{}'", match.info.label);
    }
    return ctx;
}

SessionPool& HsmContext::addSlot(CK_SLOT_ID slot){
    std::lock_guard<std::mutex> lock(pools_mtx_);
    auto it = pools_.find(slot);
    if(it == pools_.end()){
        it = pools_.emplace(slot, std::make_unique<SessionPool>(module_, slot, max_sessions_)).first;
    }
    return *it->second;
}

SessionPool& HsmContext::pool(CK_SLOT_ID slot) const {
    std::lock_guard<std::mutex> lock(pools_mtx_);
    auto it = pools_.find(slot);
    if(it == pools_.end()){
        throw Pkcs11Exception(ErrorCode::UnknownSlot, "No session pool for slot " + std::to_string(slot));
    }
    return *it->second;
}

// Configurator

Configurator::Configurator(ModuleFactory factory) : factory_(std::move(factory)) {}

std::shared_ptr<HsmContext> Configurator::configure(const HsmConfig* config){
    std::lock_guard<std::mutex> lock(mtx_);
    if(context_) return context_;
    if(!config){
        throw Pkcs11Exception(ErrorCode::NotConfigured, "PKCS#11 not yet configured");
    }
    config->validate();

    std::shared_ptr<Module> module;
    try {
        module = factory_(config->module_path);
    } catch(const Pkcs11Exception& e) {
        P11MUX_ERROR("Could not open PKCS#11 library {}: {}", config->module_path, e.what());
        throw;
    }
    if(!module){
        throw Pkcs11Exception(ErrorCode::CannotOpenModule, "Could not open PKCS#11 library: " + config->module_path);
    }
    P11MUX_INFO("PKCS#11 library {} loaded", config->module_path);

    context_ = HsmContext::create(*config, std::move(module));
    return context_;
}

std::shared_ptr<HsmContext> Configurator::configureFromFile(const std::string& path){
    if(auto existing = current()) return existing;
    HsmConfig config;
    try {
        config = HsmConfig::loadFromFile(path);
        config.applyEnvironmentOverrides();
    } catch(const Pkcs11Exception& e) {
        P11MUX_ERROR("Could not load PKCS#11 configuration: {}", e.what());
        throw;
    }
    return configure(&config);
}

std::shared_ptr<HsmContext> Configurator::current() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return context_;
}

bool Configurator::isConfigured() const {
    return current() != nullptr;
}

namespace {

Configurator& processConfigurator(){
    static Configurator instance;
    return instance;
}

} // namespace

std::shared_ptr<HsmContext> configure(const HsmConfig* config){
    return processConfigurator().configure(config);
}

std::shared_ptr<HsmContext> configureFromFile(const std::string& path){
    return processConfigurator().configureFromFile(path);
}

std::shared_ptr<HsmContext> currentContext(){
    return processConfigurator().current();
}

std::shared_ptr<HsmContext> bootstrapFromEnvironment(){
    const char* path = std::getenv("P11MUX_CONFIG_PATH");
    if(!path) return nullptr;
    P11MUX_INFO("Configuring PKCS#11 from {}", path);
    return configureFromFile(path);
}

} } // namespace p11mux::security
