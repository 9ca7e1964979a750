#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace p11mux {
namespace security {

/**
 * PKCS#11 configuration
 *
 * A token is chosen by serial number or label; a serial match takes
 * precedence. Supply this to Configurator::configure(), or load it with
 * loadFromFile().
 *
 * JSON form (legacy keys Path/TokenSerial/TokenLabel/Pin/MaxTokenSession
 * are accepted as well):
 * ```json
 * {
 *   "modulePath": "/usr/lib/softhsm/libsofthsm2.so",
 *   "tokenLabel": "signing",
 *   "pin": "1234",
 *   "maxSessionsPerSlot": 8
 * }
 * ```
 */
struct HsmConfig {
    static constexpr uint32_t kDefaultMaxSessionsPerSlot = 1024;

    // Full path to the PKCS#11 library (e.g. /usr/lib/softhsm/libsofthsm2.so)
    std::string module_path;

    // Token serial number
    std::string token_serial;

    // Token label
    std::string token_label;

    // User PIN, only used if the token requires login
    std::string pin;

    // Ceiling for concurrently open sessions on one slot
    uint32_t max_sessions_per_slot = kDefaultMaxSessionsPerSlot;

    /**
     * @throws Pkcs11Exception(ErrorCode::InvalidConfiguration) on wrongly typed fields
     */
    static HsmConfig fromJson(const nlohmann::json& j);

    // The PIN is never serialized
    nlohmann::json toJson() const;

    /**
     * Read a JSON file, or YAML when the name ends in .yaml/.yml
     * @throws Pkcs11Exception(ErrorCode::InvalidConfiguration)
     */
    static HsmConfig loadFromFile(const std::string& path);

    /**
     * P11MUX_HSM_PIN supplies the PIN when none is configured;
     * P11MUX_HSM_SESSION_POOL overrides max_sessions_per_slot.
     */
    void applyEnvironmentOverrides();

    /**
     * @throws Pkcs11Exception(ErrorCode::InvalidConfiguration)
     */
    void validate() const;
};

} // namespace security
} // namespace p11mux
