// p11mux_probe: configure the PKCS#11 layer and report what it found
//
// Usage:
//   p11mux_probe --config /etc/p11mux.yaml [--random 16] [--log-level debug]
//   P11MUX_CONFIG_PATH=/etc/p11mux.json p11mux_probe

#include "security/hsm_context.h"
#include "security/pkcs11_error.h"
#include "security/random_source.h"
#include "utils/logger.h"

#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace p11mux;

namespace {

std::string toHex(const std::vector<uint8_t>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::string> config_path;
    size_t random_bytes = 0;
    utils::Logger::Level level = utils::Logger::Level::INFO;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--random" && i + 1 < argc) {
            random_bytes = static_cast<size_t>(std::strtoul(argv[++i], nullptr, 10));
        } else if (arg == "--log-level" && i + 1 < argc) {
            level = utils::Logger::levelFromString(argv[++i]);
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: " << argv[0] << " [options]\n"
                      << "Options:\n"
                      << "  --config FILE     JSON or YAML configuration (default: $P11MUX_CONFIG_PATH)\n"
                      << "  --random N        Print N random bytes from the token\n"
                      << "  --log-level LVL   trace, debug, info, warn, error, critical\n"
                      << "  --help, -h        Show this help message\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            return 2;
        }
    }

    utils::Logger::init("", level);

    std::shared_ptr<security::HsmContext> ctx;
    try {
        ctx = config_path ? security::configureFromFile(*config_path)
                          : security::bootstrapFromEnvironment();
    } catch (const security::Pkcs11Exception& e) {
        P11MUX_CRITICAL("PKCS#11 configuration failed ({}): {}", security::errorCodeName(e.code()), e.what());
        utils::Logger::shutdown();
        return 1;
    }
    if (!ctx) {
        P11MUX_ERROR("No configuration: pass --config or set P11MUX_CONFIG_PATH");
        utils::Logger::shutdown();
        return 1;
    }

    const auto& info = ctx->tokenInfo();
    std::cout << "module:        " << ctx->module()->path() << "\n"
              << "slot:          " << ctx->defaultSlot() << "\n"
              << "token label:   " << info.label << "\n"
              << "token serial:  " << info.serial_number << "\n"
              << "manufacturer:  " << info.manufacturer_id << "\n"
              << "model:         " << info.model << "\n"
              << "login needed:  " << (info.loginRequired() ? "yes" : "no") << "\n";

    int rc = 0;
    if (random_bytes > 0) {
        try {
            std::cout << "random:        " << toHex(security::generateRandom(*ctx, random_bytes)) << "\n";
        } catch (const security::Pkcs11Exception& e) {
            P11MUX_ERROR("Random data failed: {}", e.what());
            rc = 1;
        }
    }

    auto stats = ctx->pool(ctx->defaultSlot()).stats();
    std::cout << "sessions:      " << stats.opened << " open, " << stats.idle << " idle, max "
              << stats.max_sessions << "\n";

    utils::Logger::shutdown();
    return rc;
}
