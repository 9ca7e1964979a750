#include "security/hsm_config.h"
#include "security/pkcs11_error.h"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <fstream>
#include <initializer_list>
#include <limits>

using json = nlohmann::json;

namespace p11mux { namespace security {

namespace {

[[noreturn]] void invalid(const std::string& why){
    throw Pkcs11Exception(ErrorCode::InvalidConfiguration, why);
}

const json* findKey(const json& j, std::initializer_list<const char*> keys){
    for(const char* k : keys){
        auto it = j.find(k);
        if(it != j.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

// Serial numbers and PINs are often all digits; YAML turns those into numbers
std::string stringField(const json& j, std::initializer_list<const char*> keys){
    const json* v = findKey(j, keys);
    if(!v) return "";
    if(v->is_string()) return v->get<std::string>();
    if(v->is_number_integer()) return std::to_string(v->get<long long>());
    invalid(std::string("Configuration field '") + *keys.begin() + "' must be a string");
}

bool endsWith(const std::string& s, const std::string& suffix){
    return s.size() >= suffix.size() && s.compare(s.size()-suffix.size(), suffix.size(), suffix) == 0;
}

json yamlToJson(const YAML::Node& n){
    if(!n || n.IsNull()) return nullptr;
    if(n.IsScalar()){
        // Quoted scalars stay strings
        if(n.Tag() == "!") return n.Scalar();
        bool b; long long i; double d;
        if(YAML::convert<bool>::decode(n, b)) return b;
        if(YAML::convert<long long>::decode(n, i)) return i;
        if(YAML::convert<double>::decode(n, d)) return d;
        return n.Scalar();
    }
    if(n.IsSequence()){
        json arr = json::array();
        for(const auto& it : n) arr.push_back(yamlToJson(it));
        return arr;
    }
    if(n.IsMap()){
        json obj = json::object();
        for(auto it = n.begin(); it != n.end(); ++it){
            obj[it->first.Scalar()] = yamlToJson(it->second);
        }
        return obj;
    }
    return nullptr;
}

} // namespace

HsmConfig HsmConfig::fromJson(const json& j){
    if(!j.is_object()) invalid("Configuration must be a JSON object");
    HsmConfig c;
    c.module_path = stringField(j, {"modulePath", "Path"});
    c.token_serial = stringField(j, {"tokenSerial", "TokenSerial"});
    c.token_label = stringField(j, {"tokenLabel", "TokenLabel"});
    c.pin = stringField(j, {"pin", "Pin"});
    if(const json* m = findKey(j, {"maxSessionsPerSlot", "MaxTokenSession"})){
        if(!m->is_number_integer()) invalid("maxSessionsPerSlot must be an integer");
        long long v = m->get<long long>();
        if(v <= 0 || v > std::numeric_limits<uint32_t>::max()){
            invalid("maxSessionsPerSlot must be between 1 and 4294967295");
        }
        c.max_sessions_per_slot = static_cast<uint32_t>(v);
    }
    return c;
}

json HsmConfig::toJson() const {
    return {
        {"modulePath", module_path},
        {"tokenSerial", token_serial},
        {"tokenLabel", token_label},
        {"maxSessionsPerSlot", max_sessions_per_slot}
    };
}

HsmConfig HsmConfig::loadFromFile(const std::string& path){
    json j;
    if(endsWith(path, ".yaml") || endsWith(path, ".yml")){
        try {
            j = yamlToJson(YAML::LoadFile(path));
        } catch(const YAML::Exception& e) {
            invalid("Could not read config file " + path + ": " + e.what());
        }
    } else {
        std::ifstream f(path);
        if(!f.is_open()) invalid("Could not open config file: " + path);
        try {
            f >> j;
        } catch(const json::exception& e) {
            invalid("Could not decode config file " + path + ": " + e.what());
        }
    }
    return fromJson(j);
}

void HsmConfig::applyEnvironmentOverrides(){
    if(pin.empty()){
        if(const char* envPin = std::getenv("P11MUX_HSM_PIN")) pin = envPin;
    }
    if(const char* envPool = std::getenv("P11MUX_HSM_SESSION_POOL")){
        char* end = nullptr;
        unsigned long v = std::strtoul(envPool, &end, 10);
        if(end == envPool || *end != '\0' || v == 0 || v > std::numeric_limits<uint32_t>::max()){
            invalid(std::string("P11MUX_HSM_SESSION_POOL is not a positive integer: ") + envPool);
        }
        max_sessions_per_slot = static_cast<uint32_t>(v);
    }
}

void HsmConfig::validate() const {
    if(module_path.empty()) invalid("modulePath is required");
    if(token_serial.empty() && token_label.empty()) invalid("tokenSerial or tokenLabel is required");
    if(max_sessions_per_slot == 0) invalid("maxSessionsPerSlot must be greater than zero");
}

} } // namespace p11mux::security
