#include "security/pkcs11_module.h"
#include "security/pkcs11_error.h"
#include "utils/logger.h"

#include <algorithm>
#include <cstring>
#include <string>
#include <vector>

#if defined(_WIN32)
    #include <windows.h>
#else
    #include <dlfcn.h>
#endif

namespace p11mux { namespace security {

namespace {

template<size_t N>
std::string trimField(const unsigned char (&field)[N]){
    size_t len = N;
    while(len > 0 && (field[len-1] == ' ' || field[len-1] == '\0')) --len;
    return std::string(reinterpret_cast<const char*>(field), len);
}

void closeLibrary(void* lib){
    if(!lib) return;
#if defined(_WIN32)
    FreeLibrary((HMODULE)lib);
#else
    dlclose(lib);
#endif
}

// Pairs C_FindObjectsInit with C_FindObjectsFinal on every exit path
class FindGuard {
public:
    FindGuard(CK_FUNCTION_LIST_PTR api, CK_SESSION_HANDLE session): api_(api), session_(session) {}
    ~FindGuard(){ api_->C_FindObjectsFinal(session_); }
    FindGuard(const FindGuard&) = delete;
    FindGuard& operator=(const FindGuard&) = delete;
private:
    CK_FUNCTION_LIST_PTR api_;
    CK_SESSION_HANDLE session_;
};

} // namespace

Module::Module(void* lib, CK_FUNCTION_LIST_PTR funcs, std::string path)
    : lib_(lib), funcs_(funcs), path_(std::move(path)) {}

std::shared_ptr<Module> Module::load(const std::string& path){
    if(path.empty()){
        throw Pkcs11Exception(ErrorCode::CannotOpenModule, "PKCS#11 module path is empty");
    }
#if defined(_WIN32)
    void* lib = LoadLibraryA(path.c_str());
    if(!lib){
        throw Pkcs11Exception(ErrorCode::CannotOpenModule, "Could not open PKCS#11 library: " + path);
    }
    auto getFn = (CK_C_GetFunctionList)GetProcAddress((HMODULE)lib, "C_GetFunctionList");
#else
    void* lib = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if(!lib){
        const char* why = dlerror();
        throw Pkcs11Exception(ErrorCode::CannotOpenModule,
                              "Could not open PKCS#11 library: " + path + (why ? std::string(" (") + why + ")" : ""));
    }
    auto getFn = (CK_C_GetFunctionList)dlsym(lib, "C_GetFunctionList");
#endif
    if(!getFn){
        closeLibrary(lib);
        throw Pkcs11Exception(ErrorCode::CannotOpenModule, "C_GetFunctionList not exported by " + path);
    }
    CK_FUNCTION_LIST_PTR funcs = nullptr;
    CK_RV rv = getFn(&funcs);
    if(rv != CKR_OK || !funcs){
        closeLibrary(lib);
        throw Pkcs11Exception(ErrorCode::CannotOpenModule,
                              "C_GetFunctionList failed for " + path + ": " + describeRv(rv),
                              "C_GetFunctionList", rv);
    }
    std::shared_ptr<Module> module(new Module(lib, funcs, path));
    module->initialize();
    return module;
}

std::shared_ptr<Module> Module::attach(CK_FUNCTION_LIST_PTR functions, const std::string& description){
    if(!functions){
        throw Pkcs11Exception(ErrorCode::CannotOpenModule, "PKCS#11 function list is null");
    }
    std::shared_ptr<Module> module(new Module(nullptr, functions, description));
    module->initialize();
    return module;
}

void Module::initialize(){
    CK_C_INITIALIZE_ARGS args;
    std::memset(&args, 0, sizeof(args));
    args.flags = CKF_OS_LOCKING_OK;
    CK_RV rv = funcs_->C_Initialize(&args);
    if(rv == CKR_CRYPTOKI_ALREADY_INITIALIZED){
        P11MUX_WARN("PKCS#11 library {} already initialized by another component", path_);
        owns_initialization_ = false;
        return;
    }
    if(rv != CKR_OK){
        // No C_Finalize for a library we failed to initialize
        funcs_ = nullptr;
        throw Pkcs11Exception(ErrorCode::CannotOpenModule,
                              "Failed to initialize PKCS#11 library " + path_ + ": " + describeRv(rv),
                              "C_Initialize", rv);
    }
    owns_initialization_ = true;
}

Module::~Module(){
    if(funcs_ && owns_initialization_) funcs_->C_Finalize(nullptr);
    closeLibrary(lib_);
    lib_ = nullptr; funcs_ = nullptr;
}

std::vector<CK_SLOT_ID> Module::slotList(bool token_present) const {
    CK_ULONG count = 0;
    checkRv(funcs_->C_GetSlotList(token_present ? CK_TRUE : CK_FALSE, nullptr, &count), "C_GetSlotList");
    std::vector<CK_SLOT_ID> slots(count);
    if(count == 0) return slots;
    checkRv(funcs_->C_GetSlotList(token_present ? CK_TRUE : CK_FALSE, slots.data(), &count), "C_GetSlotList");
    slots.resize(count);
    return slots;
}

TokenInfo Module::tokenInfo(CK_SLOT_ID slot) const {
    CK_TOKEN_INFO raw;
    std::memset(&raw, 0, sizeof(raw));
    checkRv(funcs_->C_GetTokenInfo(slot, &raw), "C_GetTokenInfo");
    TokenInfo info;
    info.label = trimField(raw.label);
    info.serial_number = trimField(raw.serialNumber);
    info.manufacturer_id = trimField(raw.manufacturerID);
    info.model = trimField(raw.model);
    info.flags = raw.flags;
    return info;
}

CK_SESSION_HANDLE Module::openSession(CK_SLOT_ID slot) const {
    CK_SESSION_HANDLE session = CK_INVALID_HANDLE;
    checkRv(funcs_->C_OpenSession(slot, CKF_SERIAL_SESSION | CKF_RW_SESSION, nullptr, nullptr, &session),
            "C_OpenSession");
    return session;
}

CK_RV Module::closeSession(CK_SESSION_HANDLE session) const {
    return funcs_->C_CloseSession(session);
}

void Module::login(CK_SESSION_HANDLE session, CK_USER_TYPE user, const std::string& pin) const {
    CK_RV rv = funcs_->C_Login(session, user,
                               reinterpret_cast<CK_UTF8CHAR_PTR>(const_cast<char*>(pin.data())),
                               static_cast<CK_ULONG>(pin.size()));
    // Login state is per token, so another session may already have done it
    if(rv == CKR_USER_ALREADY_LOGGED_IN) return;
    checkRv(rv, "C_Login");
}

std::vector<CK_OBJECT_HANDLE> Module::findObjects(CK_SESSION_HANDLE session,
                                                  std::vector<CK_ATTRIBUTE>& tmpl,
                                                  size_t max_objects) const {
    checkRv(funcs_->C_FindObjectsInit(session, tmpl.empty() ? nullptr : tmpl.data(),
                                      static_cast<CK_ULONG>(tmpl.size())),
            "C_FindObjectsInit");
    FindGuard guard(funcs_, session);
    std::vector<CK_OBJECT_HANDLE> result;
    CK_OBJECT_HANDLE batch[16];
    while(result.size() < max_objects){
        CK_ULONG want = static_cast<CK_ULONG>(std::min<size_t>(16, max_objects - result.size()));
        CK_ULONG found = 0;
        checkRv(funcs_->C_FindObjects(session, batch, want, &found), "C_FindObjects");
        if(found == 0) break;
        result.insert(result.end(), batch, batch + found);
    }
    return result;
}

std::vector<uint8_t> Module::attributeValue(CK_SESSION_HANDLE session,
                                            CK_OBJECT_HANDLE object,
                                            CK_ATTRIBUTE_TYPE type) const {
    CK_ATTRIBUTE attr;
    attr.type = type; attr.pValue = nullptr; attr.ulValueLen = 0;
    checkRv(funcs_->C_GetAttributeValue(session, object, &attr, 1), "C_GetAttributeValue");
    if(attr.ulValueLen == CK_UNAVAILABLE_INFORMATION){
        checkRv(CKR_ATTRIBUTE_TYPE_INVALID, "C_GetAttributeValue");
    }
    std::vector<uint8_t> value(attr.ulValueLen);
    if(value.empty()) return value;
    attr.pValue = value.data();
    checkRv(funcs_->C_GetAttributeValue(session, object, &attr, 1), "C_GetAttributeValue");
    value.resize(attr.ulValueLen);
    return value;
}

std::vector<uint8_t> Module::sign(CK_SESSION_HANDLE session, CK_MECHANISM& mechanism,
                                  CK_OBJECT_HANDLE key, const std::vector<uint8_t>& data) const {
    checkRv(funcs_->C_SignInit(session, &mechanism, key), "C_SignInit");
    auto input = const_cast<CK_BYTE_PTR>(data.data());
    CK_ULONG sigLen = 0;
    checkRv(funcs_->C_Sign(session, input, static_cast<CK_ULONG>(data.size()), nullptr, &sigLen), "C_Sign");
    std::vector<uint8_t> sig(sigLen);
    checkRv(funcs_->C_Sign(session, input, static_cast<CK_ULONG>(data.size()), sig.data(), &sigLen), "C_Sign");
    sig.resize(sigLen);
    return sig;
}

std::vector<uint8_t> Module::decrypt(CK_SESSION_HANDLE session, CK_MECHANISM& mechanism,
                                     CK_OBJECT_HANDLE key, const std::vector<uint8_t>& ciphertext) const {
    checkRv(funcs_->C_DecryptInit(session, &mechanism, key), "C_DecryptInit");
    auto input = const_cast<CK_BYTE_PTR>(ciphertext.data());
    CK_ULONG outLen = 0;
    checkRv(funcs_->C_Decrypt(session, input, static_cast<CK_ULONG>(ciphertext.size()), nullptr, &outLen), "C_Decrypt");
    std::vector<uint8_t> plain(outLen);
    checkRv(funcs_->C_Decrypt(session, input, static_cast<CK_ULONG>(ciphertext.size()), plain.data(), &outLen), "C_Decrypt");
    plain.resize(outLen);
    return plain;
}

CK_RV Module::generateRandom(CK_SESSION_HANDLE session, uint8_t* out, size_t length) const {
    return funcs_->C_GenerateRandom(session, out, static_cast<CK_ULONG>(length));
}

} } // namespace p11mux::security
