#include <gtest/gtest.h>
#include "security/token_resolver.h"
#include "security/pkcs11_error.h"
#include "mock/mock_pkcs11_module.h"

using namespace p11mux::security;
using namespace p11mux::mock;

class TokenResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        MockPkcs11Module::instance().reset();
    }

    void addToken(CK_SLOT_ID id, const std::string& label, const std::string& serial,
                  CK_FLAGS flags = CKF_TOKEN_INITIALIZED, CK_RV info_rv = CKR_OK) {
        MockSlot slot;
        slot.id = id;
        slot.label = label;
        slot.serial = serial;
        slot.flags = flags;
        slot.token_info_rv = info_rv;
        MockPkcs11Module::instance().addSlot(slot);
    }

    std::shared_ptr<Module> attach() {
        module = attachMockModule();
        return module;
    }

    std::shared_ptr<Module> module;
};

TEST_F(TokenResolverTest, SerialMatchBeatsLabelMatch) {
    // Slot 3 matches by label and comes first; slot 7 matches by serial
    addToken(3, "signing", "AAAA");
    addToken(7, "backup", "BBBB", CKF_TOKEN_INITIALIZED | CKF_LOGIN_REQUIRED);
    attach();

    auto match = resolveToken(*module, module->slotList(true), "BBBB", "signing");
    EXPECT_EQ(match.slot, 7u);
    EXPECT_EQ(match.info.serial_number, "BBBB");
    EXPECT_TRUE(match.flags & CKF_LOGIN_REQUIRED);
}

TEST_F(TokenResolverTest, FallsBackToLabel) {
    addToken(1, "first", "1111");
    addToken(2, "signing", "2222");
    attach();

    auto match = resolveToken(*module, module->slotList(true), "does-not-exist", "signing");
    EXPECT_EQ(match.slot, 2u);
    EXPECT_EQ(match.info.label, "signing");
}

TEST_F(TokenResolverTest, FirstSlotWinsAmongEqualMatches) {
    addToken(4, "dup", "X1");
    addToken(5, "dup", "X2");
    attach();

    auto match = resolveToken(*module, {5, 4}, "", "dup");
    EXPECT_EQ(match.slot, 5u);
}

TEST_F(TokenResolverTest, MissReportsTokenNotFound) {
    addToken(1, "first", "1111");
    addToken(2, "second", "2222");
    attach();

    try {
        resolveToken(*module, module->slotList(true), "does-not-exist", "");
        FAIL() << "expected TokenNotFound";
    } catch (const Pkcs11Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::TokenNotFound);
    }
}

TEST_F(TokenResolverTest, EmptyCriteriaNeverMatch) {
    // A token with blank label and serial must not be picked by empty criteria
    addToken(1, "", "");
    attach();

    EXPECT_THROW(resolveToken(*module, module->slotList(true), "", ""), Pkcs11Exception);
}

TEST_F(TokenResolverTest, NoSlotsReportsTokenNotFound) {
    attach();
    try {
        resolveToken(*module, {}, "1111", "first");
        FAIL() << "expected TokenNotFound";
    } catch (const Pkcs11Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::TokenNotFound);
    }
}

TEST_F(TokenResolverTest, TokenInfoFailurePropagates) {
    addToken(1, "broken", "0000", CKF_TOKEN_INITIALIZED, CKR_DEVICE_ERROR);
    addToken(2, "signing", "2222");
    attach();

    try {
        resolveToken(*module, module->slotList(true), "", "signing");
        FAIL() << "expected ModuleError";
    } catch (const Pkcs11Exception& e) {
        EXPECT_EQ(e.code(), ErrorCode::ModuleError);
        EXPECT_EQ(e.rv(), static_cast<CK_RV>(CKR_DEVICE_ERROR));
        EXPECT_EQ(e.operation(), "C_GetTokenInfo");
    }
}

TEST_F(TokenResolverTest, SerialMatchStopsBeforeBrokenSlot) {
    addToken(1, "signing", "1111");
    addToken(2, "broken", "0000", CKF_TOKEN_INITIALIZED, CKR_DEVICE_ERROR);
    attach();

    auto match = resolveToken(*module, module->slotList(true), "1111", "");
    EXPECT_EQ(match.slot, 1u);
}

TEST_F(TokenResolverTest, LabelMatchStillChecksLaterSlotsForSerial) {
    // Slot 1 only matches by label, so the broken slot 2 must still be read
    addToken(1, "signing", "1111");
    addToken(2, "broken", "0000", CKF_TOKEN_INITIALIZED, CKR_DEVICE_ERROR);
    attach();

    EXPECT_THROW(resolveToken(*module, module->slotList(true), "2222", "signing"), Pkcs11Exception);
}

TEST_F(TokenResolverTest, PaddedFieldsAreTrimmed) {
    addToken(9, "label with spaces", "SN-42");
    attach();

    auto info = module->tokenInfo(9);
    EXPECT_EQ(info.label, "label with spaces");
    EXPECT_EQ(info.serial_number, "SN-42");
    EXPECT_EQ(info.manufacturer_id, "p11mux");
}
