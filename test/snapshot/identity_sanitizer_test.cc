#include <gtest/gtest.h>
#include "../../src/snapshot/identity_sanitizer.h"

using namespace Authmap;

class IdentitySanitizerTest : public ::testing::Test {
protected:
    static RawIdentityRow MakeRow(IdentityId id, const std::string& login, const std::string& dn,
                              const std::string& credential,
                              const std::string& forename = "Jane", const std::string& surname = "Doe") {
        RawIdentityRow row;
        row.id = id;
        row.login = login;
        row.forename = forename;
        row.surname = surname;
        row.dn = dn;
        row.credential = credential;
        return row;
    }

    IdentitySanitizer sanitizer_;
};

TEST_F(IdentitySanitizerTest, KeepsValidRecord) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(3, " Alice ", " /O=Org/CN=Jane Doe ", "hash"));

    ASSERT_TRUE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kNone);
    EXPECT_FALSE(result.locked);
    EXPECT_EQ(result.record->id, 3);
    EXPECT_EQ(result.record->login, "alice");
    EXPECT_EQ(result.record->name, "Jane Doe");
    EXPECT_EQ(result.record->dn, "/O=Org/CN=Jane Doe");
    EXPECT_EQ(result.record->credential, "hash");
    EXPECT_TRUE(result.record->roles.empty());
}

TEST_F(IdentitySanitizerTest, DigitOnlyDnIsCleared) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "123456", "hash"));
    ASSERT_TRUE(result.kept());
    EXPECT_EQ(result.record->dn, "");
}

TEST_F(IdentitySanitizerTest, EmptyCommonNameIsUnsafe) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "/O=Org/CN=", "hash"));
    EXPECT_FALSE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kUnsafe);
}

TEST_F(IdentitySanitizerTest, EmptyCredentialIsLocked) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "", ""));
    ASSERT_TRUE(result.kept());
    EXPECT_TRUE(result.locked);
    EXPECT_EQ(result.record->credential, "*");
}

TEST_F(IdentitySanitizerTest, ServiceAccountSurvivesLockSentinel) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "svc@host.org", "/O=Org/CN=svc", "*"));
    ASSERT_TRUE(result.kept());
    EXPECT_FALSE(result.locked);
    EXPECT_EQ(result.record->credential, "*");
}

TEST_F(IdentitySanitizerTest, LockedPersonIsDeactivated) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "", "*"));
    EXPECT_FALSE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kDeactivated);
}

TEST_F(IdentitySanitizerTest, EmailLoginWithoutDnIsDeactivated) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "svc@host.org", "", "*"));
    EXPECT_FALSE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kDeactivated);
}

TEST_F(IdentitySanitizerTest, RemovedCredentialIsDeactivated) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "/O=Org/CN=Jane", "Removed 2019"));
    EXPECT_FALSE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kDeactivated);
}

TEST_F(IdentitySanitizerTest, ControlCharacterInLoginIsUnsafe) {
    // Everything else about this row would make it a service account.
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "s\x01vc@host.org", "/O=Org/CN=svc", "*"));
    EXPECT_FALSE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kUnsafe);
}

TEST_F(IdentitySanitizerTest, ControlCharacterInNameIsUnsafe) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "", "hash", "Ja\nne", "Doe"));
    EXPECT_FALSE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kUnsafe);
}

TEST_F(IdentitySanitizerTest, MalformedLoginIsUnsafe) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, " Foo.Bar ", "", "hash"));
    EXPECT_FALSE(result.kept());
    EXPECT_EQ(result.reason, DiscardReason::kUnsafe);
}

TEST_F(IdentitySanitizerTest, UnsafeWinsOverDeactivated) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "/O=Org/CN=", "*"));
    EXPECT_EQ(result.reason, DiscardReason::kUnsafe);
}

TEST_F(IdentitySanitizerTest, NullFieldsAreEmpty) {
    RawIdentityRow row;
    row.id = 12;

    SanitizeResult result = sanitizer_.Sanitize(row);

    // Empty login passes the login rule, so the row is kept and locked.
    ASSERT_TRUE(result.kept());
    EXPECT_TRUE(result.locked);
    EXPECT_EQ(result.record->login, "");
    EXPECT_EQ(result.record->name, "");
    EXPECT_EQ(result.record->dn, "");
    EXPECT_EQ(result.record->credential, "*");
}

TEST_F(IdentitySanitizerTest, NameFromSurnameOnly) {
    SanitizeResult result = sanitizer_.Sanitize(MakeRow(1, "alice", "", "hash", "", "Doe"));
    ASSERT_TRUE(result.kept());
    EXPECT_EQ(result.record->name, "Doe");
}

TEST_F(IdentitySanitizerTest, VerboseModeStillReturnsDecision) {
    IdentitySanitizer verbose(true);
    EXPECT_EQ(verbose.Sanitize(MakeRow(1, "alice", "", "*")).reason, DiscardReason::kDeactivated);
    EXPECT_TRUE(verbose.Sanitize(MakeRow(2, "bob", "", "")).locked);
}

TEST(DiscardReasonTest, Names) {
    EXPECT_STREQ(DiscardReasonName(DiscardReason::kUnsafe), "unsafe");
    EXPECT_STREQ(DiscardReasonName(DiscardReason::kDeactivated), "deactivated");
}

TEST_F(IdentitySanitizerTest, VeryLongFieldsStillGetADecision) {
    const std::string long_login(600 * 1024, 'a');
    const std::string long_dn = "/O=Org/CN=" + std::string(600 * 1024, 'x');

    SanitizeResult kept = sanitizer_.Sanitize(MakeRow(1, long_login, long_dn, "hash"));
    ASSERT_TRUE(kept.kept());
    EXPECT_EQ(kept.record->login.size(), long_login.size());
    EXPECT_EQ(kept.record->dn, long_dn);

    SanitizeResult bad_dn = sanitizer_.Sanitize(MakeRow(2, "alice", long_dn + "/", "hash"));
    EXPECT_EQ(bad_dn.reason, DiscardReason::kUnsafe);

    SanitizeResult bad_login = sanitizer_.Sanitize(MakeRow(3, long_login + "!", "", "hash"));
    EXPECT_EQ(bad_login.reason, DiscardReason::kUnsafe);
}
