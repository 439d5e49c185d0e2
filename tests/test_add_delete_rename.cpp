/**
 * @file test_add_delete_rename.cpp
 * @brief Add, delete and rename semantics
 */

#include <gtest/gtest.h>
#include <dirmock/directory_emulator.h>
#include "test_helpers.h"

using namespace dirmock;
using namespace test_helpers;

namespace {

class WriteOperationTest : public ::testing::Test {
protected:
    DirectoryEmulator emulator_{sampleSeed()};

    const Entry* entry(const std::string& dn) const {
        return emulator_.directory().get(dn);
    }
};

const std::string DAVE = "cn=dave,ou=people,dc=example,dc=com";

} // namespace

// ============================================================================
// Add
// ============================================================================

TEST_F(WriteOperationTest, Add_StoresEntry) {
    auto result = emulator_.add(DAVE, {
        {"objectClass", {"top", "person"}},
        {"cn", {"dave", "dave"}},
    });
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().resultType, RES_ADD);

    ASSERT_NE(entry(DAVE), nullptr);
    EXPECT_EQ(*entry(DAVE)->values("cn"), ValueList{"dave"});
    EXPECT_EQ(*entry(DAVE)->values("objectClass"), (ValueList{"top", "person"}));
}

TEST_F(WriteOperationTest, Add_MessageIdIsRecordedCallCount) {
    emulator_.startTls();
    (void)emulator_.compare(ALICE, "cn", "alice");
    auto result = emulator_.add(DAVE, {{"cn", {"dave"}}});
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().messageId, 3);
}

TEST_F(WriteOperationTest, Add_StoresUnderLowerCasedDn) {
    ASSERT_TRUE(emulator_.add("CN=Dave,OU=People,DC=Example,DC=Com", {{"cn", {"Dave"}}}).ok());
    auto keys = emulator_.directory().keys();
    EXPECT_NE(std::find(keys.begin(), keys.end(), DAVE), keys.end());
}

TEST_F(WriteOperationTest, Add_ExistingDnIsAlreadyExists) {
    auto result = emulator_.add(ALICE, {{"cn", {"again"}}});
    EXPECT_EQ(result.errorKind(), ErrorKind::AlreadyExists);
    EXPECT_EQ(*entry(ALICE)->values("cn"), ValueList{"alice"});
}

TEST_F(WriteOperationTest, Add_DnDifferingOnlyInCaseIsAlreadyExists) {
    auto result = emulator_.add("CN=ALICE,ou=People,dc=example,dc=com", {{"cn", {"ALICE"}}});
    EXPECT_EQ(result.errorKind(), ErrorKind::AlreadyExists);
    EXPECT_EQ(emulator_.directory().size(), 7u);
}

TEST_F(WriteOperationTest, Add_EmptyValueListIsProtocolError) {
    auto result = emulator_.add(DAVE, {{"cn", {"dave"}}, {"description", {}}});
    EXPECT_EQ(result.errorKind(), ErrorKind::ProtocolError);
    EXPECT_EQ(entry(DAVE), nullptr);
}

TEST_F(WriteOperationTest, Add_InvalidDnIsInvalidDnSyntax) {
    EXPECT_EQ(emulator_.add("dave", {{"cn", {"dave"}}}).errorKind(), ErrorKind::InvalidDnSyntax);
}

TEST_F(WriteOperationTest, Add_EntryIsSearchable) {
    ASSERT_TRUE(emulator_.add(DAVE, {{"objectClass", {"person"}}, {"cn", {"dave"}}}).ok());
    auto results = emulator_.searchImmediate(PEOPLE, SearchScope::OneLevel, "(cn=dave)");
    ASSERT_TRUE(results.ok());
    EXPECT_EQ(dnsOf(results.value()), std::vector<std::string>{DAVE});
}

// ============================================================================
// Delete
// ============================================================================

TEST_F(WriteOperationTest, Delete_RemovesEntry) {
    auto result = emulator_.remove(BOB);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().resultType, RES_DELETE);
    EXPECT_EQ(entry(BOB), nullptr);
}

TEST_F(WriteOperationTest, Delete_MissingIsNoSuchObject) {
    EXPECT_EQ(emulator_.remove(DAVE).errorKind(), ErrorKind::NoSuchObject);
    ASSERT_TRUE(emulator_.remove(BOB).ok());
    EXPECT_EQ(emulator_.remove(BOB).errorKind(), ErrorKind::NoSuchObject);
}

TEST_F(WriteOperationTest, Delete_IsCaseInsensitive) {
    ASSERT_TRUE(emulator_.remove("CN=Bob,OU=People,DC=Example,DC=Com").ok());
    EXPECT_EQ(entry(BOB), nullptr);
}

TEST_F(WriteOperationTest, Delete_InvalidDn) {
    EXPECT_EQ(emulator_.remove("cn=bob,,dc=com").errorKind(), ErrorKind::InvalidDnSyntax);
}

// ============================================================================
// Rename
// ============================================================================

TEST(RenameTest, MultiValuedRdnAttributeKeepsOtherValues) {
    DirectorySeed seed = {
        {"dc=example,dc=com", {{"dc", {"example"}}}},
        {"cn=alice,dc=example,dc=com", {{"cn", {"alice", "al"}}, {"sn", {"L"}}}},
    };
    DirectoryEmulator emulator(seed);

    auto result = emulator.rename("cn=alice,dc=example,dc=com", "cn=al");
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().resultType, RES_MODRDN);

    EXPECT_EQ(emulator.directory().get("cn=alice,dc=example,dc=com"), nullptr);
    const Entry* renamed = emulator.directory().get("cn=al,dc=example,dc=com");
    ASSERT_NE(renamed, nullptr);
    EXPECT_EQ(*renamed->values("cn"), ValueList{"al"});
    EXPECT_EQ(*renamed->values("sn"), ValueList{"L"});
}

TEST_F(WriteOperationTest, Rename_SameAttributeReplacesValue) {
    ASSERT_TRUE(emulator_.rename(ALICE, "cn=alicia").ok());
    const Entry* renamed = entry("cn=alicia,ou=people,dc=example,dc=com");
    ASSERT_NE(renamed, nullptr);
    EXPECT_EQ(*renamed->values("cn"), ValueList{"alicia"});
    EXPECT_EQ(entry(ALICE), nullptr);
}

TEST_F(WriteOperationTest, Rename_DifferentAttributeDropsSingleValuedOld) {
    ASSERT_TRUE(emulator_.rename(ALICE, "uid=alice").ok());
    const Entry* renamed = entry("uid=alice,ou=people,dc=example,dc=com");
    ASSERT_NE(renamed, nullptr);
    EXPECT_FALSE(renamed->has("cn"));
    EXPECT_EQ(*renamed->values("uid"), ValueList{"alice"});
}

TEST_F(WriteOperationTest, Rename_DifferentAttributeKeepsMultiValuedOld) {
    ASSERT_TRUE(emulator_.modify(ALICE, {Modification(ModOp::Add, "cn", "al")}).ok());
    ASSERT_TRUE(emulator_.rename(ALICE, "uid=alice").ok());
    const Entry* renamed = entry("uid=alice,ou=people,dc=example,dc=com");
    ASSERT_NE(renamed, nullptr);
    EXPECT_EQ(*renamed->values("cn"), ValueList{"al"});
}

TEST_F(WriteOperationTest, Rename_NewValueNotDuplicated) {
    ASSERT_TRUE(emulator_.modify(ALICE, {Modification(ModOp::Add, "uid", "alice")}).ok());
    ASSERT_TRUE(emulator_.rename(ALICE, "uid=alice").ok());
    EXPECT_EQ(*entry("uid=alice,ou=people,dc=example,dc=com")->values("uid"), ValueList{"alice"});
}

TEST_F(WriteOperationTest, Rename_WithNewSuperiorMovesEntry) {
    ASSERT_TRUE(emulator_.rename(ALICE, "cn=alice", std::string("ou=groups,dc=example,dc=com")).ok());
    EXPECT_EQ(entry(ALICE), nullptr);
    ASSERT_NE(entry("cn=alice,ou=groups,dc=example,dc=com"), nullptr);

    auto results = emulator_.searchImmediate("ou=groups,dc=example,dc=com", SearchScope::OneLevel, "(cn=alice)");
    ASSERT_TRUE(results.ok());
    EXPECT_EQ(results.value().size(), 1u);
}

TEST_F(WriteOperationTest, Rename_TargetExistsIsAlreadyExists) {
    auto result = emulator_.rename(ALICE, "cn=bob");
    EXPECT_EQ(result.errorKind(), ErrorKind::AlreadyExists);
    EXPECT_NE(entry(ALICE), nullptr);
    EXPECT_EQ(*entry(BOB)->values("cn"), ValueList{"bob"});
}

TEST_F(WriteOperationTest, Rename_MissingIsNoSuchObject) {
    EXPECT_EQ(emulator_.rename(DAVE, "cn=david").errorKind(), ErrorKind::NoSuchObject);
}

TEST_F(WriteOperationTest, Rename_InvalidArguments) {
    EXPECT_EQ(emulator_.rename("bad", "cn=x").errorKind(), ErrorKind::InvalidDnSyntax);
    EXPECT_EQ(emulator_.rename(ALICE, "bad").errorKind(), ErrorKind::InvalidDnSyntax);
    EXPECT_EQ(emulator_.rename(ALICE, "cn=x,dc=y").errorKind(), ErrorKind::InvalidDnSyntax);
    EXPECT_EQ(emulator_.rename(ALICE, "cn=x", std::string("bad superior")).errorKind(),
              ErrorKind::InvalidDnSyntax);
    EXPECT_NE(entry(ALICE), nullptr);
}
