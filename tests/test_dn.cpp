/**
 * @file test_dn.cpp
 * @brief Unit tests for DistinguishedName parsing and scope relations
 */

#include <gtest/gtest.h>
#include <dirmock/dn.h>

using namespace dirmock;

namespace {

DistinguishedName dn(const std::string& text) {
    auto parsed = DistinguishedName::parse(text);
    EXPECT_TRUE(parsed.ok()) << text;
    return parsed.value();
}

} // namespace

// ============================================================================
// Parsing
// ============================================================================

TEST(DistinguishedNameTest, Parse_SimpleDn) {
    auto parsed = dn("cn=alice,ou=people,dc=example,dc=com");
    ASSERT_EQ(parsed.size(), 4u);
    EXPECT_EQ(parsed.leading().attribute, "cn");
    EXPECT_EQ(parsed.leading().value, "alice");
    EXPECT_EQ(parsed.rdns()[3].front().value, "com");
}

TEST(DistinguishedNameTest, Parse_EmptyStringIsRootDn) {
    auto parsed = dn("");
    EXPECT_TRUE(parsed.empty());
    EXPECT_THROW((void)parsed.leading(), std::out_of_range);
}

TEST(DistinguishedNameTest, Parse_SpacesAroundSeparators) {
    auto parsed = dn("cn = alice , dc=example ;dc=com");
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed.leading().value, "alice");
    EXPECT_TRUE(parsed.equalsIgnoreCase(dn("cn=alice,dc=example,dc=com")));
}

TEST(DistinguishedNameTest, Parse_EscapedComma) {
    auto parsed = dn("cn=Smith\\, John,dc=example,dc=com");
    ASSERT_EQ(parsed.size(), 3u);
    EXPECT_EQ(parsed.leading().value, "Smith, John");
}

TEST(DistinguishedNameTest, Parse_HexPairEscape) {
    auto parsed = dn("cn=caf\\C3\\A9,dc=example");
    EXPECT_EQ(parsed.leading().value, "caf\xC3\xA9");
}

TEST(DistinguishedNameTest, Parse_HexStringValueKeptVerbatim) {
    auto parsed = dn("1.3.6.1.4.1.1466.0=#04024869,dc=example");
    EXPECT_EQ(parsed.leading().attribute, "1.3.6.1.4.1.1466.0");
    EXPECT_EQ(parsed.leading().value, "#04024869");
}

TEST(DistinguishedNameTest, Parse_MultiValuedRdn) {
    auto parsed = dn("cn=alice+uid=a1,dc=example");
    ASSERT_EQ(parsed.size(), 2u);
    ASSERT_EQ(parsed.rdns()[0].size(), 2u);
    EXPECT_EQ(parsed.rdns()[0][1].attribute, "uid");
    EXPECT_EQ(parsed.foldedRdns()[0], "cn=alice+uid=a1");
}

TEST(DistinguishedNameTest, Parse_InvalidForms) {
    for (const char* text : {"alice", "=alice", "cn=alice,,dc=com",
                             "cn=trailing\\", "cn=bad\\zz", "cn=#abc", " "}) {
        auto parsed = DistinguishedName::parse(text);
        ASSERT_FALSE(parsed.ok()) << text;
        EXPECT_EQ(parsed.errorKind(), ErrorKind::InvalidDnSyntax) << text;
        EXPECT_EQ(parsed.error().dn, text);
    }
}

TEST(DistinguishedNameTest, Parse_QuotedValue) {
    auto parsed = dn("cn=\"quoted\",dc=x");
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed.leading().value, "quoted");
    EXPECT_EQ(parsed.parentString(), "dc=x");
}

TEST(DistinguishedNameTest, Parse_QuotedSeparatorIsNotParent) {
    auto parsed = dn("cn=\"Smith, John\",dc=x");
    ASSERT_EQ(parsed.size(), 2u);
    EXPECT_EQ(parsed.leading().value, "Smith, John");
    EXPECT_EQ(parsed.parentString(), "dc=x");
}

TEST(DistinguishedNameTest, Parse_BlankStringRejected) {
    auto parsed = DistinguishedName::parse(" ");
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.errorKind(), ErrorKind::InvalidDnSyntax);
}

TEST(DistinguishedNameTest, IsValid) {
    EXPECT_TRUE(DistinguishedName::isValid("dc=com"));
    EXPECT_TRUE(DistinguishedName::isValid("cn=\"quoted\",dc=x"));
    EXPECT_FALSE(DistinguishedName::isValid("not a dn"));
    EXPECT_FALSE(DistinguishedName::isValid(std::string("cn=a\0b", 6)));
}

TEST(DistinguishedNameTest, ParentString) {
    EXPECT_EQ(dn("cn=alice,ou=people,dc=com").parentString(), "ou=people,dc=com");
    EXPECT_EQ(dn("cn=alice , dc=com").parentString(), "dc=com");
    EXPECT_EQ(dn("dc=com").parentString(), "");
    EXPECT_EQ(dn("cn=a\\,b,dc=com").parentString(), "dc=com");
}

// ============================================================================
// Comparison
// ============================================================================

TEST(DistinguishedNameTest, EqualsIgnoreCase) {
    EXPECT_TRUE(dn("CN=Alice,DC=Example").equalsIgnoreCase(dn("cn=alice,dc=example")));
    EXPECT_TRUE(dn("CN=Alice,DC=Example") == dn("cn=alice,dc=example"));
    EXPECT_TRUE(dn("cn=alice,dc=example") != dn("cn=bob,dc=example"));
    EXPECT_FALSE(dn("cn=alice").equalsIgnoreCase(dn("cn=alice,dc=example")));
}

TEST(DistinguishedNameTest, IsSuffixOf_Subtree) {
    auto base = dn("ou=people,dc=example");
    EXPECT_TRUE(base.isSuffixOf(dn("ou=people,dc=example")));
    EXPECT_TRUE(base.isSuffixOf(dn("cn=alice,OU=People,dc=example")));
    EXPECT_TRUE(base.isSuffixOf(dn("cn=x,cn=alice,ou=people,dc=example")));
    EXPECT_FALSE(base.isSuffixOf(dn("dc=example")));
    EXPECT_FALSE(base.isSuffixOf(dn("cn=alice,ou=groups,dc=example")));
    EXPECT_TRUE(dn("").isSuffixOf(dn("dc=example")));
}

TEST(DistinguishedNameTest, IsImmediateChildOf_OneLevel) {
    auto base = dn("ou=people,dc=example");
    EXPECT_TRUE(dn("cn=alice,ou=people,dc=example").isImmediateChildOf(base));
    EXPECT_FALSE(dn("cn=x,cn=alice,ou=people,dc=example").isImmediateChildOf(base));
    EXPECT_FALSE(dn("ou=people,dc=example").isImmediateChildOf(base));
}

TEST(DistinguishedNameTest, IsDescendantOf_Strict) {
    auto base = dn("dc=example");
    EXPECT_TRUE(dn("cn=x,ou=people,dc=example").isDescendantOf(base));
    EXPECT_FALSE(dn("dc=example").isDescendantOf(base));
}
