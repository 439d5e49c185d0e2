/**
 * @file test_entry.cpp
 * @brief Unit tests for Entry value-list semantics
 */

#include <gtest/gtest.h>
#include <dirmock/entry.h>

using namespace dirmock;

TEST(EntryTest, FromAttributes_SkipsEmptyAndDeduplicates) {
    auto entry = Entry::fromAttributes({
        {"cn", {"alice", "al", "alice"}},
        {"description", {}},
    });
    ASSERT_TRUE(entry.has("cn"));
    EXPECT_EQ(*entry.values("cn"), (ValueList{"alice", "al"}));
    EXPECT_FALSE(entry.has("description"));
    EXPECT_EQ(entry.size(), 1u);
}

TEST(EntryTest, AttributeNamesAreCaseInsensitive) {
    auto entry = Entry::fromAttributes({{"objectClass", {"person"}}});
    EXPECT_TRUE(entry.has("OBJECTCLASS"));
    ASSERT_NE(entry.values("objectclass"), nullptr);
    EXPECT_EQ(entry.values("objectclass")->front(), "person");
    EXPECT_EQ(entry.values("missing"), nullptr);
}

TEST(EntryTest, AddValues_SetUnionKeepsOrder) {
    Entry entry;
    entry.addValues("mail", {"a@x", "b@x"});
    entry.addValues("MAIL", {"b@x", "c@x", "c@x"});
    EXPECT_EQ(*entry.values("mail"), (ValueList{"a@x", "b@x", "c@x"}));
}

TEST(EntryTest, RemoveValues_DropsAttributeWhenEmpty) {
    auto entry = Entry::fromAttributes({{"cn", {"alice", "al"}}});
    entry.removeValues("cn", {"alice", "unknown"});
    EXPECT_EQ(*entry.values("cn"), ValueList{"al"});
    entry.removeValues("cn", {"al"});
    EXPECT_FALSE(entry.has("cn"));
    EXPECT_TRUE(entry.empty());
}

TEST(EntryTest, ReplaceValues) {
    auto entry = Entry::fromAttributes({{"sn", {"old"}}});
    entry.replaceValues("sn", {"new", "new", "newer"});
    EXPECT_EQ(*entry.values("sn"), (ValueList{"new", "newer"}));
    entry.replaceValues("sn", {});
    EXPECT_FALSE(entry.has("sn"));
    entry.replaceValues("absent", {});
    EXPECT_FALSE(entry.has("absent"));
}

TEST(EntryTest, RemoveAttribute) {
    auto entry = Entry::fromAttributes({{"cn", {"alice"}}, {"sn", {"L"}}});
    entry.removeAttribute("CN");
    entry.removeAttribute("nothing");
    EXPECT_FALSE(entry.has("cn"));
    EXPECT_TRUE(entry.has("sn"));
}

TEST(EntryTest, Project_CaseInsensitiveAllowList) {
    auto entry = Entry::fromAttributes({{"cn", {"alice"}}, {"sn", {"L"}}, {"mail", {"a@x"}}});
    auto projected = entry.project({"CN", "mail", "nonexistent"});
    EXPECT_EQ(projected.size(), 2u);
    EXPECT_EQ(projected.count("cn"), 1u);
    EXPECT_EQ(projected.count("mail"), 1u);
    EXPECT_TRUE(entry.project({}).empty());
}

TEST(EntryTest, StripValues_KeepsNames) {
    auto entry = Entry::fromAttributes({{"cn", {"alice"}}, {"sn", {"L"}}});
    auto stripped = stripValues(entry.attributes());
    ASSERT_EQ(stripped.size(), 2u);
    EXPECT_TRUE(stripped.at("cn").empty());
    EXPECT_TRUE(stripped.at("sn").empty());
}
