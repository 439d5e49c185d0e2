/**
 * @file test_call_log.cpp
 * @brief Unit tests for CallLog and emulator call recording
 */

#include <gtest/gtest.h>
#include <dirmock/call_log.h>
#include <dirmock/directory_emulator.h>
#include "test_helpers.h"

using namespace dirmock;

TEST(CallLogTest, RecordsInOrder) {
    CallLog log;
    Json::Value args(Json::arrayValue);
    args.append("dc=example");
    log.record("delete_s", args);
    log.record("unbind", Json::Value(Json::arrayValue));

    ASSERT_EQ(log.size(), 2u);
    EXPECT_EQ(log.methodsCalled(), (std::vector<std::string>{"delete_s", "unbind"}));
    EXPECT_EQ(log.records()[0].args[0].asString(), "dc=example");
    EXPECT_TRUE(log.wasCalled("unbind"));
    EXPECT_FALSE(log.wasCalled("search_s"));
}

TEST(CallLogTest, CallsToAndClear) {
    CallLog log;
    log.record("search", Json::Value(Json::arrayValue));
    log.record("result", Json::Value(Json::arrayValue));
    log.record("search", Json::Value(Json::arrayValue));
    EXPECT_EQ(log.callsTo("search").size(), 2u);

    Json::Value json = log.toJson();
    ASSERT_EQ(json.size(), 3u);
    EXPECT_EQ(json[1]["method"].asString(), "result");

    log.clear();
    EXPECT_EQ(log.size(), 0u);
    EXPECT_TRUE(log.methodsCalled().empty());
}

TEST(EmulatorCallRecordingTest, EveryOperationIsRecorded) {
    DirectoryEmulator emulator(test_helpers::sampleSeed());

    emulator.initialize("ldap://localhost/");
    emulator.setOption(LDAP_OPT_PROTOCOL_VERSION, 3);
    (void)emulator.getOption(LDAP_OPT_PROTOCOL_VERSION);
    emulator.startTls();
    (void)emulator.simpleBind(test_helpers::ALICE, "alicepw");
    (void)emulator.whoAmI();
    auto ticket = emulator.search(test_helpers::PEOPLE, SearchScope::OneLevel);
    ASSERT_TRUE(ticket.ok());
    (void)emulator.result(ticket.value());
    (void)emulator.searchImmediate(test_helpers::ROOT, SearchScope::Base);
    (void)emulator.compare(test_helpers::ALICE, "cn", "alice");
    (void)emulator.modify(test_helpers::ALICE, {Modification(ModOp::Add, "mail", "x@y")});
    (void)emulator.add("cn=dave,ou=people,dc=example,dc=com", {{"cn", {"dave"}}});
    (void)emulator.rename("cn=dave,ou=people,dc=example,dc=com", "cn=david");
    (void)emulator.changePassword(test_helpers::ALICE, std::nullopt, "new");
    (void)emulator.remove("cn=david,ou=people,dc=example,dc=com");
    emulator.unbind();
    emulator.unbindSync();

    EXPECT_EQ(emulator.calls().methodsCalled(), (std::vector<std::string>{
        "initialize", "set_option", "get_option", "start_tls_s", "simple_bind_s",
        "whoami_s", "search", "result", "search_s", "compare_s", "modify_s",
        "add_s", "rename_s", "passwd_s", "delete_s", "unbind", "unbind_s"}));
}

TEST(EmulatorCallRecordingTest, ArgumentsAreRecorded) {
    DirectoryEmulator emulator(test_helpers::sampleSeed());
    (void)emulator.searchImmediate(test_helpers::PEOPLE, SearchScope::Subtree, "(cn=alice)",
                                   std::vector<std::string>{"cn", "sn"}, true);
    (void)emulator.modify(test_helpers::ALICE, {Modification(ModOp::Replace, "sn", ValueList{"A", "B"})});

    const auto& records = emulator.calls().records();
    ASSERT_EQ(records.size(), 2u);

    const Json::Value& search = records[0].args;
    EXPECT_EQ(search[0].asString(), test_helpers::PEOPLE);
    EXPECT_EQ(search[1].asString(), "subtree");
    EXPECT_EQ(search[2].asString(), "(cn=alice)");
    EXPECT_EQ(search[3][1].asString(), "sn");
    EXPECT_TRUE(search[4].asBool());

    const Json::Value& modify = records[1].args;
    EXPECT_EQ(modify[0].asString(), test_helpers::ALICE);
    EXPECT_EQ(modify[1][0][0].asString(), "replace");
    EXPECT_EQ(modify[1][0][1].asString(), "sn");
    EXPECT_EQ(modify[1][0][2].size(), 2u);
}

TEST(EmulatorCallRecordingTest, FailedCallsAreStillRecorded) {
    DirectoryEmulator emulator(test_helpers::sampleSeed());
    auto result = emulator.remove("cn=ghost,dc=example,dc=com");
    EXPECT_EQ(result.errorKind(), ErrorKind::NoSuchObject);
    EXPECT_TRUE(emulator.calls().wasCalled("delete_s"));
}

TEST(EmulatorCallRecordingTest, CallLogsAreNotShared) {
    DirectoryEmulator first(test_helpers::sampleSeed());
    DirectoryEmulator second(test_helpers::sampleSeed());
    first.startTls();
    EXPECT_EQ(first.calls().size(), 1u);
    EXPECT_EQ(second.calls().size(), 0u);
}
