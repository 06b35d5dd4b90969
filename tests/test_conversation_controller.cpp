#include <gtest/gtest.h>

#include "parley/controller/ConversationController.hpp"
#include "parley/services/ChatService.hpp"
#include "parley/services/ConversationStore.hpp"
#include "TestSupport.hpp"

using namespace parley;
using namespace std::chrono_literals;

namespace {

class ConversationControllerTest : public ::testing::Test {
protected:
    ConversationControllerTest()
        : clock(fakes::local_noon(2026, 6, 17)),
          store(services::StoreLimits{}, clock, ids),
          chatService(store, responder, ids),
          controller(store, chatService, clock) {}

    fakes::ManualClock clock;
    fakes::SequentialIdGenerator ids;
    fakes::FakeResponder responder;
    services::ConversationStore store;
    services::ChatService chatService;
    controller::ConversationController controller;
};

} // namespace

TEST_F(ConversationControllerTest, ChatRequiresUserAndMessage) {
    EXPECT_EQ(controller.chat({{"message", "hi"}}).status, 400);
    EXPECT_EQ(controller.chat({{"userId", "u1"}}).status, 400);
    EXPECT_EQ(controller.chat({{"userId", "u1"}, {"message", 5}}).status, 400);
    EXPECT_EQ(controller.chat(nlohmann::json::array()).status, 400);
    EXPECT_TRUE(responder.requests.empty());
}

TEST_F(ConversationControllerTest, ChatReturnsReplyAndConversationInfo) {
    auto result = controller.chat({{"userId", "u1"}, {"chatId", "c1"}, {"message", "Need an FSSAI license?"}});

    ASSERT_EQ(result.status, 200);
    EXPECT_EQ(result.body["success"], true);
    EXPECT_EQ(result.body["chatId"], "c1");
    EXPECT_EQ(result.body["message"], "Reply to: Need an FSSAI license?");
    EXPECT_EQ(result.body["type"], "guidance");
    EXPECT_EQ(result.body["chat"]["title"], "Need an FSSAI license");
    EXPECT_EQ(result.body["chat"]["messageCount"], 2);
}

TEST_F(ConversationControllerTest, ChatResponderFailureIsGenericServerError) {
    responder.fail = true;
    auto result = controller.chat({{"userId", "u1"}, {"chatId", "c1"}, {"message", "hello"}});

    EXPECT_EQ(result.status, 500);
    EXPECT_EQ(result.body["success"], false);
    EXPECT_TRUE(result.body.contains("message"));
    EXPECT_TRUE(store.has_conversation("u1", "c1"));
}

TEST_F(ConversationControllerTest, ListChatsGroupsByRecency) {
    store.append_message("u1", "old", "user", "old question");
    clock.advance(26h);
    store.append_message("u1", "recent", "user", "recent question");

    EXPECT_EQ(controller.listChats("").status, 400);

    auto result = controller.listChats("u1");
    ASSERT_EQ(result.status, 200);
    EXPECT_EQ(result.body["totalChats"], 2);
    EXPECT_EQ(result.body["allChats"][0]["id"], "recent");
    EXPECT_EQ(result.body["groupedChats"]["today"].size(), 1u);
    EXPECT_EQ(result.body["groupedChats"]["yesterday"].size(), 1u);
    EXPECT_EQ(result.body["groupedChats"]["yesterday"][0]["id"], "old");
}

TEST_F(ConversationControllerTest, GetChatMapsMissingToNotFound) {
    store.append_message("u1", "c1", "user", "hello");

    EXPECT_EQ(controller.getChat("", "c1").status, 400);
    EXPECT_EQ(controller.getChat("u1", "").status, 400);
    EXPECT_EQ(controller.getChat("u2", "c1").status, 404);

    auto result = controller.getChat("u1", "c1");
    ASSERT_EQ(result.status, 200);
    EXPECT_EQ(result.body["chat"]["id"], "c1");
    EXPECT_EQ(result.body["chat"]["messages"][0]["content"], "hello");
}

TEST_F(ConversationControllerTest, DeleteChatReportsMissing) {
    store.append_message("u1", "c1", "user", "hello");

    EXPECT_EQ(controller.deleteChat("u1", "").status, 400);
    EXPECT_EQ(controller.deleteChat("u1", "missing").status, 404);
    EXPECT_EQ(controller.deleteChat("u1", "c1").status, 200);
    EXPECT_EQ(controller.deleteChat("u1", "c1").status, 404);
}

TEST_F(ConversationControllerTest, UpdateTitle) {
    store.append_message("u1", "c1", "user", "hello");

    EXPECT_EQ(controller.updateTitle("c1", {{"userId", "u1"}}).status, 400);
    EXPECT_EQ(controller.updateTitle("missing", {{"userId", "u1"}, {"title", "New"}}).status, 404);

    auto result = controller.updateTitle("c1", {{"userId", "u1"}, {"title", "Bakery setup"}});
    ASSERT_EQ(result.status, 200);
    EXPECT_EQ(result.body["title"], "Bakery setup");
    EXPECT_EQ(store.get_conversation("u1", "c1")->title, "Bakery setup");
}

TEST_F(ConversationControllerTest, StatsAndHealth) {
    store.append_message("u1", "c1", "user", "hello");
    store.append_message("u1", "c1", "assistant", "hi");

    auto stats = controller.getStats();
    ASSERT_EQ(stats.status, 200);
    EXPECT_EQ(stats.body["stats"]["totalUsers"], 1);
    EXPECT_EQ(stats.body["stats"]["totalChats"], 1);
    EXPECT_EQ(stats.body["stats"]["totalMessages"], 2);
    EXPECT_EQ(stats.body["stats"]["averageMessagesPerChat"], 2);

    auto health = controller.health();
    EXPECT_EQ(health.status, 200);
    EXPECT_EQ(health.body["status"], "UP");
}
