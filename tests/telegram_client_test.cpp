#include <gtest/gtest.h>
#include "test_base.hpp"
#include "web/telegram_client.hpp"

class TelegramClientTest : public TestBase
{
};

TEST_F(TelegramClientTest, MethodPathEmbedsToken)
{
    config_.bot_token = "123:abc";
    TelegramClient client(config_);

    EXPECT_EQ(client.methodPath("sendMessage"), "/bot123:abc/sendMessage");
    EXPECT_EQ(client.methodPath("getUpdates"), "/bot123:abc/getUpdates");
}

TEST_F(TelegramClientTest, ParseUpdatesKeepsTextMessages)
{
    auto body = nlohmann::json::parse(R"({
        "ok": true,
        "result": [
            {
                "update_id": 100,
                "message": {
                    "message_id": 7,
                    "from": {"id": 1, "username": "alice"},
                    "chat": {"id": -5001, "type": "group"},
                    "text": "https://vm.tiktok.com/abc/"
                }
            },
            {
                "update_id": 101,
                "message": {
                    "message_id": 8,
                    "chat": {"id": -5001, "type": "group"},
                    "photo": []
                }
            },
            {
                "update_id": 102,
                "edited_message": {"message_id": 7, "chat": {"id": -5001}, "text": "edited"}
            },
            {
                "update_id": 103,
                "message": {
                    "message_id": 9,
                    "chat": {"id": 42, "type": "private"},
                    "text": "/help"
                }
            }
        ]
    })");

    std::vector<TelegramMessage> messages;
    int64_t next_offset = 0;
    ASSERT_TRUE(TelegramClient::parseUpdates(body, messages, next_offset));

    EXPECT_EQ(next_offset, 104);
    ASSERT_EQ(messages.size(), 2u);

    EXPECT_EQ(messages[0].update_id, 100);
    EXPECT_EQ(messages[0].message_id, 7);
    EXPECT_EQ(messages[0].chat_id, -5001);
    EXPECT_EQ(messages[0].from_username, "alice");
    EXPECT_EQ(messages[0].text, "https://vm.tiktok.com/abc/");

    EXPECT_EQ(messages[1].chat_id, 42);
    EXPECT_EQ(messages[1].from_username, "");
    EXPECT_EQ(messages[1].text, "/help");
}

TEST_F(TelegramClientTest, ParseUpdatesKeepsOffsetWhenEmpty)
{
    auto body = nlohmann::json::parse(R"({"ok": true, "result": []})");

    std::vector<TelegramMessage> messages;
    int64_t next_offset = 55;
    ASSERT_TRUE(TelegramClient::parseUpdates(body, messages, next_offset));
    EXPECT_EQ(next_offset, 55);
    EXPECT_TRUE(messages.empty());
}

TEST_F(TelegramClientTest, ParseUpdatesRejectsErrorResponses)
{
    std::vector<TelegramMessage> messages;
    int64_t next_offset = 0;

    EXPECT_FALSE(TelegramClient::parseUpdates(nlohmann::json::parse(R"({"ok": false, "description": "Unauthorized"})"),
                                              messages, next_offset));
    EXPECT_FALSE(TelegramClient::parseUpdates(nlohmann::json::parse(R"({"ok": true, "result": {}})"),
                                              messages, next_offset));
    EXPECT_FALSE(TelegramClient::parseUpdates(nlohmann::json::array(), messages, next_offset));
    EXPECT_TRUE(messages.empty());
}

TEST_F(TelegramClientTest, UnreadableFileIsIoErrorBeforeAnyRequest)
{
    config_.bot_token = "123:abc";
    TelegramClient client(config_);

    RelayResult video = client.sendVideo(1, getTestFilesDir() + "/gone.mp4");
    EXPECT_FALSE(video.success);
    EXPECT_EQ(video.error.kind, RelayErrorKind::IO);

    TelegramChatDelivery delivery(client, 1);
    RelayResult photo = delivery.deliver(MediaKind::IMAGE, getTestFilesDir() + "/gone.jpg");
    EXPECT_EQ(photo.error.kind, RelayErrorKind::IO);
    EXPECT_EQ(delivery.chatId(), 1);
}

TEST_F(TelegramClientTest, PayloadWithInvalidUtf8StillSerializes)
{
    nlohmann::json payload = {{"chat_id", 42}, {"text", std::string("caf\xE9")}};

    std::string body;
    ASSERT_NO_THROW(body = TelegramClient::serializePayload(payload));

    auto parsed = nlohmann::json::parse(body);
    EXPECT_EQ(parsed["chat_id"].get<int64_t>(), 42);
    EXPECT_EQ(parsed["text"].get<std::string>(), "caf\xEF\xBF\xBD");
}

TEST_F(TelegramClientTest, ValidPayloadSerializesUnchanged)
{
    nlohmann::json payload = {{"text", "caf\xC3\xA9"}};
    EXPECT_EQ(TelegramClient::serializePayload(payload), payload.dump());
}
