#pragma once

#include "core/media_delivery.hpp"
#include "core/relay_result.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct RelayConfig;
class CommentCatalog;

namespace httplib
{
    class SSLClient;
}

/**
 * @brief Text message received through getUpdates
 */
struct TelegramMessage
{
    int64_t update_id = 0;
    int64_t message_id = 0;
    int64_t chat_id = 0;
    std::string from_username;
    std::string text;
};

/**
 * @brief Minimal Telegram Bot API client over HTTPS
 *
 * Each call opens its own connection, so one client can be shared by the poll
 * loop and every pipeline task.
 */
class TelegramClient
{
public:
    static constexpr const char *NO_SUPPORTED_MEDIA_TEXT = "No supported media found";

    explicit TelegramClient(const RelayConfig &config);
    ~TelegramClient();

    TelegramClient(const TelegramClient &) = delete;
    TelegramClient &operator=(const TelegramClient &) = delete;

    /**
     * @brief Username of the bot owning the token
     */
    RelayResult getMe(std::string &username);

    /**
     * @brief Long-poll for new updates
     * @param offset Identifier of the first update to return
     * @param messages Receives the text messages among the updates
     * @param next_offset Receives the offset for the following call
     */
    RelayResult getUpdates(int64_t offset, std::vector<TelegramMessage> &messages, int64_t &next_offset);

    RelayResult sendMessage(int64_t chat_id, const std::string &text);
    RelayResult sendVideo(int64_t chat_id, const std::string &path, const std::string &caption = "");
    RelayResult sendPhoto(int64_t chat_id, const std::string &path, const std::string &caption = "");

    /**
     * @brief Send a file as video or photo according to its kind
     *
     * UNKNOWN sends NO_SUPPORTED_MEDIA_TEXT instead and returns UNKNOWN_MEDIA_KIND.
     */
    RelayResult sendMedia(int64_t chat_id, MediaKind kind, const std::string &path, const std::string &caption = "");

    /**
     * @brief Extract text messages and the next offset from a getUpdates response body
     * @return false if the body is not a successful Bot API response
     */
    static bool parseUpdates(const nlohmann::json &body, std::vector<TelegramMessage> &messages, int64_t &next_offset);

    /**
     * @brief JSON request body; invalid UTF-8 in strings is replaced, never thrown on
     */
    static std::string serializePayload(const nlohmann::json &payload);

    /**
     * @brief Request path of a Bot API method, e.g. "/bot<token>/sendMessage"
     */
    std::string methodPath(const std::string &method) const;

private:
    RelayResult postJson(const std::string &method, const nlohmann::json &payload, nlohmann::json &response, int read_timeout_seconds);
    RelayResult uploadFile(const std::string &method, const std::string &field, int64_t chat_id,
                           const std::string &path, const std::string &caption);
    RelayResult checkResponse(const std::string &method, int status, const std::string &body, nlohmann::json &response) const;
    std::unique_ptr<httplib::SSLClient> makeClient(int read_timeout_seconds) const;

    std::string token_;
    std::string host_;
    int poll_timeout_seconds_;
};

/**
 * @brief Delivers selected media into one chat, with a random comment as caption
 */
class TelegramChatDelivery : public MediaDelivery
{
public:
    TelegramChatDelivery(TelegramClient &client, int64_t chat_id, const CommentCatalog *comments = nullptr);

    RelayResult deliver(MediaKind kind, const std::string &path) override;

    int64_t chatId() const { return chat_id_; }

private:
    TelegramClient &client_;
    int64_t chat_id_;
    const CommentCatalog *comments_;
};
