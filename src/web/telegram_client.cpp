#include "web/telegram_client.hpp"
#include "core/comment_catalog.hpp"
#include "core/relay_config.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <httplib.h>

namespace
{
    constexpr int CONNECT_TIMEOUT_SECONDS = 10;
    constexpr int REQUEST_TIMEOUT_SECONDS = 30;
    constexpr int UPLOAD_TIMEOUT_SECONDS = 300;

    bool readFile(const std::string &path, std::string &content)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
            return false;
        content.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        return !in.bad();
    }

    std::string contentTypeFor(const std::string &path, MediaKind kind)
    {
        std::string ext = StringUtils::toLower(std::filesystem::path(path).extension().string());
        if (kind == MediaKind::VIDEO)
        {
            if (ext == ".webm")
                return "video/webm";
            if (ext == ".mov")
                return "video/quicktime";
            if (ext == ".mkv")
                return "video/x-matroska";
            return "video/mp4";
        }
        if (ext == ".png")
            return "image/png";
        if (ext == ".webp")
            return "image/webp";
        return "image/jpeg";
    }
}

TelegramClient::TelegramClient(const RelayConfig &config)
    : token_(config.bot_token),
      host_(config.telegram_api_host),
      poll_timeout_seconds_(config.poll_timeout_seconds)
{
}

TelegramClient::~TelegramClient() = default;

std::string TelegramClient::methodPath(const std::string &method) const
{
    return "/bot" + token_ + "/" + method;
}

std::string TelegramClient::serializePayload(const nlohmann::json &payload)
{
    // Invalid UTF-8 becomes U+FFFD instead of throwing type_error.316
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::unique_ptr<httplib::SSLClient> TelegramClient::makeClient(int read_timeout_seconds) const
{
    auto client = std::make_unique<httplib::SSLClient>(host_, 443);
    client->set_connection_timeout(CONNECT_TIMEOUT_SECONDS, 0);
    client->set_read_timeout(read_timeout_seconds, 0);
    client->set_write_timeout(UPLOAD_TIMEOUT_SECONDS, 0);
    client->enable_server_certificate_verification(true);
    return client;
}

RelayResult TelegramClient::checkResponse(const std::string &method, int status, const std::string &body, nlohmann::json &response) const
{
    response = nlohmann::json::parse(body, nullptr, false);
    if (response.is_discarded())
    {
        return RelayResult(RelayErrorKind::TRANSPORT, method + " returned invalid JSON (HTTP " + std::to_string(status) + ")");
    }

    if (status != 200 || !response.value("ok", false))
    {
        std::string description = response.value("description", std::string("no description"));
        return RelayResult(RelayErrorKind::TRANSPORT, method + " failed (HTTP " + std::to_string(status) + "): " + description);
    }
    return RelayResult::ok();
}

RelayResult TelegramClient::postJson(const std::string &method, const nlohmann::json &payload, nlohmann::json &response,
                                     int read_timeout_seconds)
{
    auto client = makeClient(read_timeout_seconds);
    auto res = client->Post(methodPath(method), serializePayload(payload), "application/json");
    if (!res)
    {
        return RelayResult(RelayErrorKind::TRANSPORT, method + " request failed: " + httplib::to_string(res.error()));
    }
    return checkResponse(method, res->status, res->body, response);
}

RelayResult TelegramClient::getMe(std::string &username)
{
    nlohmann::json response;
    RelayResult result = postJson("getMe", nlohmann::json::object(), response, REQUEST_TIMEOUT_SECONDS);
    if (!result.success)
        return result;

    username = response["result"].value("username", std::string());
    return RelayResult::ok();
}

RelayResult TelegramClient::getUpdates(int64_t offset, std::vector<TelegramMessage> &messages, int64_t &next_offset)
{
    nlohmann::json payload = {
        {"offset", offset},
        {"timeout", poll_timeout_seconds_},
        {"allowed_updates", nlohmann::json::array({"message"})}};

    nlohmann::json response;
    RelayResult result = postJson("getUpdates", payload, response, poll_timeout_seconds_ + REQUEST_TIMEOUT_SECONDS);
    if (!result.success)
        return result;

    next_offset = offset;
    if (!parseUpdates(response, messages, next_offset))
    {
        return RelayResult(RelayErrorKind::TRANSPORT, "getUpdates returned an unexpected payload");
    }
    return RelayResult::ok();
}

bool TelegramClient::parseUpdates(const nlohmann::json &body, std::vector<TelegramMessage> &messages, int64_t &next_offset)
{
    if (!body.is_object() || !body.value("ok", false) || !body.contains("result") || !body["result"].is_array())
        return false;

    for (const auto &update : body["result"])
    {
        if (!update.contains("update_id") || !update["update_id"].is_number_integer())
            continue;

        int64_t update_id = update["update_id"].get<int64_t>();
        next_offset = std::max(next_offset, update_id + 1);

        if (!update.contains("message") || !update["message"].is_object())
            continue;
        const auto &message = update["message"];
        if (!message.contains("text") || !message["text"].is_string())
            continue;
        if (!message.contains("chat") || !message["chat"].contains("id"))
            continue;

        TelegramMessage parsed;
        parsed.update_id = update_id;
        parsed.message_id = message.value("message_id", int64_t(0));
        parsed.chat_id = message["chat"]["id"].get<int64_t>();
        parsed.text = message["text"].get<std::string>();
        if (message.contains("from") && message["from"].is_object())
            parsed.from_username = message["from"].value("username", std::string());
        messages.push_back(std::move(parsed));
    }
    return true;
}

RelayResult TelegramClient::sendMessage(int64_t chat_id, const std::string &text)
{
    nlohmann::json payload = {
        {"chat_id", chat_id},
        {"text", CommentCatalog::truncate(text, CommentCatalog::MESSAGE_LIMIT)}};

    nlohmann::json response;
    RelayResult result = postJson("sendMessage", payload, response, REQUEST_TIMEOUT_SECONDS);
    if (!result.success)
        Logger::error("sendMessage to chat " + std::to_string(chat_id) + " failed: " + result.error.toString());
    return result;
}

RelayResult TelegramClient::uploadFile(const std::string &method, const std::string &field, int64_t chat_id,
                                       const std::string &path, const std::string &caption)
{
    std::string content;
    if (!readFile(path, content))
    {
        return RelayResult(RelayErrorKind::IO, "cannot read " + path);
    }

    MediaKind kind = field == "video" ? MediaKind::VIDEO : MediaKind::IMAGE;
    std::string filename = std::filesystem::path(path).filename().string();

    httplib::MultipartFormDataItems items = {
        {"chat_id", std::to_string(chat_id), "", ""},
        {field, content, filename, contentTypeFor(path, kind)}};
    if (!caption.empty())
    {
        items.push_back({"caption", CommentCatalog::truncate(caption, CommentCatalog::CAPTION_LIMIT), "", ""});
    }
    if (kind == MediaKind::VIDEO)
    {
        items.push_back({"supports_streaming", "true", "", ""});
    }

    Logger::debug(method + " " + filename + " (" + std::to_string(content.size()) + " bytes) to chat " + std::to_string(chat_id));

    auto client = makeClient(UPLOAD_TIMEOUT_SECONDS);
    auto res = client->Post(methodPath(method), items);
    if (!res)
    {
        return RelayResult(RelayErrorKind::TRANSPORT, method + " request failed: " + httplib::to_string(res.error()));
    }

    nlohmann::json response;
    return checkResponse(method, res->status, res->body, response);
}

RelayResult TelegramClient::sendVideo(int64_t chat_id, const std::string &path, const std::string &caption)
{
    return uploadFile("sendVideo", "video", chat_id, path, caption);
}

RelayResult TelegramClient::sendPhoto(int64_t chat_id, const std::string &path, const std::string &caption)
{
    return uploadFile("sendPhoto", "photo", chat_id, path, caption);
}

RelayResult TelegramClient::sendMedia(int64_t chat_id, MediaKind kind, const std::string &path, const std::string &caption)
{
    switch (kind)
    {
    case MediaKind::VIDEO:
        return sendVideo(chat_id, path, caption);
    case MediaKind::IMAGE:
        return sendPhoto(chat_id, path, caption);
    default:
    {
        RelayResult sent = sendMessage(chat_id, NO_SUPPORTED_MEDIA_TEXT);
        if (!sent.success)
            return sent;
        return RelayResult(RelayErrorKind::UNKNOWN_MEDIA_KIND, "cannot send " + path + " as video or photo");
    }
    }
}

TelegramChatDelivery::TelegramChatDelivery(TelegramClient &client, int64_t chat_id, const CommentCatalog *comments)
    : client_(client), chat_id_(chat_id), comments_(comments)
{
}

RelayResult TelegramChatDelivery::deliver(MediaKind kind, const std::string &path)
{
    std::string caption = comments_ ? comments_->buildCaption() : "";
    return client_.sendMedia(chat_id_, kind, path, caption);
}
