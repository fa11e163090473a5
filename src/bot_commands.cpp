#include "core/bot_commands.hpp"
#include "core/comment_catalog.hpp"
#include "core/string_utils.hpp"

BotCommand BotCommands::parse(const std::string &text, const std::string &bot_username)
{
    std::string trimmed = StringUtils::trim(text);
    if (trimmed.size() < 2 || trimmed[0] != '/')
        return BotCommand::NONE;

    std::string token = trimmed.substr(1, trimmed.find_first_of(" \t\r\n") - 1);

    size_t at = token.find('@');
    if (at != std::string::npos)
    {
        std::string addressee = StringUtils::toLower(token.substr(at + 1));
        token = token.substr(0, at);
        if (!bot_username.empty() && addressee != StringUtils::toLower(bot_username))
            return BotCommand::NONE;
    }

    std::string name = StringUtils::toLower(token);
    if (name == "help" || name == "h" || name == "?")
        return BotCommand::HELP;
    if (name == "curse")
        return BotCommand::CURSE;
    return BotCommand::UNKNOWN;
}

std::string BotCommands::getCommandName(BotCommand command)
{
    switch (command)
    {
    case BotCommand::HELP:
        return "help";
    case BotCommand::CURSE:
        return "curse";
    case BotCommand::UNKNOWN:
        return "unknown";
    default:
        return "none";
    }
}

std::string BotCommands::helpText()
{
    return "These commands are supported:\n\n"
           "/help - Display this text.\n"
           "/curse - Send a random comment\n\n"
           "Send an Instagram, YouTube Shorts, Twitter/X or TikTok link and I will reply with the media.";
}

std::string BotCommands::reply(BotCommand command, const CommentCatalog &comments)
{
    switch (command)
    {
    case BotCommand::HELP:
        return helpText() + "\n\n" + comments.disclaimer();
    case BotCommand::CURSE:
        return comments.buildCaption(CommentCatalog::MESSAGE_LIMIT);
    default:
        return "";
    }
}
