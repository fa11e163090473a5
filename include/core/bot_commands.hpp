#pragma once

#include <string>

class CommentCatalog;

enum class BotCommand
{
    NONE,    // not a command, or addressed to another bot
    HELP,    // /help, /h, /?
    CURSE,   // /curse
    UNKNOWN  // starts with '/' but is not recognized
};

/**
 * @brief Parses slash commands and builds their replies
 */
class BotCommands
{
public:
    /**
     * @brief Recognize a command in a message
     * @param text Message text
     * @param bot_username Username of this bot; "/cmd@other_bot" yields NONE when set
     */
    static BotCommand parse(const std::string &text, const std::string &bot_username = "");

    static std::string getCommandName(BotCommand command);

    static std::string helpText();

    /**
     * @brief Reply text for a recognized command, empty for NONE and UNKNOWN
     */
    static std::string reply(BotCommand command, const CommentCatalog &comments);
};
