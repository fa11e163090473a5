#include "core/relay_bot.hpp"
#include "core/acquisition_pipeline.hpp"
#include "core/bot_commands.hpp"
#include "core/comment_catalog.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include "web/telegram_client.hpp"
#include <chrono>
#include <system_error>
#include <vector>

namespace
{
    constexpr auto POLL_ERROR_BACKOFF = std::chrono::seconds(5);
}

RelayBot::RelayBot(TelegramClient &client, const AcquisitionPipeline &pipeline, const CommentCatalog &comments)
    : client_(client), pipeline_(pipeline), comments_(comments)
{
}

RelayBot::~RelayBot()
{
    waitForTasks();
}

void RelayBot::run()
{
    auto &shutdown = ShutdownManager::getInstance();

    RelayResult me = client_.getMe(bot_username_);
    if (me.success)
        Logger::info("Relay bot started as @" + bot_username_);
    else
        Logger::warn("Could not resolve bot username: " + me.error.toString());

    int64_t offset = 0;
    while (!shutdown.isShutdownRequested())
    {
        std::vector<TelegramMessage> messages;
        int64_t next_offset = offset;
        RelayResult polled = client_.getUpdates(offset, messages, next_offset);
        if (!polled.success)
        {
            Logger::error("Polling failed: " + polled.error.toString());
            shutdown.waitFor(POLL_ERROR_BACKOFF);
            continue;
        }

        offset = next_offset;
        for (const auto &message : messages)
        {
            handleMessage(message);
        }
    }

    Logger::info("Polling stopped, waiting for " + std::to_string(in_flight_.load()) + " running task(s)");
    waitForTasks();
}

void RelayBot::handleMessage(const TelegramMessage &message)
{
    BotCommand command = BotCommands::parse(message.text, bot_username_);
    if (command == BotCommand::HELP || command == BotCommand::CURSE)
    {
        Logger::debug("Command /" + BotCommands::getCommandName(command) + " from chat " + std::to_string(message.chat_id));
        RelayResult sent = runGuarded([&]()
                                      { return client_.sendMessage(message.chat_id, BotCommands::reply(command, comments_)); });
        if (!sent.success)
            Logger::error("Failed to answer /" + BotCommands::getCommandName(command) + ": " + sent.error.toString());
        return;
    }
    if (command == BotCommand::UNKNOWN)
    {
        Logger::debug("Ignoring unknown command from chat " + std::to_string(message.chat_id));
        return;
    }

    if (!pipeline_.registry().dispatch(message.text))
        return;

    spawnPipeline(message.chat_id, message.text);
}

void RelayBot::spawnPipeline(int64_t chat_id, const std::string &text)
{
    std::lock_guard<std::mutex> lock(tasks_mutex_);
    reapFinishedTasks();

    auto task = std::make_unique<PipelineTask>();
    PipelineTask *raw = task.get();
    in_flight_.fetch_add(1);
    try
    {
        raw->thread = std::thread([this, raw, chat_id, text]()
                                  {
            runPipeline(chat_id, text);
            in_flight_.fetch_sub(1);
            raw->finished.store(true); });
    }
    catch (const std::system_error &e)
    {
        in_flight_.fetch_sub(1);
        Logger::error("Failed to start pipeline thread for chat " + std::to_string(chat_id) + ": " + e.what());
        return;
    }
    tasks_.push_back(std::move(task));
    Logger::debug("Pipeline started for chat " + std::to_string(chat_id) + ", " + std::to_string(in_flight_.load()) + " in flight");
}

void RelayBot::runPipeline(int64_t chat_id, const std::string &text)
{
    TelegramChatDelivery delivery(client_, chat_id, &comments_);
    RelayResult result = runGuarded([&]()
                                    { return pipeline_.handleMessage(text, delivery); });
    if (result.success)
        return;

    Logger::error("Pipeline failed for chat " + std::to_string(chat_id) + ": " + result.error.toString());
    RelayResult notified = runGuarded([&]()
                                      { return client_.sendMessage(chat_id, FAILURE_TEXT); });
    if (!notified.success)
        Logger::error("Failed to notify chat " + std::to_string(chat_id) + ": " + notified.error.toString());
}

void RelayBot::reapFinishedTasks()
{
    for (auto it = tasks_.begin(); it != tasks_.end();)
    {
        if ((*it)->finished.load())
        {
            (*it)->thread.join();
            it = tasks_.erase(it);
        }
        else
        {
            ++it;
        }
    }
}

void RelayBot::waitForTasks()
{
    std::list<std::unique_ptr<PipelineTask>> pending;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        pending.swap(tasks_);
    }
    for (auto &task : pending)
    {
        if (task->thread.joinable())
            task->thread.join();
    }
}

RelayResult RelayBot::runGuarded(const std::function<RelayResult()> &task)
{
    try
    {
        return task();
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Task threw: ") + e.what());
        return RelayResult(RelayErrorKind::INTERNAL, e.what());
    }
    catch (...)
    {
        Logger::error("Task threw a non-standard exception");
        return RelayResult(RelayErrorKind::INTERNAL, "unknown exception");
    }
}
