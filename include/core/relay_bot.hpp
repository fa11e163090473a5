#pragma once

#include "core/relay_result.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class AcquisitionPipeline;
class CommentCatalog;
class TelegramClient;
struct TelegramMessage;

/**
 * @brief Receive loop of the relay
 *
 * Polls Telegram for messages, answers commands inline and starts one pipeline
 * thread per recognized link. A run never waits for another one, so a hanging
 * fetch tool only holds up its own chat. A failure inside a run is reported to
 * its chat and never reaches the loop.
 */
class RelayBot
{
public:
    static constexpr const char *FAILURE_TEXT = "Failed to fetch media.";

    RelayBot(TelegramClient &client, const AcquisitionPipeline &pipeline, const CommentCatalog &comments);
    ~RelayBot();

    RelayBot(const RelayBot &) = delete;
    RelayBot &operator=(const RelayBot &) = delete;

    /**
     * @brief Poll until ShutdownManager reports shutdown, then wait for running tasks
     */
    void run();

    void handleMessage(const TelegramMessage &message);

    /**
     * @brief Join every pipeline thread started so far
     */
    void waitForTasks();

    size_t inFlight() const { return in_flight_.load(); }

    /**
     * @brief Run a task, turning any escaped exception into an INTERNAL error
     */
    static RelayResult runGuarded(const std::function<RelayResult()> &task);

private:
    struct PipelineTask
    {
        std::thread thread;
        std::atomic<bool> finished{false};
    };

    void spawnPipeline(int64_t chat_id, const std::string &text);
    void runPipeline(int64_t chat_id, const std::string &text);

    // Joins threads whose run has completed; caller holds tasks_mutex_
    void reapFinishedTasks();

    TelegramClient &client_;
    const AcquisitionPipeline &pipeline_;
    const CommentCatalog &comments_;
    std::string bot_username_;

    std::list<std::unique_ptr<PipelineTask>> tasks_;
    std::mutex tasks_mutex_;
    std::atomic<size_t> in_flight_{0};
};
