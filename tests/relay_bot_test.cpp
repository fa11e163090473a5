#include <gtest/gtest.h>
#include "test_base.hpp"
#include "core/acquisition_pipeline.hpp"
#include "core/comment_catalog.hpp"
#include "core/media_classifier.hpp"
#include "core/media_selector.hpp"
#include "core/relay_bot.hpp"
#include "web/telegram_client.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

TEST(RelayBotGuardTest, ResultPassesThrough)
{
    RelayResult ok = RelayBot::runGuarded([]()
                                          { return RelayResult::ok(); });
    EXPECT_TRUE(ok.success);

    RelayResult failed = RelayBot::runGuarded([]()
                                              { return RelayResult(RelayErrorKind::NO_MEDIA_FOUND, "nothing"); });
    EXPECT_FALSE(failed.success);
    EXPECT_EQ(failed.error.kind, RelayErrorKind::NO_MEDIA_FOUND);
}

TEST(RelayBotGuardTest, ExceptionBecomesInternalError)
{
    RelayResult result = RelayBot::runGuarded([]() -> RelayResult
                                              { throw std::runtime_error("selector exploded"); });
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.kind, RelayErrorKind::INTERNAL);
    EXPECT_EQ(result.error.message, "selector exploded");

    RelayResult odd = RelayBot::runGuarded([]() -> RelayResult
                                           { throw 42; });
    EXPECT_EQ(odd.error.kind, RelayErrorKind::INTERNAL);
}

class RelayBotTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        config_.bot_token = "123:abc";
        // Failure notices go to a closed local port instead of the real API
        config_.telegram_api_host = "127.0.0.1";
        classifier_ = std::make_unique<MediaClassifier>(config_);
        selector_ = std::make_unique<MediaSelector>(*classifier_);

        std::vector<Handler> handlers;
        handlers.emplace_back(Platform::TIKTOK, R"(https://vm\.tiktok\.com/\S+)", 0, [this](const std::string &)
                              {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                ++fetches_;
            }
            cv_.notify_all();

            // Hold the fetch like a slow download until the test lets go
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait_for(lock, std::chrono::seconds(10), [this]
                         { return released_; });
            return DownloadResult(RelayErrorKind::NO_MEDIA_FOUND, "test"); });
        registry_ = std::make_unique<HandlerRegistry>(std::move(handlers));
        pipeline_ = std::make_unique<AcquisitionPipeline>(*registry_, *selector_);
        client_ = std::make_unique<TelegramClient>(config_);
    }

    bool waitForFetches(int count)
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, std::chrono::seconds(5), [this, count]
                            { return fetches_ >= count; });
    }

    void releaseFetches()
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    int fetchCount()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return fetches_;
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    int fetches_ = 0;
    bool released_ = false;

    std::unique_ptr<MediaClassifier> classifier_;
    std::unique_ptr<MediaSelector> selector_;
    std::unique_ptr<HandlerRegistry> registry_;
    std::unique_ptr<AcquisitionPipeline> pipeline_;
    std::unique_ptr<TelegramClient> client_;
    CommentCatalog comments_;
};

TEST_F(RelayBotTest, UnmatchedTextStartsNoTask)
{
    RelayBot bot(*client_, *pipeline_, comments_);

    TelegramMessage message;
    message.chat_id = 42;
    message.text = "just chatting, no links";
    bot.handleMessage(message);

    message.text = "/start";
    bot.handleMessage(message);

    bot.waitForTasks();
    EXPECT_EQ(bot.inFlight(), 0u);
    EXPECT_EQ(fetchCount(), 0);
}

TEST_F(RelayBotTest, MatchedLinksRunWhileCallerKeepsPolling)
{
    RelayBot bot(*client_, *pipeline_, comments_);

    TelegramMessage first;
    first.chat_id = 1;
    first.text = "https://vm.tiktok.com/abc/";
    TelegramMessage second;
    second.chat_id = 2;
    second.text = "look https://vm.tiktok.com/xyz/";

    auto start = std::chrono::steady_clock::now();
    bot.handleMessage(first);
    bot.handleMessage(second);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));

    // Both fetches are running at once, independent of the number of cores
    EXPECT_TRUE(waitForFetches(2));
    EXPECT_EQ(bot.inFlight(), 2u);

    releaseFetches();
    bot.waitForTasks();
    EXPECT_EQ(bot.inFlight(), 0u);
    EXPECT_EQ(fetchCount(), 2);
}

TEST_F(RelayBotTest, FinishedRunsAreJoinedBeforeNewOnes)
{
    releaseFetches();
    RelayBot bot(*client_, *pipeline_, comments_);

    TelegramMessage message;
    message.chat_id = 7;
    message.text = "https://vm.tiktok.com/one/";
    for (int i = 0; i < 5; ++i)
    {
        bot.handleMessage(message);
    }

    ASSERT_TRUE(waitForFetches(5));
    bot.waitForTasks();
    EXPECT_EQ(bot.inFlight(), 0u);
}
