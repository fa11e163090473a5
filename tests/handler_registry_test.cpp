#include <gtest/gtest.h>
#include "test_base.hpp"
#include "core/handler_registry.hpp"
#include "core/platform_fetcher.hpp"
#include "core/process_runner.hpp"

class HandlerRegistryTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();
        runner_ = std::make_unique<ProcessRunner>(config_);
        fetcher_ = std::make_unique<PlatformFetcher>(config_, *runner_);
    }

    std::unique_ptr<ProcessRunner> runner_;
    std::unique_ptr<PlatformFetcher> fetcher_;
};

TEST_F(HandlerRegistryTest, DefaultRegistrationOrder)
{
    HandlerRegistry registry = HandlerRegistry::buildDefault(config_, *fetcher_);

    ASSERT_EQ(registry.size(), 4u);
    EXPECT_EQ(registry.handlers()[0].platform, Platform::INSTAGRAM);
    EXPECT_EQ(registry.handlers()[1].platform, Platform::YOUTUBE);
    EXPECT_EQ(registry.handlers()[2].platform, Platform::TWITTER);
    EXPECT_EQ(registry.handlers()[3].platform, Platform::TIKTOK);
}

TEST_F(HandlerRegistryTest, DisabledPlatformIsNotRegistered)
{
    config_.platforms["twitter"].enabled = false;
    HandlerRegistry registry = HandlerRegistry::buildDefault(config_, *fetcher_);

    EXPECT_EQ(registry.size(), 3u);
    EXPECT_FALSE(registry.hasPlatform(Platform::TWITTER));
    EXPECT_FALSE(registry.dispatch("https://twitter.com/someone/status/12345"));
    EXPECT_TRUE(registry.dispatch("https://www.instagram.com/p/Cabc123/"));
}

TEST_F(HandlerRegistryTest, DispatchExtractsWholeUrl)
{
    HandlerRegistry registry = HandlerRegistry::buildDefault(config_, *fetcher_);

    auto instagram = registry.dispatch("look at this https://www.instagram.com/reel/C1a2B3c_-d/?igsh=xyz lol");
    ASSERT_TRUE(instagram);
    EXPECT_EQ(instagram->handler->platform, Platform::INSTAGRAM);
    EXPECT_EQ(instagram->matched, "https://www.instagram.com/reel/C1a2B3c_-d");

    auto youtube = registry.dispatch("https://youtube.com/shorts/abcDEF123?feature=share");
    ASSERT_TRUE(youtube);
    EXPECT_EQ(youtube->handler->platform, Platform::YOUTUBE);
    EXPECT_EQ(youtube->matched, "https://youtube.com/shorts/abcDEF123?feature=share");

    auto twitter = registry.dispatch("https://x.com/someone/status/1234567890");
    ASSERT_TRUE(twitter);
    EXPECT_EQ(twitter->handler->platform, Platform::TWITTER);
    EXPECT_EQ(twitter->matched, "https://x.com/someone/status/1234567890");

    auto tiktok = registry.dispatch("https://vm.tiktok.com/ZMabc123/");
    ASSERT_TRUE(tiktok);
    EXPECT_EQ(tiktok->handler->platform, Platform::TIKTOK);
    EXPECT_EQ(tiktok->matched, "https://vm.tiktok.com/ZMabc123/");
}

TEST_F(HandlerRegistryTest, UnrelatedTextDoesNotMatch)
{
    HandlerRegistry registry = HandlerRegistry::buildDefault(config_, *fetcher_);

    EXPECT_FALSE(registry.dispatch("hello there"));
    EXPECT_FALSE(registry.dispatch("https://youtube.com/watch?v=abc"));
    EXPECT_FALSE(registry.dispatch("https://example.com/p/abc"));
    EXPECT_FALSE(registry.dispatch(""));
}

TEST_F(HandlerRegistryTest, FirstRegisteredHandlerWins)
{
    int first_calls = 0;
    int second_calls = 0;
    std::vector<Handler> handlers;
    handlers.emplace_back(Platform::INSTAGRAM, "media/([0-9]+)", 0, [&](const std::string &)
                          { ++first_calls; return DownloadResult(); });
    handlers.emplace_back(Platform::TIKTOK, "media/[0-9]+", 0, [&](const std::string &)
                          { ++second_calls; return DownloadResult(); });
    HandlerRegistry registry(std::move(handlers));

    auto match = registry.dispatch("see media/42");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->handler->platform, Platform::INSTAGRAM);
    match->handler->fetch(match->matched);
    EXPECT_EQ(first_calls, 1);
    EXPECT_EQ(second_calls, 0);
}

TEST_F(HandlerRegistryTest, CaptureGroupSelectsIdentifier)
{
    std::vector<Handler> handlers;
    handlers.emplace_back(Platform::INSTAGRAM, R"(instagram\.com/p/([A-Za-z0-9_-]+))", 1, [](const std::string &)
                          { return DownloadResult(); });
    HandlerRegistry registry(std::move(handlers));

    auto match = registry.dispatch("https://instagram.com/p/SHORT_code-1/");
    ASSERT_TRUE(match);
    EXPECT_EQ(match->matched, "SHORT_code-1");
}

TEST_F(HandlerRegistryTest, BlankIdentifierIsRejected)
{
    std::vector<Handler> handlers;
    handlers.emplace_back(Platform::TIKTOK, R"(id:(\s*))", 1, [](const std::string &)
                          { return DownloadResult(); });
    HandlerRegistry registry(std::move(handlers));

    EXPECT_FALSE(registry.dispatch("id:   "));
}

TEST(PlatformsTest, NamesRoundTrip)
{
    for (Platform platform : Platforms::all())
    {
        auto parsed = Platforms::fromName(Platforms::getPlatformName(platform));
        ASSERT_TRUE(parsed);
        EXPECT_EQ(*parsed, platform);
    }
    EXPECT_FALSE(Platforms::fromName("myspace"));
}
