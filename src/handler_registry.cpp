#include "core/handler_registry.hpp"
#include "core/platform_fetcher.hpp"
#include "core/string_utils.hpp"
#include "core/relay_config.hpp"
#include "logging/logger.hpp"

namespace
{
    const char *INSTAGRAM_PATTERN =
        R"(https?://(?:www\.)?(?:instagram\.com|instagr\.am)/(?:p|reel|tv)/([A-Za-z0-9_-]+))";
    const char *YOUTUBE_PATTERN =
        R"(https?://(?:www\.)?youtube\.com/shorts/[A-Za-z0-9_-]+(?:\?[^\s]*)?)";
    const char *TWITTER_PATTERN =
        R"(https?://(?:www\.)?(?:twitter\.com|x\.com)/([A-Za-z0-9_]+(?:/[A-Za-z0-9_]+)?)/status/(\d{1,20}))";
    const char *TIKTOK_PATTERN =
        R"(https?://(?:www\.)?(?:vm|vt|tt|tik)\.tiktok\.com/([A-Za-z0-9_-]+)[/?#]?)";

    Handler makeHandler(Platform platform, const char *pattern, const PlatformFetcher &fetcher)
    {
        // Every platform is fetched by URL, so the whole match is passed on
        return Handler(platform, pattern, 0, [&fetcher, platform](const std::string &target)
                       { return fetcher.fetch(platform, target); });
    }
}

Handler::Handler(Platform p, const std::string &regex, int group, FetchFunction fn)
    : platform(p),
      name(Platforms::getPlatformName(p)),
      pattern(regex, std::regex::ECMAScript),
      capture_group(group),
      fetch(std::move(fn))
{
}

HandlerRegistry::HandlerRegistry(std::vector<Handler> handlers)
    : handlers_(std::move(handlers))
{
}

const std::vector<HandlerRegistry::Registration> &HandlerRegistry::registrations()
{
    static const std::vector<Registration> table = {
        {Platform::INSTAGRAM, [](const PlatformFetcher &f)
         { return makeHandler(Platform::INSTAGRAM, INSTAGRAM_PATTERN, f); }},
        {Platform::YOUTUBE, [](const PlatformFetcher &f)
         { return makeHandler(Platform::YOUTUBE, YOUTUBE_PATTERN, f); }},
        {Platform::TWITTER, [](const PlatformFetcher &f)
         { return makeHandler(Platform::TWITTER, TWITTER_PATTERN, f); }},
        {Platform::TIKTOK, [](const PlatformFetcher &f)
         { return makeHandler(Platform::TIKTOK, TIKTOK_PATTERN, f); }},
    };
    return table;
}

HandlerRegistry HandlerRegistry::buildDefault(const RelayConfig &config, const PlatformFetcher &fetcher)
{
    std::vector<Handler> handlers;
    for (const auto &registration : registrations())
    {
        std::string name = Platforms::getPlatformName(registration.platform);
        if (!config.platform(name).enabled)
        {
            Logger::info("Platform disabled by configuration: " + name);
            continue;
        }
        handlers.push_back(registration.factory(fetcher));
        Logger::debug("Registered handler: " + name);
    }

    Logger::info("Handler registry ready with " + std::to_string(handlers.size()) + " platform(s)");
    return HandlerRegistry(std::move(handlers));
}

std::optional<DispatchMatch> HandlerRegistry::dispatch(const std::string &text) const
{
    for (const auto &handler : handlers_)
    {
        std::smatch match;
        if (!std::regex_search(text, match, handler.pattern))
            continue;

        if (handler.capture_group < 0 || static_cast<size_t>(handler.capture_group) >= match.size())
        {
            Logger::error("Handler " + handler.name + " has no capture group " + std::to_string(handler.capture_group));
            continue;
        }

        std::string matched = StringUtils::trim(match[handler.capture_group].str());
        if (matched.empty())
        {
            Logger::debug("Handler " + handler.name + " matched an empty identifier");
            continue;
        }

        Logger::debug("Dispatching to " + handler.name + ": " + matched);
        return DispatchMatch{&handler, matched};
    }
    return std::nullopt;
}

bool HandlerRegistry::hasPlatform(Platform platform) const
{
    for (const auto &handler : handlers_)
    {
        if (handler.platform == platform)
            return true;
    }
    return false;
}
