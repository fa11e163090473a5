#include "core/relay_config.hpp"
#include "core/platform.hpp"
#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <cstdlib>

namespace
{
    bool readEnv(const char *key, std::string &out)
    {
        const char *value = std::getenv(key);
        if (value == nullptr)
            return false;
        out = value;
        return true;
    }
}

const std::vector<std::string> &RelayConfig::platformNames()
{
    static const std::vector<std::string> names = []
    {
        std::vector<std::string> result;
        for (Platform platform : Platforms::all())
        {
            result.push_back(Platforms::getPlatformName(platform));
        }
        return result;
    }();
    return names;
}

RelayConfig::RelayConfig()
{
    for (const auto &name : platformNames())
    {
        PlatformConfig platform;
        if (name == "youtube")
            platform.postprocessor_args = DEFAULT_YOUTUBE_POSTPROCESSOR_ARGS;
        platforms[name] = platform;
    }
}

RelayConfig RelayConfig::fromConfig(const PocoConfigManager &config)
{
    RelayConfig relay;
    relay.log_level = config.getLogLevel();

    relay.bot_token = config.getBotToken();
    relay.telegram_api_host = config.getTelegramApiHost();
    relay.poll_timeout_seconds = config.getPollTimeoutSeconds();

    relay.fetch_executable = config.getFetchExecutable();
    relay.fetch_timeout_seconds = config.getFetchTimeoutSeconds();
    relay.max_select_concurrency = config.getMaxSelectConcurrency();

    relay.video_extensions = config.getEnabledVideoExtensions();
    relay.image_extensions = config.getEnabledImageExtensions();
    relay.forbidden_extensions = config.getForbiddenExtensions();

    for (const auto &name : platformNames())
    {
        PlatformConfig platform;
        platform.enabled = config.isPlatformEnabled(name);
        platform.cookies_path = config.getPlatformCookiesPath(name);
        if (name == "youtube")
            platform.postprocessor_args = config.getYoutubePostprocessorArgs();
        relay.platforms[name] = platform;
    }

    relay.comments_path = config.getCommentsPath();
    return relay;
}

void RelayConfig::applyEnvironment()
{
    std::string value;

    if (readEnv("TELEGRAM_BOT_TOKEN", value) || readEnv("TELOXIDE_TOKEN", value))
        bot_token = value;

    if (readEnv("IG_SESSION_COOKIE_PATH", value))
        platforms["instagram"].cookies_path = value;
    if (readEnv("YOUTUBE_SESSION_COOKIE_PATH", value))
        platforms["youtube"].cookies_path = value;
    if (readEnv("TIKTOK_SESSION_COOKIE_PATH", value))
        platforms["tiktok"].cookies_path = value;
    if (readEnv("TWITTER_SESSION_COOKIE_PATH", value))
        platforms["twitter"].cookies_path = value;

    if (readEnv("YOUTUBE_POSTPROCESSOR_ARGS", value))
        platforms["youtube"].postprocessor_args = value;

    if (readEnv("COMMENTS_PATH", value))
        comments_path = value;

    if (readEnv("LOG_LEVEL", value))
        log_level = value;
}

PlatformConfig RelayConfig::platform(const std::string &name) const
{
    auto it = platforms.find(name);
    if (it == platforms.end())
    {
        PlatformConfig disabled;
        disabled.enabled = false;
        return disabled;
    }
    return it->second;
}

bool RelayConfig::validate(std::string &error_message, bool require_token) const
{
    if (require_token && bot_token.empty())
    {
        error_message = "Bot token is not configured (telegram.bot_token or TELEGRAM_BOT_TOKEN)";
        return false;
    }
    if (!Logger::isValidLevel(log_level))
    {
        error_message = "Invalid log level: " + log_level;
        return false;
    }
    if (fetch_executable.empty())
    {
        error_message = "Fetch executable is not configured";
        return false;
    }
    if (fetch_timeout_seconds < 0)
    {
        error_message = "Fetch timeout must not be negative";
        return false;
    }
    if (max_select_concurrency < 1)
    {
        error_message = "Selection concurrency must be at least 1";
        return false;
    }
    if (video_extensions.empty() && image_extensions.empty())
    {
        error_message = "No media extensions are enabled";
        return false;
    }
    return true;
}
