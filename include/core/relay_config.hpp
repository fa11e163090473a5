#pragma once

#include <map>
#include <string>
#include <vector>

class PocoConfigManager;

/**
 * @brief Per-platform fetch settings
 */
struct PlatformConfig
{
    bool enabled = true;
    std::string cookies_path;       // empty when no cookie file is configured
    std::string postprocessor_args; // passed through to the fetch tool unmodified; YouTube only
};

/**
 * @brief Immutable context built once at startup and passed by reference to every component
 */
struct RelayConfig
{
    static constexpr const char *DEFAULT_YOUTUBE_POSTPROCESSOR_ARGS =
        "ffmpeg:-vf setsar=1 -c:v libx264 -crf 20 -preset ultrafast -c:a aac -b:a 128k -movflags +faststart";

    /**
     * @brief Every supported platform name, in registration order
     */
    static const std::vector<std::string> &platformNames();

    /**
     * @brief Defaults with every platform enabled and no cookie files
     */
    RelayConfig();

    std::string log_level = "INFO";

    // Telegram transport
    std::string bot_token;
    std::string telegram_api_host = "api.telegram.org";
    int poll_timeout_seconds = 30;

    // Fetch and selection
    std::string fetch_executable = "yt-dlp";
    int fetch_timeout_seconds = 300; // 0 disables the timeout
    int max_select_concurrency = 8;

    std::vector<std::string> video_extensions = {"mp4", "webm", "mov", "mkv", "avi"};
    std::vector<std::string> image_extensions = {"jpg", "jpeg", "png", "webp"};
    std::vector<std::string> forbidden_extensions = {"json", "txt", "log"};

    std::map<std::string, PlatformConfig> platforms;

    std::string comments_path;

    /**
     * @brief Snapshot the values held by a configuration store
     */
    static RelayConfig fromConfig(const PocoConfigManager &config);

    /**
     * @brief Override values from process environment variables
     *
     * TELOXIDE_TOKEN / TELEGRAM_BOT_TOKEN, IG_SESSION_COOKIE_PATH,
     * YOUTUBE_SESSION_COOKIE_PATH, TIKTOK_SESSION_COOKIE_PATH,
     * TWITTER_SESSION_COOKIE_PATH, YOUTUBE_POSTPROCESSOR_ARGS, COMMENTS_PATH, LOG_LEVEL.
     */
    void applyEnvironment();

    /**
     * @brief Settings for a platform; a disabled default when the platform is not listed
     */
    PlatformConfig platform(const std::string &name) const;

    /**
     * @brief Check the values needed to run the server
     * @param error_message Receives the first problem found
     * @param require_token Whether a bot token must be present
     */
    bool validate(std::string &error_message, bool require_token = true) const;
};
