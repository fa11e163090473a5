#pragma once

#include <optional>
#include <string>
#include <vector>

/**
 * @brief Social-media platforms the relay can fetch from
 */
enum class Platform
{
    INSTAGRAM,
    YOUTUBE,
    TWITTER,
    TIKTOK
};

class Platforms
{
public:
    /**
     * @brief Lower-case platform name, as used in configuration keys
     */
    static std::string getPlatformName(Platform platform)
    {
        switch (platform)
        {
        case Platform::INSTAGRAM:
            return "instagram";
        case Platform::YOUTUBE:
            return "youtube";
        case Platform::TWITTER:
            return "twitter";
        case Platform::TIKTOK:
            return "tiktok";
        default:
            return "unknown";
        }
    }

    static std::optional<Platform> fromName(const std::string &name)
    {
        for (Platform platform : all())
        {
            if (getPlatformName(platform) == name)
                return platform;
        }
        return std::nullopt;
    }

    /**
     * @brief Every platform in registration order
     */
    static const std::vector<Platform> &all()
    {
        static const std::vector<Platform> platforms = {
            Platform::INSTAGRAM, Platform::YOUTUBE, Platform::TWITTER, Platform::TIKTOK};
        return platforms;
    }
};
