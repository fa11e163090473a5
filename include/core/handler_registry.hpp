#pragma once

#include "core/platform.hpp"
#include "core/relay_result.hpp"
#include <functional>
#include <optional>
#include <regex>
#include <string>
#include <vector>

struct RelayConfig;
class PlatformFetcher;

using FetchFunction = std::function<DownloadResult(const std::string &)>;

/**
 * @brief A platform's URL pattern bound to the function that fetches its media
 */
struct Handler
{
    Platform platform;
    std::string name;
    std::regex pattern;
    int capture_group; // 0 passes the whole match to fetch
    FetchFunction fetch;

    Handler(Platform p, const std::string &regex, int group, FetchFunction fn);
};

struct DispatchMatch
{
    const Handler *handler;
    std::string matched;
};

/**
 * @brief Ordered, read-only list of handlers built once at startup
 *
 * Concurrent dispatch() calls need no synchronization.
 */
class HandlerRegistry
{
public:
    using HandlerFactory = std::function<Handler(const PlatformFetcher &)>;

    struct Registration
    {
        Platform platform;
        HandlerFactory factory;
    };

    explicit HandlerRegistry(std::vector<Handler> handlers);

    /**
     * @brief Registration table of every supported platform, in dispatch order
     */
    static const std::vector<Registration> &registrations();

    /**
     * @brief Build the handlers of every platform enabled in the configuration
     * @param fetcher Must outlive the registry
     */
    static HandlerRegistry buildDefault(const RelayConfig &config, const PlatformFetcher &fetcher);

    /**
     * @brief Find the first handler whose pattern occurs in the text
     * @return Handler and trimmed identifier, or nullopt if nothing matches
     */
    std::optional<DispatchMatch> dispatch(const std::string &text) const;

    const std::vector<Handler> &handlers() const { return handlers_; }
    bool hasPlatform(Platform platform) const;
    size_t size() const { return handlers_.size(); }

private:
    std::vector<Handler> handlers_;
};
