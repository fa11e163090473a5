#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief JSON configuration store backed by Poco::Util::JSONConfiguration
 *
 * Holds the built-in defaults; values loaded from a file or applied through
 * update() are layered on top of them. Built once at startup and turned into a
 * RelayConfig; the rest of the process never reads it directly.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;
    bool hasKey(const std::string &key) const;

    // General
    std::string getLogLevel() const;

    // Telegram transport
    std::string getBotToken() const;
    std::string getTelegramApiHost() const;
    int getPollTimeoutSeconds() const;

    // Fetch and selection
    std::string getFetchExecutable() const;
    int getFetchTimeoutSeconds() const;
    int getMaxSelectConcurrency() const;

    // Media extension categories
    std::vector<std::string> getEnabledVideoExtensions() const;
    std::vector<std::string> getEnabledImageExtensions() const;
    std::vector<std::string> getForbiddenExtensions() const;

    // Platforms
    bool isPlatformEnabled(const std::string &platform) const;
    std::string getPlatformCookiesPath(const std::string &platform) const;
    std::string getYoutubePostprocessorArgs() const;

    // Captions
    std::string getCommentsPath() const;

    bool validateConfig() const;
    void initializeDefaultConfig();

private:
    nlohmann::json getNestedConfig(const std::string &prefix) const;
    std::vector<std::string> getEnabledExtensionsForCategory(const std::string &category) const;
    void applyPatch(const nlohmann::json &patch);

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
