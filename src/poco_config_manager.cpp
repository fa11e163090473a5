#include "core/poco_config_manager.hpp"
#include "core/relay_config.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>
#include <functional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::ifstream in(path);
    if (!in.good())
        return false;

    nlohmann::json patch;
    try
    {
        in >> patch;
    }
    catch (const nlohmann::json::parse_error &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.what());
        return false;
    }

    if (!patch.is_object())
    {
        Logger::error("Configuration file " + path + " must contain a JSON object");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyPatch(patch);
}

void PocoConfigManager::applyPatch(const nlohmann::json &patch)
{
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_unsigned())
                cfg_->setUInt(prefix, static_cast<unsigned>(node.get<unsigned long long>()));
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

// Basic configuration getters
std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Config key " + key + " is not an integer, using default " + std::to_string(def));
        return def;
    }
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &)
    {
        Logger::warn("Config key " + key + " is not a boolean, using default " + (def ? "true" : "false"));
        return def;
    }
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getBotToken() const
{
    return getString("telegram.bot_token", "");
}

std::string PocoConfigManager::getTelegramApiHost() const
{
    return getString("telegram.api_host", "api.telegram.org");
}

int PocoConfigManager::getPollTimeoutSeconds() const
{
    return getInt("telegram.poll_timeout_seconds", 30);
}

std::string PocoConfigManager::getFetchExecutable() const
{
    return getString("fetch.executable", "yt-dlp");
}

int PocoConfigManager::getFetchTimeoutSeconds() const
{
    return getInt("fetch.timeout_seconds", 300);
}

int PocoConfigManager::getMaxSelectConcurrency() const
{
    return getInt("selection.max_concurrency", 8);
}

std::vector<std::string> PocoConfigManager::getEnabledVideoExtensions() const
{
    return getEnabledExtensionsForCategory("video");
}

std::vector<std::string> PocoConfigManager::getEnabledImageExtensions() const
{
    return getEnabledExtensionsForCategory("images");
}

std::vector<std::string> PocoConfigManager::getForbiddenExtensions() const
{
    return getEnabledExtensionsForCategory("forbidden");
}

bool PocoConfigManager::isPlatformEnabled(const std::string &platform) const
{
    return getBool("platforms." + platform + ".enabled", true);
}

std::string PocoConfigManager::getPlatformCookiesPath(const std::string &platform) const
{
    return getString("platforms." + platform + ".cookies_path", "");
}

std::string PocoConfigManager::getYoutubePostprocessorArgs() const
{
    return getString("platforms.youtube.postprocessor_args", RelayConfig::DEFAULT_YOUTUBE_POSTPROCESSOR_ARGS);
}

std::string PocoConfigManager::getCommentsPath() const
{
    return getString("comments.path", "");
}

bool PocoConfigManager::validateConfig() const
{
    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    if (getFetchExecutable().empty())
    {
        Logger::error("fetch.executable must not be empty");
        return false;
    }

    int timeout = getFetchTimeoutSeconds();
    if (timeout < 0)
    {
        Logger::error("Invalid fetch timeout: " + std::to_string(timeout));
        return false;
    }

    int concurrency = getMaxSelectConcurrency();
    if (concurrency < 1 || concurrency > 64)
    {
        Logger::error("selection.max_concurrency " + std::to_string(concurrency) + " is outside valid range [1-64]");
        return false;
    }

    int poll_timeout = getPollTimeoutSeconds();
    if (poll_timeout < 0 || poll_timeout > 50)
    {
        Logger::error("telegram.poll_timeout_seconds " + std::to_string(poll_timeout) + " is outside valid range [0-50]");
        return false;
    }

    if (getEnabledVideoExtensions().empty() && getEnabledImageExtensions().empty())
    {
        Logger::error("No video or image extensions are enabled");
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");

    // Telegram defaults
    cfg_->setString("telegram.bot_token", "");
    cfg_->setString("telegram.api_host", "api.telegram.org");
    cfg_->setInt("telegram.poll_timeout_seconds", 30);

    // Fetch defaults
    cfg_->setString("fetch.executable", "yt-dlp");
    cfg_->setInt("fetch.timeout_seconds", 300);

    // Selection defaults
    cfg_->setInt("selection.max_concurrency", 8);

    // Media extension categories
    cfg_->setBool("media.video.mp4", true);
    cfg_->setBool("media.video.webm", true);
    cfg_->setBool("media.video.mov", true);
    cfg_->setBool("media.video.mkv", true);
    cfg_->setBool("media.video.avi", true);

    cfg_->setBool("media.images.jpg", true);
    cfg_->setBool("media.images.jpeg", true);
    cfg_->setBool("media.images.png", true);
    cfg_->setBool("media.images.webp", true);

    // Sidecar files some fetch tools emit next to the media
    cfg_->setBool("media.forbidden.json", true);
    cfg_->setBool("media.forbidden.txt", true);
    cfg_->setBool("media.forbidden.log", true);

    // Platforms
    for (const auto &platform : RelayConfig::platformNames())
    {
        cfg_->setBool("platforms." + platform + ".enabled", true);
        cfg_->setString("platforms." + platform + ".cookies_path", "");
    }
    cfg_->setString("platforms.youtube.postprocessor_args", RelayConfig::DEFAULT_YOUTUBE_POSTPROCESSOR_ARGS);

    cfg_->setString("comments.path", "");
}

// Helper methods for nested configuration
nlohmann::json PocoConfigManager::getNestedConfig(const std::string &prefix) const
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::stringstream ss;
    cfg_->save(ss);
    auto full_config = nlohmann::json::parse(ss.str(), nullptr, false);
    if (full_config.is_discarded())
    {
        Logger::error("Stored configuration is not valid JSON");
        return nlohmann::json::object();
    }

    // Navigate to the nested section
    auto current = full_config;
    for (const auto &key : split(prefix, '.'))
    {
        if (current.contains(key) && current[key].is_object())
        {
            current = current[key];
        }
        else
        {
            return nlohmann::json::object();
        }
    }

    return current;
}

std::vector<std::string> PocoConfigManager::getEnabledExtensionsForCategory(const std::string &category) const
{
    std::vector<std::string> enabled_extensions;

    auto category_config = getNestedConfig("media." + category);
    for (auto it = category_config.begin(); it != category_config.end(); ++it)
    {
        if (it.value().is_boolean() && it.value().get<bool>())
        {
            enabled_extensions.push_back(StringUtils::toLower(it.key()));
        }
    }

    return enabled_extensions;
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
