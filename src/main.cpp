#include "core/acquisition_pipeline.hpp"
#include "core/comment_catalog.hpp"
#include "core/handler_registry.hpp"
#include "core/media_classifier.hpp"
#include "core/media_selector.hpp"
#include "core/platform_fetcher.hpp"
#include "core/poco_config_manager.hpp"
#include "core/process_runner.hpp"
#include "core/relay_bot.hpp"
#include "core/relay_config.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include "web/telegram_client.hpp"
#include <filesystem>
#include <iostream>
#include <unistd.h>
#include <vector>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Media Relay Server - forwards social media links as media files" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>   Configuration file (default: config.json)" << std::endl;
        std::cout << "  --set <json>          Merge a JSON object over the loaded configuration" << std::endl;
        std::cout << "  --print-config        Print the effective configuration and exit" << std::endl;
        std::cout << "  --write-config <path> Save the effective configuration to a file and exit" << std::endl;
        std::cout << "  --help, -h            Show this help message" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = "config.json";
    bool print_config = false;
    std::string write_config_path;
    std::vector<std::string> overrides;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
        }
        else if (arg == "--set")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: --set requires a JSON object" << std::endl;
                return 1;
            }
            overrides.push_back(argv[++i]);
        }
        else if (arg == "--print-config")
        {
            print_config = true;
        }
        else if (arg == "--write-config")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: --write-config requires a path" << std::endl;
                return 1;
            }
            write_config_path = argv[++i];
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    PocoConfigManager config_manager;
    if (std::filesystem::exists(config_path))
    {
        if (!config_manager.load(config_path))
        {
            std::cerr << "Error: failed to load configuration from " << config_path << std::endl;
            return 1;
        }
    }
    else if (config_path != "config.json")
    {
        std::cerr << "Error: configuration file not found: " << config_path << std::endl;
        return 1;
    }

    for (const auto &override_text : overrides)
    {
        nlohmann::json patch;
        try
        {
            patch = nlohmann::json::parse(override_text);
        }
        catch (const nlohmann::json::parse_error &e)
        {
            std::cerr << "Error: --set value is not valid JSON: " << e.what() << std::endl;
            return 1;
        }
        if (!patch.is_object())
        {
            std::cerr << "Error: --set value must be a JSON object" << std::endl;
            return 1;
        }
        config_manager.update(patch);
    }

    if (!write_config_path.empty())
    {
        if (!config_manager.save(write_config_path))
        {
            std::cerr << "Error: cannot write configuration to " << write_config_path << std::endl;
            return 1;
        }
        std::cout << "Configuration written to " << write_config_path << std::endl;
        return 0;
    }

    if (print_config)
    {
        std::cout << config_manager.getAll().dump(4) << std::endl;
        return 0;
    }

    if (!config_manager.validateConfig())
    {
        std::cerr << "Error: invalid configuration in " << config_path << std::endl;
        return 1;
    }

    RelayConfig config = RelayConfig::fromConfig(config_manager);
    config.applyEnvironment();

    Logger::init(config.log_level);
    Logger::info("Starting media relay server (PID: " + std::to_string(getpid()) + ")...");

    std::string error_message;
    if (!config.validate(error_message))
    {
        Logger::error("Configuration error: " + error_message);
        return 1;
    }

    ShutdownManager::getInstance().installSignalHandlers();

    CommentCatalog comments;
    if (!config.comments_path.empty() && !comments.loadFromFile(config.comments_path))
    {
        Logger::warn("Using built-in comments");
    }

    MediaClassifier classifier(config);
    ProcessRunner runner(config);
    PlatformFetcher fetcher(config, runner);
    HandlerRegistry registry = HandlerRegistry::buildDefault(config, fetcher);
    if (registry.size() == 0)
    {
        Logger::error("Every platform is disabled, nothing to relay");
        return 1;
    }

    MediaSelector selector(classifier, config.max_select_concurrency);
    AcquisitionPipeline pipeline(registry, selector);

    TelegramClient client(config);
    RelayBot bot(client, pipeline, comments);
    bot.run();

    Logger::info("Media relay server stopped (" + ShutdownManager::getInstance().getReason() + ")");
    return 0;
}
