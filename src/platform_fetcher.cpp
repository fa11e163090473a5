#include "core/platform_fetcher.hpp"
#include "core/process_runner.hpp"
#include "logging/logger.hpp"
#include <filesystem>

PlatformFetcher::PlatformFetcher(const RelayConfig &config, const ProcessRunner &runner)
    : executable_(config.fetch_executable), platforms_(config.platforms), runner_(runner)
{
}

DownloadResult PlatformFetcher::fetch(Platform platform, const std::string &target) const
{
    Logger::info("Fetching " + Platforms::getPlatformName(platform) + " media: " + target);
    return runner_.run(executable_, buildArguments(platform, target));
}

std::vector<std::string> PlatformFetcher::buildArguments(Platform platform, const std::string &target) const
{
    std::vector<std::string> args;

    switch (platform)
    {
    case Platform::YOUTUBE:
    {
        args = {"--no-playlist",
                "-f", "bestvideo[ext=mp4]+bestaudio[ext=m4a]/bestvideo+bestaudio/best",
                "--merge-output-format", "mp4"};
        auto it = platforms_.find(Platforms::getPlatformName(platform));
        if (it != platforms_.end() && !it->second.postprocessor_args.empty())
        {
            args.push_back("--postprocessor-args");
            args.push_back(it->second.postprocessor_args);
        }
        break;
    }
    case Platform::INSTAGRAM:
    case Platform::TWITTER:
    case Platform::TIKTOK:
        args = {"-t", "mp4"};
        break;
    }

    std::string cookies = resolveCookiesPath(platform);
    if (!cookies.empty())
    {
        args.push_back("--cookies");
        args.push_back(cookies);
    }

    args.push_back(target);
    return args;
}

std::string PlatformFetcher::resolveCookiesPath(Platform platform) const
{
    std::string name = Platforms::getPlatformName(platform);
    auto it = platforms_.find(name);
    if (it == platforms_.end() || it->second.cookies_path.empty())
        return "";

    const std::string &path = it->second.cookies_path;
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        Logger::warn("Cookie file for " + name + " not found, fetching without cookies: " + path);
        return "";
    }
    return path;
}
