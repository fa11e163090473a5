#pragma once

#include "core/platform.hpp"
#include "core/relay_config.hpp"
#include "core/relay_result.hpp"
#include <string>
#include <vector>

class ProcessRunner;

/**
 * @brief Binds the process runner to the fetch-tool invocation of each platform
 *
 * Every invocation has the shape
 *   executable [flags...] [--cookies <path>] <target>
 * where the cookie file is only injected when it is configured and exists.
 */
class PlatformFetcher
{
public:
    PlatformFetcher(const RelayConfig &config, const ProcessRunner &runner);

    DownloadResult fetch(Platform platform, const std::string &target) const;

    /**
     * @brief Full argument list passed to the executable for a platform and target
     */
    std::vector<std::string> buildArguments(Platform platform, const std::string &target) const;

    /**
     * @brief Cookie file to inject for a platform
     * @return The configured path if the file exists, empty otherwise
     */
    std::string resolveCookiesPath(Platform platform) const;

    const std::string &executable() const { return executable_; }

private:
    std::string executable_;
    std::map<std::string, PlatformConfig> platforms_;
    const ProcessRunner &runner_;
};
