#pragma once

#include "core/relay_result.hpp"
#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

struct RelayConfig;

/**
 * @brief Runs an external fetch executable inside a fresh workspace and collects its output files
 *
 * The executable runs with the workspace as working directory, stdin and stdout
 * attached to /dev/null and stderr captured. On a zero exit status the workspace is
 * scanned (non-recursively) for potential media files, which are returned sorted
 * together with the workspace that owns them.
 */
class ProcessRunner
{
public:
    // Upper bound on captured stderr; older output is dropped first
    static constexpr size_t MAX_STDERR_BYTES = 64 * 1024;

    explicit ProcessRunner(const RelayConfig &config);

    /**
     * @brief Run the executable and collect the files it produced
     * @param executable Name looked up on PATH, or a path
     * @param args Arguments, not including the executable itself
     * @return Workspace and sorted media paths on success; IO, FETCH_TOOL or NO_MEDIA_FOUND otherwise
     */
    DownloadResult run(const std::string &executable, const std::vector<std::string> &args) const;

    /**
     * @brief Name-based pre-filter applied before classification
     *
     * Hidden files, names containing "metadata", files without an extension and
     * files with a forbidden extension are rejected; the extension must be an
     * enabled video or image extension.
     */
    bool isPotentialMediaFile(const std::string &file_name) const;

    /**
     * @brief Potential media files directly inside a directory, sorted by path
     * @param directory Directory to list
     * @param listing Receives every entry name, for diagnostics
     * @throws std::filesystem::filesystem_error if the directory cannot be listed
     */
    std::vector<std::string> scanDirectory(const std::string &directory, std::vector<std::string> &listing) const;

    /**
     * @brief Failure text for a tool, e.g. "yt-dlp failed: HTTP Error 429"
     */
    static std::string formatToolFailure(const std::string &tool, const std::string &detail);

    std::chrono::seconds timeout() const { return timeout_; }

private:
    struct ExitStatus
    {
        int spawn_error = 0; // errno from posix_spawnp, 0 when the process started
        bool timed_out = false;
        bool exited = false;
        int exit_code = -1;
        int signal = 0;
        std::string stderr_text;
    };

    ExitStatus execute(const std::string &executable, const std::vector<std::string> &args,
                       const std::string &working_dir) const;
    void terminate(pid_t pid, int &status) const;

    std::vector<std::string> video_extensions_;
    std::vector<std::string> image_extensions_;
    std::vector<std::string> forbidden_extensions_;
    std::chrono::seconds timeout_;
};
