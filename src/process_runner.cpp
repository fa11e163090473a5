#include "core/process_runner.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/media_classifier.hpp"
#include "core/relay_config.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <system_error>

extern char **environ;

namespace fs = std::filesystem;

namespace
{
    constexpr int POLL_INTERVAL_MS = 100;
    constexpr auto TERMINATE_GRACE = std::chrono::seconds(5);

    void appendCapped(std::string &out, const char *data, size_t size)
    {
        out.append(data, size);
        if (out.size() > ProcessRunner::MAX_STDERR_BYTES)
        {
            out.erase(0, out.size() - ProcessRunner::MAX_STDERR_BYTES);
        }
    }

    // Returns false once the write end is closed or the read fails
    bool drainPipe(int fd, std::string &out)
    {
        char buffer[4096];
        while (true)
        {
            ssize_t n = ::read(fd, buffer, sizeof(buffer));
            if (n > 0)
            {
                appendCapped(out, buffer, static_cast<size_t>(n));
                continue;
            }
            if (n == 0)
                return false;
            if (errno == EINTR)
                continue;
            return errno == EAGAIN || errno == EWOULDBLOCK;
        }
    }

    pid_t waitNoHang(pid_t pid, int &status)
    {
        pid_t rc;
        do
        {
            rc = waitpid(pid, &status, WNOHANG);
        } while (rc < 0 && errno == EINTR);
        return rc;
    }

    std::string joinListing(const std::vector<std::string> &listing)
    {
        if (listing.empty())
            return "(empty)";
        std::string joined;
        for (const auto &name : listing)
        {
            if (!joined.empty())
                joined += ", ";
            joined += name;
        }
        return joined;
    }
}

ProcessRunner::ProcessRunner(const RelayConfig &config)
    : video_extensions_(StringUtils::toLower(config.video_extensions)),
      image_extensions_(StringUtils::toLower(config.image_extensions)),
      forbidden_extensions_(StringUtils::toLower(config.forbidden_extensions)),
      timeout_(std::max(0, config.fetch_timeout_seconds))
{
}

DownloadResult ProcessRunner::run(const std::string &executable, const std::vector<std::string> &args) const
{
    std::string tool = fs::path(executable).filename().string();

    std::unique_ptr<Workspace> workspace;
    try
    {
        workspace = Workspace::create();
    }
    catch (const std::system_error &e)
    {
        Logger::error(std::string("Workspace creation failed: ") + e.what());
        return DownloadResult(RelayErrorKind::IO, std::string("workspace creation failed: ") + e.what());
    }

    Logger::info("Running " + tool + " in " + workspace->path());
    ExitStatus status = execute(executable, args, workspace->path());

    if (status.spawn_error != 0)
    {
        std::string reason = std::strerror(status.spawn_error);
        Logger::error("Failed to start " + executable + ": " + reason);
        return DownloadResult(RelayErrorKind::IO, "failed to start " + executable + ": " + reason);
    }

    if (status.timed_out)
    {
        std::string detail = "timed out after " + std::to_string(timeout_.count()) + " seconds";
        Logger::error(tool + " " + detail);
        return DownloadResult(RelayErrorKind::FETCH_TOOL, formatToolFailure(tool, detail), tool);
    }

    if (!status.exited || status.exit_code != 0)
    {
        std::string detail = StringUtils::trim(status.stderr_text);
        if (detail.empty())
        {
            if (status.exited)
                detail = "exit code " + std::to_string(status.exit_code);
            else if (status.signal != 0)
                detail = "killed by signal " + std::to_string(status.signal);
            else
                detail = "terminated abnormally";
        }
        Logger::error(formatToolFailure(tool, detail));
        return DownloadResult(RelayErrorKind::FETCH_TOOL, formatToolFailure(tool, detail), tool);
    }

    if (!status.stderr_text.empty())
    {
        Logger::debug(tool + " stderr: " + StringUtils::trim(status.stderr_text));
    }

    std::vector<std::string> listing;
    std::vector<std::string> files;
    try
    {
        files = scanDirectory(workspace->path(), listing);
    }
    catch (const fs::filesystem_error &e)
    {
        Logger::error(std::string("Workspace scan failed: ") + e.what());
        return DownloadResult(RelayErrorKind::IO, std::string("workspace scan failed: ") + e.what());
    }

    if (files.empty())
    {
        Logger::warn("No media produced by " + tool + " in " + workspace->path() + ", directory contents: " + joinListing(listing));
        return DownloadResult(RelayErrorKind::NO_MEDIA_FOUND, "no media found in fetch output");
    }

    Logger::info(tool + " produced " + std::to_string(files.size()) + " candidate file(s)");

    DownloadResult result;
    result.success = true;
    result.workspace = std::move(workspace);
    result.files = std::move(files);
    return result;
}

bool ProcessRunner::isPotentialMediaFile(const std::string &file_name) const
{
    if (file_name.empty() || file_name[0] == '.')
        return false;

    std::string lower = StringUtils::toLower(file_name);
    if (lower.find("metadata") != std::string::npos)
        return false;

    std::string ext = MediaClassifier::getFileExtension(lower);
    if (ext.empty() || StringUtils::contains(forbidden_extensions_, ext))
        return false;

    return StringUtils::contains(video_extensions_, ext) || StringUtils::contains(image_extensions_, ext);
}

std::vector<std::string> ProcessRunner::scanDirectory(const std::string &directory, std::vector<std::string> &listing) const
{
    std::vector<std::string> files;
    for (const auto &entry : fs::directory_iterator(directory))
    {
        std::string name = entry.path().filename().string();
        listing.push_back(name);

        std::error_code ec;
        if (!entry.is_regular_file(ec) || ec)
            continue;
        if (isPotentialMediaFile(name))
            files.push_back(entry.path().string());
    }

    std::sort(listing.begin(), listing.end());
    std::sort(files.begin(), files.end());
    return files;
}

std::string ProcessRunner::formatToolFailure(const std::string &tool, const std::string &detail)
{
    if (tool == "yt-dlp")
        return "yt-dlp failed: " + detail;
    if (tool == "instaloader")
        return "instaloader failed: " + detail;
    return (tool.empty() ? std::string("fetch tool") : tool) + " failed: " + detail;
}

ProcessRunner::ExitStatus ProcessRunner::execute(const std::string &executable, const std::vector<std::string> &args,
                                                 const std::string &working_dir) const
{
    ExitStatus result;

    int fds[2];
    if (pipe2(fds, O_CLOEXEC) != 0)
    {
        result.spawn_error = errno;
        return result;
    }
    FileDescriptorRAII read_end(fds[0]);
    FileDescriptorRAII write_end(fds[1]);

    SpawnFileActionsRAII actions;
    if (!actions.isInitialized())
    {
        result.spawn_error = ENOMEM;
        return result;
    }

    int rc = posix_spawn_file_actions_addopen(actions.get(), STDIN_FILENO, "/dev/null", O_RDONLY, 0);
    if (rc == 0)
        rc = posix_spawn_file_actions_addopen(actions.get(), STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
    if (rc == 0)
        rc = posix_spawn_file_actions_adddup2(actions.get(), write_end.get(), STDERR_FILENO);
    if (rc == 0)
        rc = posix_spawn_file_actions_addchdir_np(actions.get(), working_dir.c_str());
    if (rc != 0)
    {
        result.spawn_error = rc;
        return result;
    }

    // The server ignores SIGPIPE; the tool gets the default disposition back
    SpawnAttrRAII attr;
    if (!attr.isInitialized())
    {
        result.spawn_error = ENOMEM;
        return result;
    }
    sigset_t default_signals;
    sigemptyset(&default_signals);
    sigaddset(&default_signals, SIGPIPE);
    rc = posix_spawnattr_setsigdefault(attr.get(), &default_signals);
    if (rc == 0)
        rc = posix_spawnattr_setflags(attr.get(), POSIX_SPAWN_SETSIGDEF);
    if (rc != 0)
    {
        result.spawn_error = rc;
        return result;
    }

    std::vector<char *> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char *>(executable.c_str()));
    for (const auto &arg : args)
    {
        argv.push_back(const_cast<char *>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = 0;
    rc = posix_spawnp(&pid, executable.c_str(), actions.get(), attr.get(), argv.data(), environ);
    if (rc != 0)
    {
        result.spawn_error = rc;
        return result;
    }

    // Only the child keeps the write end; EOF arrives once it (and its children) exit
    write_end.reset();
    fcntl(read_end.get(), F_SETFL, fcntl(read_end.get(), F_GETFL) | O_NONBLOCK);

    auto deadline = std::chrono::steady_clock::now() + timeout_;
    bool pipe_open = true;
    int status = 0;

    while (true)
    {
        if (pipe_open)
        {
            struct pollfd pfd;
            pfd.fd = read_end.get();
            pfd.events = POLLIN;
            pfd.revents = 0;
            int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
            if (ready > 0)
                pipe_open = drainPipe(read_end.get(), result.stderr_text);
            else if (ready < 0 && errno != EINTR)
                pipe_open = false;
        }
        else
        {
            poll(nullptr, 0, POLL_INTERVAL_MS);
        }

        pid_t done = waitNoHang(pid, status);
        if (done == pid)
            break;
        if (done < 0)
        {
            Logger::error("waitpid failed for " + executable + ": " + std::strerror(errno));
            return result;
        }

        if (timeout_.count() > 0 && std::chrono::steady_clock::now() >= deadline)
        {
            Logger::warn(executable + " exceeded " + std::to_string(timeout_.count()) + "s, terminating pid " + std::to_string(pid));
            terminate(pid, status);
            result.timed_out = true;
            break;
        }
    }

    // Collect whatever the process wrote right before exiting
    if (pipe_open)
        drainPipe(read_end.get(), result.stderr_text);

    if (WIFEXITED(status))
    {
        result.exited = true;
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.signal = WTERMSIG(status);
    }
    return result;
}

void ProcessRunner::terminate(pid_t pid, int &status) const
{
    kill(pid, SIGTERM);

    auto grace_deadline = std::chrono::steady_clock::now() + TERMINATE_GRACE;
    while (std::chrono::steady_clock::now() < grace_deadline)
    {
        if (waitNoHang(pid, status) == pid)
            return;
        poll(nullptr, 0, POLL_INTERVAL_MS);
    }

    Logger::warn("Process " + std::to_string(pid) + " ignored SIGTERM, sending SIGKILL");
    kill(pid, SIGKILL);
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR)
    {
    }
}
