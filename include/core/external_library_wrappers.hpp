#pragma once
#include <magic.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

// RAII wrapper for a libmagic cookie. A cookie must not be shared between threads.
class MagicCookieRAII
{
private:
    magic_t cookie_;
    bool loaded_;

public:
    explicit MagicCookieRAII(int flags) : cookie_(magic_open(flags)), loaded_(false)
    {
        if (cookie_)
            loaded_ = magic_load(cookie_, nullptr) == 0;
    }

    ~MagicCookieRAII()
    {
        if (cookie_)
            magic_close(cookie_);
    }

    magic_t get() { return cookie_; }
    bool isReady() const { return cookie_ != nullptr && loaded_; }

    const char *lastError()
    {
        const char *err = cookie_ ? magic_error(cookie_) : nullptr;
        return err ? err : "magic_open failed";
    }

    // Disable copy
    MagicCookieRAII(const MagicCookieRAII &) = delete;
    MagicCookieRAII &operator=(const MagicCookieRAII &) = delete;
};

// RAII wrapper for posix_spawn file actions
class SpawnFileActionsRAII
{
private:
    posix_spawn_file_actions_t actions_;
    bool initialized_;

public:
    SpawnFileActionsRAII() : initialized_(posix_spawn_file_actions_init(&actions_) == 0) {}

    ~SpawnFileActionsRAII()
    {
        if (initialized_)
            posix_spawn_file_actions_destroy(&actions_);
    }

    posix_spawn_file_actions_t *get() { return &actions_; }
    bool isInitialized() const { return initialized_; }

    // Disable copy
    SpawnFileActionsRAII(const SpawnFileActionsRAII &) = delete;
    SpawnFileActionsRAII &operator=(const SpawnFileActionsRAII &) = delete;
};

// RAII wrapper for posix_spawn attributes
class SpawnAttrRAII
{
private:
    posix_spawnattr_t attr_;
    bool initialized_;

public:
    SpawnAttrRAII() : initialized_(posix_spawnattr_init(&attr_) == 0) {}

    ~SpawnAttrRAII()
    {
        if (initialized_)
            posix_spawnattr_destroy(&attr_);
    }

    posix_spawnattr_t *get() { return &attr_; }
    bool isInitialized() const { return initialized_; }

    // Disable copy
    SpawnAttrRAII(const SpawnAttrRAII &) = delete;
    SpawnAttrRAII &operator=(const SpawnAttrRAII &) = delete;
};

// RAII wrapper for a POSIX file descriptor
class FileDescriptorRAII
{
private:
    int fd_;

public:
    FileDescriptorRAII() : fd_(-1) {}
    explicit FileDescriptorRAII(int fd) : fd_(fd) {}

    ~FileDescriptorRAII()
    {
        reset();
    }

    int get() const { return fd_; }
    bool isValid() const { return fd_ >= 0; }

    void reset(int new_fd = -1)
    {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = new_fd;
    }

    // Disable copy
    FileDescriptorRAII(const FileDescriptorRAII &) = delete;
    FileDescriptorRAII &operator=(const FileDescriptorRAII &) = delete;

    // Allow move
    FileDescriptorRAII(FileDescriptorRAII &&other) noexcept : fd_(other.fd_)
    {
        other.fd_ = -1;
    }
};
