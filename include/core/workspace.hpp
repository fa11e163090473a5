#pragma once

#include <memory>
#include <string>

/**
 * @brief Exclusively owned temporary directory used as the working directory of one fetch
 *
 * The directory and everything inside it is removed when the Workspace is destroyed
 * or released. A Workspace is never shared between pipeline runs, so it carries no lock.
 */
class Workspace
{
public:
    /**
     * @brief Create a fresh directory under the system temporary directory
     * @param prefix Directory name prefix
     * @return Owning pointer to the new workspace
     * @throws std::system_error if the directory cannot be created
     */
    static std::unique_ptr<Workspace> create(const std::string &prefix = "media_relay_");

    ~Workspace();

    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;

    const std::string &path() const { return path_; }

    /**
     * @brief Check that a path lies directly or indirectly inside this workspace
     */
    bool contains(const std::string &file_path) const;

    /**
     * @brief Remove the directory tree now. Safe to call more than once.
     */
    void release() noexcept;

    bool isReleased() const { return released_; }

private:
    explicit Workspace(std::string path);

    std::string path_;
    bool released_;
};
