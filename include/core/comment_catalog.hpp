#pragma once

#include <cstddef>
#include <mutex>
#include <random>
#include <string>
#include <vector>

/**
 * @brief Pool of one-line comments used as media captions and /curse replies
 */
class CommentCatalog
{
public:
    // Telegram limits, counted in characters
    static constexpr size_t CAPTION_LIMIT = 1024;
    static constexpr size_t MESSAGE_LIMIT = 4096;

    static const char *DISCLAIMER;

    static const std::vector<std::string> &fallbackComments();

    /**
     * @brief Catalog holding the built-in comments
     */
    CommentCatalog();
    explicit CommentCatalog(std::vector<std::string> lines);

    CommentCatalog(const CommentCatalog &) = delete;
    CommentCatalog &operator=(const CommentCatalog &) = delete;

    /**
     * @brief Replace the comments with the usable lines of a text file
     *
     * Lines are trimmed; blank lines and lines starting with '#' are skipped.
     * @return false (catalog unchanged) if the file cannot be read or has no usable line
     */
    bool loadFromFile(const std::string &path);

    /**
     * @brief A random comment, or the first built-in one when the catalog is empty
     */
    std::string pick() const;

    /**
     * @brief A random comment cut down to at most limit characters
     */
    std::string buildCaption(size_t limit = CAPTION_LIMIT) const;

    /**
     * @brief Cut UTF-8 text to at most limit characters, ending in "..." when shortened
     */
    static std::string truncate(const std::string &text, size_t limit);

    const std::string &disclaimer() const { return disclaimer_; }
    size_t size() const;

private:
    std::vector<std::string> lines_;
    std::string disclaimer_;

    mutable std::mutex mutex_;
    mutable std::mt19937 rng_;
};
