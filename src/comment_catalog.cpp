#include "core/comment_catalog.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <fstream>

const char *CommentCatalog::DISCLAIMER = "(Roleplay \xE2\x80\x94 fictional messages for entertainment.)";

namespace
{
    bool isContinuationByte(unsigned char c)
    {
        return (c & 0xC0) == 0x80;
    }

    size_t countCharacters(const std::string &text)
    {
        size_t count = 0;
        for (unsigned char c : text)
        {
            if (!isContinuationByte(c))
                ++count;
        }
        return count;
    }

    // Byte offset where the character with the given index starts
    size_t byteOffsetOf(const std::string &text, size_t char_index)
    {
        size_t seen = 0;
        for (size_t i = 0; i < text.size(); ++i)
        {
            if (isContinuationByte(static_cast<unsigned char>(text[i])))
                continue;
            if (seen == char_index)
                return i;
            ++seen;
        }
        return text.size();
    }
}

const std::vector<std::string> &CommentCatalog::fallbackComments()
{
    static const std::vector<std::string> comments = {
        "Oh come on, that's brilliant \xE2\x80\x94 and slightly chaotic, like always.",
        "That is a proper bit of craftsmanship \xE2\x80\x94 then someone presses the red button.",
        "Nice shot \xE2\x80\x94 looks good on the trailer, not so good on the gearbox.",
        "Here you go. Judge for yourself."};
    return comments;
}

CommentCatalog::CommentCatalog()
    : CommentCatalog(fallbackComments())
{
}

CommentCatalog::CommentCatalog(std::vector<std::string> lines)
    : lines_(std::move(lines)), disclaimer_(DISCLAIMER), rng_(std::random_device{}())
{
}

bool CommentCatalog::loadFromFile(const std::string &path)
{
    std::ifstream in(path);
    if (!in.is_open())
    {
        Logger::warn("Cannot open comments file: " + path);
        return false;
    }

    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line))
    {
        std::string trimmed = StringUtils::trim(line);
        if (trimmed.empty() || trimmed[0] == '#')
            continue;
        if (!StringUtils::isValidUtf8(trimmed))
        {
            Logger::warn("Skipping comment line that is not valid UTF-8 in " + path);
            continue;
        }
        lines.push_back(trimmed);
    }

    if (lines.empty())
    {
        Logger::warn("Comments file contains no usable lines: " + path);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    lines_ = std::move(lines);
    Logger::info("Loaded " + std::to_string(lines_.size()) + " comments from " + path);
    return true;
}

std::string CommentCatalog::pick() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (lines_.empty())
        return fallbackComments().front();

    std::uniform_int_distribution<size_t> dist(0, lines_.size() - 1);
    return lines_[dist(rng_)];
}

std::string CommentCatalog::buildCaption(size_t limit) const
{
    return truncate(pick(), limit);
}

std::string CommentCatalog::truncate(const std::string &text, size_t limit)
{
    if (countCharacters(text) <= limit)
        return text;
    if (limit < 3)
        return text.substr(0, byteOffsetOf(text, limit));

    return text.substr(0, byteOffsetOf(text, limit - 3)) + "...";
}

size_t CommentCatalog::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}
