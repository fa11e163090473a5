#pragma once

#include "core/media_kind.hpp"
#include <cstddef>
#include <future>
#include <string>
#include <vector>

struct RelayConfig;

/**
 * @brief Decides whether a fetched file is a video, an image or neither
 *
 * The extension is checked first; files with an unrecognized extension are
 * sniffed with libmagic. Classification never throws: anything that cannot be
 * read or recognized is reported as UNKNOWN.
 */
class MediaClassifier
{
public:
    static constexpr std::size_t SNIFF_BYTES = 8192;

    explicit MediaClassifier(const RelayConfig &config);
    MediaClassifier(std::vector<std::string> video_extensions, std::vector<std::string> image_extensions);

    MediaKind classify(const std::string &file_path) const;

    /**
     * @brief Classify on a worker thread
     * @return Future resolving to the kind; the caller is never blocked
     */
    std::future<MediaKind> classifyAsync(const std::string &file_path) const;

    MediaKind classifyByExtension(const std::string &file_path) const;
    static MediaKind classifyByContent(const std::string &file_path);

    /**
     * @brief Lower-cased extension of the file name without the dot, empty if none
     */
    static std::string getFileExtension(const std::string &file_path);

    const std::vector<std::string> &videoExtensions() const { return video_extensions_; }
    const std::vector<std::string> &imageExtensions() const { return image_extensions_; }

private:
    static std::string sniffMimeType(const std::string &file_path);

    std::vector<std::string> video_extensions_;
    std::vector<std::string> image_extensions_;
};
