#include "core/media_classifier.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/relay_config.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>

MediaClassifier::MediaClassifier(const RelayConfig &config)
    : MediaClassifier(config.video_extensions, config.image_extensions)
{
}

MediaClassifier::MediaClassifier(std::vector<std::string> video_extensions, std::vector<std::string> image_extensions)
    : video_extensions_(StringUtils::toLower(std::move(video_extensions))),
      image_extensions_(StringUtils::toLower(std::move(image_extensions)))
{
}

MediaKind MediaClassifier::classify(const std::string &file_path) const
{
    MediaKind kind = classifyByExtension(file_path);
    if (kind != MediaKind::UNKNOWN)
        return kind;

    kind = classifyByContent(file_path);
    Logger::trace("Content sniffing classified " + file_path + " as " + MediaKinds::getKindName(kind));
    return kind;
}

std::future<MediaKind> MediaClassifier::classifyAsync(const std::string &file_path) const
{
    // Copy the path; the caller's string may not outlive the task
    return std::async(std::launch::async, [this, file_path]()
                      { return classify(file_path); });
}

MediaKind MediaClassifier::classifyByExtension(const std::string &file_path) const
{
    std::string ext = getFileExtension(file_path);
    if (ext.empty())
        return MediaKind::UNKNOWN;

    if (StringUtils::contains(video_extensions_, ext))
        return MediaKind::VIDEO;
    if (StringUtils::contains(image_extensions_, ext))
        return MediaKind::IMAGE;
    return MediaKind::UNKNOWN;
}

MediaKind MediaClassifier::classifyByContent(const std::string &file_path)
{
    std::string mime_type = sniffMimeType(file_path);
    if (mime_type.empty())
        return MediaKind::UNKNOWN;
    return MediaKinds::fromMimeType(mime_type);
}

std::string MediaClassifier::getFileExtension(const std::string &file_path)
{
    std::string name = std::filesystem::path(file_path).filename().string();
    size_t dot_pos = name.find_last_of('.');
    if (dot_pos == std::string::npos || dot_pos + 1 == name.size())
    {
        return "";
    }

    return StringUtils::toLower(name.substr(dot_pos + 1));
}

std::string MediaClassifier::sniffMimeType(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        Logger::debug("Cannot open file for sniffing: " + file_path);
        return "";
    }

    std::vector<char> buffer(SNIFF_BYTES);
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    std::streamsize read = file.gcount();
    if (read <= 0)
        return "";

    // One cookie per call; libmagic cookies are not thread safe
    MagicCookieRAII cookie(MAGIC_MIME_TYPE);
    if (!cookie.isReady())
    {
        Logger::warn(std::string("libmagic unavailable: ") + cookie.lastError());
        return "";
    }

    const char *mime = magic_buffer(cookie.get(), buffer.data(), static_cast<size_t>(read));
    if (mime == nullptr)
    {
        Logger::debug("libmagic could not identify " + file_path + ": " + cookie.lastError());
        return "";
    }
    return mime;
}
