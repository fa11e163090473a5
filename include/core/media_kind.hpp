#pragma once

#include <string>

/**
 * @brief Kind of a fetched media file, derived from its extension or leading bytes
 */
enum class MediaKind
{
    VIDEO,
    IMAGE,
    UNKNOWN
};

class MediaKinds
{
public:
    /**
     * @brief Get the kind name as string
     * @param kind The media kind
     * @return String representation of the kind
     */
    static std::string getKindName(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::VIDEO:
            return "VIDEO";
        case MediaKind::IMAGE:
            return "IMAGE";
        case MediaKind::UNKNOWN:
            return "UNKNOWN";
        default:
            return "UNKNOWN";
        }
    }

    /**
     * @brief Selection preference of a kind; lower ranks win
     *
     * Video outranks image, image outranks anything else.
     */
    static int preferenceRank(MediaKind kind)
    {
        switch (kind)
        {
        case MediaKind::VIDEO:
            return 0;
        case MediaKind::IMAGE:
            return 1;
        default:
            return 2;
        }
    }

    /**
     * @brief Map a MIME type to a kind using its top-level token
     * @param mime_type MIME type such as "video/mp4"
     * @return VIDEO for video/..., IMAGE for image/..., UNKNOWN otherwise
     */
    static MediaKind fromMimeType(const std::string &mime_type)
    {
        if (mime_type.rfind("video/", 0) == 0)
            return MediaKind::VIDEO;
        if (mime_type.rfind("image/", 0) == 0)
            return MediaKind::IMAGE;
        return MediaKind::UNKNOWN;
    }
};
