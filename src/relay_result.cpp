#include "core/relay_result.hpp"

std::string RelayError::kindName(RelayErrorKind kind)
{
    switch (kind)
    {
    case RelayErrorKind::NONE:
        return "none";
    case RelayErrorKind::IO:
        return "io error";
    case RelayErrorKind::FETCH_TOOL:
        return "fetch tool error";
    case RelayErrorKind::NO_MEDIA_FOUND:
        return "no media found";
    case RelayErrorKind::UNKNOWN_MEDIA_KIND:
        return "unknown media kind";
    case RelayErrorKind::TRANSPORT:
        return "transport error";
    case RelayErrorKind::NO_MATCH:
        return "no matching handler";
    case RelayErrorKind::VALIDATION:
        return "validation error";
    case RelayErrorKind::CONFIG:
        return "configuration error";
    case RelayErrorKind::INTERNAL:
        return "internal error";
    default:
        return "unknown error";
    }
}

std::string RelayError::toString() const
{
    std::string text = kindName(kind);
    if (!tool.empty())
        text += " (" + tool + ")";
    if (!message.empty())
        text += ": " + message;
    return text;
}
