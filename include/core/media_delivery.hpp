#pragma once

#include "core/media_kind.hpp"
#include "core/relay_result.hpp"
#include <string>

/**
 * @brief Destination that receives the selected media file
 *
 * Implementations report send failures as TRANSPORT errors. The file only
 * exists until deliver() returns.
 */
class MediaDelivery
{
public:
    virtual ~MediaDelivery() = default;

    virtual RelayResult deliver(MediaKind kind, const std::string &path) = 0;
};
