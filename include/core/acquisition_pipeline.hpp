#pragma once

#include "core/handler_registry.hpp"
#include "core/media_delivery.hpp"
#include "core/relay_result.hpp"
#include <string>

class MediaSelector;

/**
 * @brief Fetch, select and deliver for one matched message
 *
 * Errors from every stage are returned unchanged; nothing is retried. The
 * fetch workspace is removed before handle() returns, on every path.
 */
class AcquisitionPipeline
{
public:
    AcquisitionPipeline(const HandlerRegistry &registry, const MediaSelector &selector);

    RelayResult handle(const Handler &handler, const std::string &match, MediaDelivery &delivery) const;

    /**
     * @brief Dispatch a message and handle it
     * @return NO_MATCH when no handler recognizes the text
     */
    RelayResult handleMessage(const std::string &text, MediaDelivery &delivery) const;

    const HandlerRegistry &registry() const { return registry_; }

private:
    const HandlerRegistry &registry_;
    const MediaSelector &selector_;
};
