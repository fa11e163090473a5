#include "core/acquisition_pipeline.hpp"
#include "core/media_selector.hpp"
#include "core/string_utils.hpp"
#include "logging/logger.hpp"
#include <chrono>

AcquisitionPipeline::AcquisitionPipeline(const HandlerRegistry &registry, const MediaSelector &selector)
    : registry_(registry), selector_(selector)
{
}

RelayResult AcquisitionPipeline::handle(const Handler &handler, const std::string &match, MediaDelivery &delivery) const
{
    std::string target = StringUtils::trim(match);
    if (target.empty())
    {
        return RelayResult(RelayErrorKind::VALIDATION, "input cannot be empty");
    }

    auto start = std::chrono::steady_clock::now();
    Logger::info("Handling " + handler.name + " url: " + target);

    // Owns the workspace until this function returns
    DownloadResult download = handler.fetch(target);
    if (!download.success)
    {
        Logger::warn("Fetch failed for " + target + ": " + download.error.toString());
        return RelayResult::failure(download.error);
    }

    SelectionResult selection = selector_.select(download);
    if (!selection.success)
    {
        Logger::warn("Selection failed for " + target + ": " + selection.error.toString());
        return RelayResult::failure(selection.error);
    }

    RelayResult delivered = delivery.deliver(selection.winner.kind, selection.winner.path);
    if (!delivered.success)
    {
        Logger::warn("Delivery failed for " + target + ": " + delivered.error.toString());
        return delivered;
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Delivered " + handler.name + " media in " + std::to_string(elapsed.count()) + "ms");
    return RelayResult::ok();
}

RelayResult AcquisitionPipeline::handleMessage(const std::string &text, MediaDelivery &delivery) const
{
    auto match = registry_.dispatch(text);
    if (!match)
    {
        return RelayResult(RelayErrorKind::NO_MATCH, "no handler recognizes the message");
    }
    return handle(*match->handler, match->matched, delivery);
}
