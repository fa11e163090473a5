#pragma once

#include "core/relay_result.hpp"
#include <optional>
#include <string>
#include <vector>

class MediaClassifier;

/**
 * @brief Picks the one file of a download that gets delivered
 *
 * Files are checked and classified concurrently; the winner is then chosen by
 * a total order (video before image, then path) so the outcome does not depend
 * on which classification finished first.
 */
class MediaSelector
{
public:
    static constexpr int DEFAULT_MAX_CONCURRENCY = 8;

    MediaSelector(const MediaClassifier &classifier, int max_concurrency = DEFAULT_MAX_CONCURRENCY);

    SelectionResult select(const DownloadResult &result) const;

    /**
     * @brief Check and classify every path, keeping those that are regular non-empty video or image files
     * @return Survivors in no particular order
     */
    std::vector<Candidate> classifyAll(const std::vector<std::string> &files) const;

    /**
     * @brief Sort candidates by kind preference, then path
     */
    static void order(std::vector<Candidate> &candidates);

    int maxConcurrency() const { return max_concurrency_; }

private:
    std::optional<Candidate> inspect(const std::string &path) const;

    const MediaClassifier &classifier_;
    int max_concurrency_;
};
