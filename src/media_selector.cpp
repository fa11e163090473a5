#include "core/media_selector.hpp"
#include "core/media_classifier.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <sys/stat.h>
#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

MediaSelector::MediaSelector(const MediaClassifier &classifier, int max_concurrency)
    : classifier_(classifier), max_concurrency_(std::max(1, max_concurrency))
{
}

SelectionResult MediaSelector::select(const DownloadResult &result) const
{
    if (result.files.empty())
    {
        return SelectionResult(RelayErrorKind::NO_MEDIA_FOUND, "no files to select from");
    }

    std::vector<std::string> files;
    files.reserve(result.files.size());
    for (const auto &path : result.files)
    {
        if (result.workspace && !result.workspace->contains(path))
        {
            Logger::warn("Ignoring file outside the workspace: " + path);
            continue;
        }
        files.push_back(path);
    }

    std::vector<Candidate> candidates = classifyAll(files);
    if (candidates.empty())
    {
        Logger::warn("None of " + std::to_string(result.files.size()) + " file(s) is a usable video or image");
        return SelectionResult(RelayErrorKind::NO_MEDIA_FOUND, "no usable video or image among fetched files");
    }

    order(candidates);
    const Candidate &winner = candidates.front();
    Logger::info("Selected " + winner.path + " (" + MediaKinds::getKindName(winner.kind) + ") out of " +
                 std::to_string(candidates.size()) + " candidate(s)");
    return SelectionResult(winner);
}

std::vector<Candidate> MediaSelector::classifyAll(const std::vector<std::string> &files) const
{
    std::vector<std::optional<Candidate>> slots(files.size());
    if (files.empty())
        return {};

    int concurrency = static_cast<int>(std::min<size_t>(static_cast<size_t>(max_concurrency_), files.size()));

    // Each index writes only its own slot, so no lock is needed
    tbb::task_arena arena(concurrency);
    arena.execute([&]
                  { tbb::parallel_for(tbb::blocked_range<size_t>(0, files.size(), 1),
                                      [&](const tbb::blocked_range<size_t> &range)
                                      {
                                          for (size_t i = range.begin(); i != range.end(); ++i)
                                          {
                                              slots[i] = inspect(files[i]);
                                          }
                                      }); });

    std::vector<Candidate> candidates;
    for (auto &slot : slots)
    {
        if (slot)
            candidates.push_back(std::move(*slot));
    }
    return candidates;
}

void MediaSelector::order(std::vector<Candidate> &candidates)
{
    std::sort(candidates.begin(), candidates.end(), [](const Candidate &a, const Candidate &b)
              {
                  int rank_a = MediaKinds::preferenceRank(a.kind);
                  int rank_b = MediaKinds::preferenceRank(b.kind);
                  if (rank_a != rank_b)
                      return rank_a < rank_b;
                  return a.path < b.path; });
}

std::optional<Candidate> MediaSelector::inspect(const std::string &path) const
{
    struct stat st;
    if (::stat(path.c_str(), &st) != 0)
    {
        Logger::debug("Skipping unreadable file: " + path);
        return std::nullopt;
    }
    if (!S_ISREG(st.st_mode) || st.st_size == 0)
    {
        Logger::debug("Skipping empty or non-regular file: " + path);
        return std::nullopt;
    }

    MediaKind kind = classifier_.classify(path);
    if (kind == MediaKind::UNKNOWN)
    {
        Logger::debug("Skipping unclassified file: " + path);
        return std::nullopt;
    }
    return Candidate(path, kind);
}
