#pragma once

#include "core/media_kind.hpp"
#include "core/workspace.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Failure categories surfaced by the acquisition pipeline
 */
enum class RelayErrorKind
{
    NONE,
    IO,                 // workspace creation, directory scan, spawn or file read failed
    FETCH_TOOL,         // external fetch executable exited non-zero or timed out
    NO_MEDIA_FOUND,     // fetch succeeded but nothing usable was produced
    UNKNOWN_MEDIA_KIND, // single-file delivery was asked to send an unclassified file
    TRANSPORT,          // the delivery collaborator failed to send
    NO_MATCH,           // no registered handler recognizes the message
    VALIDATION,         // matched identifier was empty after trimming
    CONFIG,             // invalid or incomplete configuration
    INTERNAL            // unexpected exception caught at a task boundary
};

struct RelayError
{
    RelayErrorKind kind;
    std::string tool; // fetch executable name for FETCH_TOOL errors
    std::string message;

    RelayError() : kind(RelayErrorKind::NONE) {}
    RelayError(RelayErrorKind k, const std::string &msg, const std::string &t = "")
        : kind(k), tool(t), message(msg) {}

    static std::string kindName(RelayErrorKind kind);

    /**
     * @brief Human-readable description such as "fetch tool error (yt-dlp): rate limited"
     */
    std::string toString() const;
};

/**
 * @brief Outcome of a pipeline stage that produces no value
 */
struct RelayResult
{
    bool success;
    RelayError error;

    RelayResult() : success(false) {}
    explicit RelayResult(bool s) : success(s) {}
    RelayResult(RelayErrorKind kind, const std::string &msg, const std::string &tool = "")
        : success(false), error(kind, msg, tool) {}

    static RelayResult ok() { return RelayResult(true); }
    static RelayResult failure(const RelayError &err)
    {
        RelayResult result;
        result.error = err;
        return result;
    }
};

/**
 * @brief Files produced by one fetch, together with the workspace that holds them
 *
 * Every path in files lies inside workspace. The workspace is removed when this
 * value (or whoever took the workspace from it) is destroyed, so keep it alive
 * until the selected file has been sent.
 */
struct DownloadResult
{
    bool success;
    RelayError error;
    std::unique_ptr<Workspace> workspace;
    std::vector<std::string> files;

    DownloadResult() : success(false) {}
    DownloadResult(RelayErrorKind kind, const std::string &msg, const std::string &tool = "")
        : success(false), error(kind, msg, tool) {}

    DownloadResult(DownloadResult &&) = default;
    DownloadResult &operator=(DownloadResult &&) = default;
};

/**
 * @brief A classified file that survived the selector's checks
 */
struct Candidate
{
    std::string path;
    MediaKind kind;

    Candidate() : kind(MediaKind::UNKNOWN) {}
    Candidate(const std::string &p, MediaKind k) : path(p), kind(k) {}
};

struct SelectionResult
{
    bool success;
    RelayError error;
    Candidate winner;

    SelectionResult() : success(false) {}
    explicit SelectionResult(const Candidate &c) : success(true), winner(c) {}
    SelectionResult(RelayErrorKind kind, const std::string &msg)
        : success(false), error(kind, msg) {}
};
