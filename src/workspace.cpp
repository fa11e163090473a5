#include "core/workspace.hpp"
#include "logging/logger.hpp"
#include <cerrno>
#include <filesystem>
#include <system_error>
#include <vector>
#include <stdlib.h>

namespace fs = std::filesystem;

std::unique_ptr<Workspace> Workspace::create(const std::string &prefix)
{
    std::string templ = (fs::temp_directory_path() / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(templ.begin(), templ.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr)
    {
        throw std::system_error(errno, std::generic_category(), "Failed to create workspace from template " + templ);
    }

    std::string created(buffer.data());
    Logger::debug("Workspace created: " + created);
    return std::unique_ptr<Workspace>(new Workspace(created));
}

Workspace::Workspace(std::string path)
    : path_(std::move(path)), released_(false)
{
}

Workspace::~Workspace()
{
    release();
}

bool Workspace::contains(const std::string &file_path) const
{
    fs::path relative = fs::path(file_path).lexically_normal().lexically_relative(fs::path(path_).lexically_normal());
    if (relative.empty() || relative == ".")
        return false;
    return *relative.begin() != "..";
}

void Workspace::release() noexcept
{
    if (released_)
        return;
    released_ = true;

    std::error_code ec;
    auto removed = fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::error("Failed to remove workspace " + path_ + ": " + ec.message());
        return;
    }
    Logger::debug("Workspace removed: " + path_ + " (" + std::to_string(removed) + " entries)");
}
