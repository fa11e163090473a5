#pragma once

#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <unistd.h>
#include "core/relay_config.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory and a default configuration
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("DEBUG");

        std::string name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        test_files_dir_ = std::filesystem::temp_directory_path() /
                          ("media_relay_test_" + name + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(test_files_dir_);
        std::filesystem::create_directories(test_files_dir_);

        config_ = RelayConfig();
    }

    void TearDown() override
    {
        if (tmpdir_overridden_)
        {
            if (saved_tmpdir_)
                setenv("TMPDIR", saved_tmpdir_->c_str(), 1);
            else
                unsetenv("TMPDIR");
            tmpdir_overridden_ = false;
        }

        std::error_code ec;
        std::filesystem::remove_all(test_files_dir_, ec);
        if (ec)
        {
            Logger::warn("Failed to clean test directory " + test_files_dir_.string() + ": " + ec.message());
        }
    }

    // Helper to create a file with the given content inside the scratch directory
    std::string createFile(const std::string &filename, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_files_dir_ / filename;
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path.string();
    }

    std::string createFile(const std::string &filename, const std::vector<unsigned char> &bytes)
    {
        std::filesystem::path file_path = test_files_dir_ / filename;
        std::ofstream ofs(file_path, std::ios::binary);
        ofs.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        ofs.close();
        return file_path.string();
    }

    std::string getTestFilesDir() const { return test_files_dir_.string(); }

    // Points TMPDIR at an empty directory owned by this test, so every workspace lands there
    void isolateTempDir()
    {
        const char *previous = std::getenv("TMPDIR");
        if (previous)
            saved_tmpdir_ = std::string(previous);
        isolated_tmp_dir_ = test_files_dir_ / "tmp";
        std::filesystem::create_directories(isolated_tmp_dir_);
        setenv("TMPDIR", isolated_tmp_dir_.c_str(), 1);
        tmpdir_overridden_ = true;
    }

    // Workspace directories still present under the isolated TMPDIR
    std::vector<std::string> leftoverWorkspaces() const
    {
        std::vector<std::string> leftovers;
        if (isolated_tmp_dir_.empty() || !std::filesystem::exists(isolated_tmp_dir_))
            return leftovers;
        for (const auto &entry : std::filesystem::directory_iterator(isolated_tmp_dir_))
        {
            std::string name = entry.path().filename().string();
            if (name.rfind("media_relay_", 0) == 0)
                leftovers.push_back(name);
        }
        return leftovers;
    }

    // Leading bytes of a PNG file, enough for content sniffing
    static std::vector<unsigned char> pngHeader()
    {
        return {0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
                0x00, 0x00, 0x00, 0x0D, 0x49, 0x48, 0x44, 0x52,
                0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x01,
                0x08, 0x02, 0x00, 0x00, 0x00, 0x90, 0x77, 0x53, 0xDE};
    }

    RelayConfig config_;

private:
    std::filesystem::path test_files_dir_;
    std::filesystem::path isolated_tmp_dir_;
    std::optional<std::string> saved_tmpdir_;
    bool tmpdir_overridden_ = false;
};
