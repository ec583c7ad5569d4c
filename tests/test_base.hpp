#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>
#include <vector>
#include "core/pipeline_settings.hpp"
#include "logging/logger.hpp"

namespace fs = std::filesystem;

/**
 * @brief Base class for tests that need a media root on disk.
 *
 * Every test gets its own directory under the system temp directory with a
 * "files" media root inside; it is removed again in TearDown.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        Logger::init("WARN");

        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_root_ = fs::temp_directory_path() /
                     ("memelet_" + std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                      std::to_string(::getpid()));
        fs::remove_all(test_root_);
        fs::create_directories(test_root_ / "files");

        settings_.media_root = (test_root_ / "files").string();
        settings_.database_path = (test_root_ / "memelet.db").string();
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(test_root_, ec);
    }

    // Absolute path of a file below the media root
    std::string pathOf(const std::string &relative) const
    {
        return (settings_.getMediaRoot() / relative).string();
    }

    std::string writeFile(const std::string &relative, const std::string &content)
    {
        fs::path target = settings_.getMediaRoot() / relative;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out << content;
        out.close();
        return target.string();
    }

    std::string writeBytes(const std::string &relative, const std::vector<unsigned char> &bytes)
    {
        fs::path target = settings_.getMediaRoot() / relative;
        fs::create_directories(target.parent_path());
        std::ofstream out(target, std::ios::binary);
        out.write(reinterpret_cast<const char *>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.close();
        return target.string();
    }

    std::string moveFile(const std::string &from_relative, const std::string &to_relative)
    {
        fs::path to = settings_.getMediaRoot() / to_relative;
        fs::create_directories(to.parent_path());
        fs::rename(settings_.getMediaRoot() / from_relative, to);
        return to.string();
    }

    void removeFile(const std::string &relative)
    {
        fs::remove(settings_.getMediaRoot() / relative);
    }

    fs::path test_root_;
    PipelineSettings settings_;
};
