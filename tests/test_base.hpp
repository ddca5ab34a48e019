#pragma once

#include <gtest/gtest.h>
#include <unistd.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include "core/config_manager.hpp"
#include "logging/logger.hpp"

/**
 * @brief Base class for tests that need a scratch directory tree
 *
 * Every test gets its own directory under the system temp dir, removed on
 * TearDown, plus a path for a state database next to it.
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string unique = std::string(info->test_suite_name()) + "_" + info->name() + "_" +
                             std::to_string(::getpid());

        test_root_ = std::filesystem::temp_directory_path() / ("tree_uploader_test_" + unique);
        std::filesystem::remove_all(test_root_);
        test_files_dir_ = test_root_ / "tree";
        std::filesystem::create_directories(test_files_dir_);
        test_db_path_ = (test_root_ / "state.db").string();

        ConfigManager::getInstance().initializeDefaultConfig();
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_root_, ec);
        if (ec)
            Logger::warn("Could not remove test directory " + test_root_.string() + ": " + ec.message());
    }

    // Create a file (and its parent directories) under the test tree
    std::filesystem::path createFile(const std::string &relative, const std::string &content = "dummy content")
    {
        std::filesystem::path file_path = test_files_dir_ / relative;
        std::filesystem::create_directories(file_path.parent_path());
        std::ofstream ofs(file_path, std::ios::binary);
        ofs << content;
        ofs.close();
        return file_path;
    }

    std::filesystem::path createDirectory(const std::string &relative)
    {
        std::filesystem::path dir = test_files_dir_ / relative;
        std::filesystem::create_directories(dir);
        return dir;
    }

    // Push the modification time forward so size-equal rewrites are still detected
    void touchLater(const std::filesystem::path &file)
    {
        auto now = std::filesystem::last_write_time(file);
        std::filesystem::last_write_time(file, now + std::chrono::seconds(5));
    }

    std::string getTestDbPath() const { return test_db_path_; }
    std::string getTestFilesDir() const { return test_files_dir_.string(); }
    std::filesystem::path getTestRoot() const { return test_root_; }

private:
    std::filesystem::path test_root_;
    std::filesystem::path test_files_dir_;
    std::string test_db_path_;
};
