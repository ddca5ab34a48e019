#include <gtest/gtest.h>
#include "core/file_entry.hpp"
#include "test_base.hpp"
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

class FileEntryTest : public TestBase
{
};

TEST_F(FileEntryTest, DescribesMimeAndCategory)
{
    auto path = createFile("pics/holiday.png", "not really a png");
    FileEntry entry(path.string(), "pics/holiday.png", 16, 1);

    EXPECT_EQ(entry.path(), path.string());
    EXPECT_EQ(entry.relativePath(), "pics/holiday.png");
    EXPECT_EQ(entry.size(), 16u);
    EXPECT_EQ(entry.mimeType(), "image/png");
    EXPECT_EQ(entry.category(), "image");
    EXPECT_NE(entry.toString().find("pics/holiday.png"), std::string::npos);
}

TEST_F(FileEntryTest, FingerprintIsLazyAndMemoized)
{
    auto path = createFile("a.txt", "hello");
    FileEntry entry(path.string(), "a.txt", 5, 1);

    EXPECT_FALSE(entry.hasFingerprint());
    const std::string &first = entry.fingerprint();
    EXPECT_TRUE(entry.hasFingerprint());
    EXPECT_EQ(first, "2cf24dba5fb0a30e26e83b2ac5b9e29e1b161e5c1fa7425e73043362938b9824");

    // Content changes after the first call are not observed
    createFile("a.txt", "world");
    EXPECT_EQ(entry.fingerprint(), first);
}

TEST_F(FileEntryTest, FingerprintFailureCanBeRetried)
{
    std::string path = getTestFilesDir() + "/later.txt";
    FileEntry entry(path, "later.txt", 5, 1);

    EXPECT_THROW(entry.fingerprint(), FileAccessError);
    EXPECT_FALSE(entry.hasFingerprint());

    createFile("later.txt", "hello");
    EXPECT_EQ(entry.fingerprint(), FileUtils::computeFileHash(path));
    EXPECT_TRUE(entry.hasFingerprint());
}

TEST_F(FileEntryTest, ConcurrentFingerprintCallsAgree)
{
    auto path = createFile("shared.bin", std::string(256 * 1024, 'q'));
    auto entry = std::make_shared<const FileEntry>(path.string(), "shared.bin", 256 * 1024, 1);

    std::vector<std::string> results(8);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < results.size(); ++i)
    {
        threads.emplace_back([&, i]()
                             { results[i] = entry->fingerprint(); });
    }
    for (auto &t : threads)
        t.join();

    for (const auto &result : results)
        EXPECT_EQ(result, results.front());
    EXPECT_EQ(results.front().size(), 64u);
}
