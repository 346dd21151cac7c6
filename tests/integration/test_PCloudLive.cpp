#include <gtest/gtest.h>

#include "pcloud/pcloud.hpp"
#include "pcloud/concurrency/ThreadPoolManager.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>

namespace fs = std::filesystem;
using namespace pcloud;

// Talks to a real account. Needs PCLOUD_HOST, PCLOUD_USER and PCLOUD_PASSWORD.
class PCloudLiveTest : public ::testing::Test {
protected:
    std::optional<client::Client> api;
    std::string folder;
    fs::path test_dir;

    void SetUp() override {
        const char* host = std::getenv("PCLOUD_HOST");
        const char* user = std::getenv("PCLOUD_USER");
        const char* password = std::getenv("PCLOUD_PASSWORD");
        if (!host || !user || !password) GTEST_SKIP() << "PCLOUD_HOST, PCLOUD_USER and PCLOUD_PASSWORD not set";

        api = client::Client::withUsernameAndPassword(host, user, password).get();

        const auto stamp = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        folder = "/pcloud-cpp-test-" + std::to_string(stamp);

        test_dir = fs::temp_directory_path() / "pcloud_live_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        if (api && !folder.empty()) {
            try {
                (void)api->deleteFolder(folder).deleteRecursive().get();
            } catch (const errors::Error& e) {
                ADD_FAILURE() << "cleanup of " << folder << " failed: " << e.what();
            }
        }
        api.reset();
        if (!test_dir.empty()) fs::remove_all(test_dir);
        if (const auto pool = concurrency::ThreadPoolManager::instance().httpPool()) pool->waitIdle();
    }

    static void writeTextFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }
};

TEST_F(PCloudLiveTest, UploadDownloadAndVerify) {
    ASSERT_TRUE(api->createFolder("/", folder.substr(1)).execute().get().metadata);

    const auto local = test_dir / "from-disk.txt";
    writeTextFile(local, "This is a test file for pCloud upload.");

    const auto result = api->uploadFileIntoFolder(folder)
                            .withFile("test.txt", "hello")
                            .withFile("from-disk.txt", http::Payload::fromFile(local))
                            .upload()
                            .get();
    ASSERT_TRUE(result.allStored());

    const auto res = api->downloadFile(folder + "/test.txt").get();
    EXPECT_EQ(res.text(), "hello");

    const auto computed = checksum::computeChecksums(res.text(), checksum::guaranteedAlgorithms(api->region()));
    EXPECT_NO_THROW((void)api->checksumFile(folder + "/test.txt").verify(computed).get());
}

TEST_F(PCloudLiveTest, RenameAndConflictOutcomes) {
    ASSERT_TRUE(api->createFolder("/", folder.substr(1)).execute().get().metadata);

    (void)api->uploadFileIntoFolder(folder).withFile("dup.txt", "one").upload().get();

    const auto renamed = api->uploadFileIntoFolder(folder).withFile("dup.txt", "two").upload().get();
    EXPECT_EQ(renamed.find("dup.txt")->status, builders::UploadStatus::Renamed);

    const auto conflict = api->uploadFileIntoFolder(folder)
                              .renameIfExists(false)
                              .withFile("dup.txt", "three")
                              .upload()
                              .get();
    EXPECT_EQ(conflict.find("dup.txt")->status, builders::UploadStatus::Conflict);

    const auto listing = api->listFolder(folder).get().get();
    ASSERT_TRUE(listing.metadata);
    EXPECT_EQ(listing.metadata->contents.size(), 2u);
}

TEST_F(PCloudLiveTest, UserInfo) {
    const auto info = api->getUserInfo().get();
    EXPECT_TRUE(info.email);
    folder.clear();
}
