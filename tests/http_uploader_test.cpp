#include <gtest/gtest.h>
#include "core/http_uploader.hpp"
#include "test_base.hpp"
#include <httplib.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

using namespace std::chrono_literals;

class HttpUploaderTest : public TestBase
{
protected:
    void SetUp() override
    {
        TestBase::SetUp();

        server_.Post("/api/files", [this](const httplib::Request &req, httplib::Response &res)
                     {
                         std::lock_guard<std::mutex> lock(mutex_);
                         ++upload_requests_;
                         last_body_ = req.body;
                         last_fingerprint_ = req.get_header_value("X-Content-Fingerprint");
                         last_file_path_ = req.get_header_value("X-File-Path");
                         last_content_type_ = req.get_header_value("Content-Type");
                         last_authorization_ = req.get_header_value("Authorization");
                         res.status = upload_status_;
                         if (!location_.empty())
                             res.set_header("Location", location_);
                         res.set_content(upload_response_, "application/json"); });

        server_.Post("/api/manifest", [this](const httplib::Request &req, httplib::Response &res)
                     {
                         std::lock_guard<std::mutex> lock(mutex_);
                         ++manifest_requests_;
                         last_manifest_ = req.body;
                         if (manifest_failures_ > 0)
                         {
                             --manifest_failures_;
                             res.status = manifest_failure_status_;
                             return;
                         }
                         res.status = 201; });

        port_ = server_.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port_, 0);
        server_thread_ = std::thread([this]()
                                     { server_.listen_after_bind(); });
        for (int i = 0; i < 200 && !server_.is_running(); ++i)
            std::this_thread::sleep_for(5ms);
        ASSERT_TRUE(server_.is_running());
    }

    void TearDown() override
    {
        server_.stop();
        if (server_thread_.joinable())
            server_thread_.join();
        TestBase::TearDown();
    }

    HttpUploaderOptions options() const
    {
        HttpUploaderOptions opts;
        opts.endpoint = "http://127.0.0.1:" + std::to_string(port_);
        opts.manifest_path = "/api/manifest";
        opts.connect_timeout_seconds = 2;
        opts.read_timeout_seconds = 5;
        opts.write_timeout_seconds = 5;
        return opts;
    }

    FileEntryPtr entryFor(const std::string &relative, const std::string &content)
    {
        auto path = createFile(relative, content);
        auto metadata = FileUtils::getFileMetadata(path.string());
        return std::make_shared<const FileEntry>(path.string(), relative, metadata->file_size,
                                                 metadata->modified_at_ns);
    }

    static RunSummary summaryWithOneUpload()
    {
        RunSummary summary;
        summary.state = RunState::Completed;
        summary.started_at = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
        summary.uploaded = 1;
        summary.total_bytes = 5;
        summary.uploaded_files.push_back(UploadedFile{"/data/photos/2023/a.jpg", "photos/2023/a.jpg", "fp-a",
                                                      "remote-a", 5, "image/jpeg", "image"});
        return summary;
    }

    static RetryPolicy fastPolicy()
    {
        RetryPolicy policy;
        policy.max_retries = 3;
        policy.base_delay = 1ms;
        policy.max_delay = 5ms;
        return policy;
    }

    httplib::Server server_;
    std::thread server_thread_;
    int port_ = 0;

    std::mutex mutex_;
    int upload_status_ = 200;
    std::string upload_response_ = R"({"id": "abc-123"})";
    std::string location_;
    int manifest_failures_ = 0;
    int manifest_failure_status_ = 503;

    int upload_requests_ = 0;
    int manifest_requests_ = 0;
    std::string last_body_;
    std::string last_fingerprint_;
    std::string last_file_path_;
    std::string last_content_type_;
    std::string last_authorization_;
    std::string last_manifest_;
};

TEST_F(HttpUploaderTest, StatusClassification)
{
    EXPECT_EQ(HttpUploader::classifyStatus(500), UploadErrorKind::Transient);
    EXPECT_EQ(HttpUploader::classifyStatus(503), UploadErrorKind::Transient);
    EXPECT_EQ(HttpUploader::classifyStatus(429), UploadErrorKind::Transient);
    EXPECT_EQ(HttpUploader::classifyStatus(408), UploadErrorKind::Transient);
    EXPECT_EQ(HttpUploader::classifyStatus(400), UploadErrorKind::Permanent);
    EXPECT_EQ(HttpUploader::classifyStatus(401), UploadErrorKind::Permanent);
    EXPECT_EQ(HttpUploader::classifyStatus(404), UploadErrorKind::Permanent);
    EXPECT_EQ(HttpUploader::classifyStatus(413), UploadErrorKind::Permanent);
}

TEST_F(HttpUploaderTest, EmptyEndpointIsRejected)
{
    EXPECT_THROW({ HttpUploader uploader{HttpUploaderOptions{}}; }, std::invalid_argument);
}

TEST_F(HttpUploaderTest, OnlyHttpSchemesAreAccepted)
{
    EXPECT_TRUE(HttpUploader::isSupportedEndpoint("http://uploads.local"));
    EXPECT_TRUE(HttpUploader::isSupportedEndpoint("https://uploads.local:8443"));
    EXPECT_FALSE(HttpUploader::isSupportedEndpoint("ftp://uploads.local"));
    EXPECT_FALSE(HttpUploader::isSupportedEndpoint("uploads.local"));

    HttpUploaderOptions opts = options();
    opts.endpoint = "ftp://127.0.0.1:21";
    EXPECT_THROW({ HttpUploader uploader{opts}; }, std::invalid_argument);
}

// The test server speaks plain HTTP, so the TLS handshake itself has to fail
TEST_F(HttpUploaderTest, HttpsEndpointAttemptsTlsHandshake)
{
    auto entry = entryFor("a.txt", "hello");
    HttpUploaderOptions opts = options();
    opts.endpoint = "https://127.0.0.1:" + std::to_string(port_);

    HttpUploader uploader(opts);
    SendResult result;
    EXPECT_NO_THROW(result = uploader.send(*entry));
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.error.retryable());
    EXPECT_NE(result.error.message.find("transport error"), std::string::npos) << result.error.message;

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(upload_requests_, 0);
}

TEST_F(HttpUploaderTest, StreamsFileWithMetadataHeaders)
{
    std::string content(200 * 1024, 'p');
    auto entry = entryFor("photos/big.jpg", content);
    HttpUploaderOptions opts = options();
    opts.auth_token = "token-1";
    HttpUploader uploader(opts);

    SendResult result = uploader.send(*entry);
    ASSERT_TRUE(result.success) << result.error.message;
    EXPECT_EQ(result.outcome.remote_id, "abc-123");
    EXPECT_EQ(result.outcome.bytes_sent, content.size());

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(upload_requests_, 1);
    EXPECT_EQ(last_body_, content);
    EXPECT_EQ(last_fingerprint_, entry->fingerprint());
    EXPECT_EQ(last_file_path_, "photos/big.jpg");
    EXPECT_EQ(last_content_type_, "image/jpeg");
    EXPECT_EQ(last_authorization_, "Bearer token-1");
}

TEST_F(HttpUploaderTest, RemoteIdFallsBackToLocationThenFingerprint)
{
    auto entry = entryFor("a.txt", "hello");
    HttpUploader uploader(options());

    {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_response_ = "{}";
        location_ = "/api/files/77";
    }
    SendResult with_location = uploader.send(*entry);
    ASSERT_TRUE(with_location.success);
    EXPECT_EQ(with_location.outcome.remote_id, "/api/files/77");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_response_ = "not json";
        location_.clear();
    }
    SendResult bare = uploader.send(*entry);
    ASSERT_TRUE(bare.success);
    EXPECT_EQ(bare.outcome.remote_id, entry->fingerprint());
}

TEST_F(HttpUploaderTest, ServerErrorsAreTransient)
{
    auto entry = entryFor("a.txt", "hello");
    HttpUploader uploader(options());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_status_ = 503;
    }

    SendResult result = uploader.send(*entry);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.error.retryable());
    EXPECT_NE(result.error.message.find("503"), std::string::npos);
}

TEST_F(HttpUploaderTest, ClientErrorsArePermanent)
{
    auto entry = entryFor("a.txt", "hello");
    HttpUploader uploader(options());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        upload_status_ = 400;
    }

    SendResult result = uploader.send(*entry);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.retryable());
}

TEST_F(HttpUploaderTest, UnreachableServerIsTransient)
{
    auto entry = entryFor("a.txt", "hello");
    server_.stop();
    server_thread_.join();

    HttpUploader uploader(options());
    SendResult result = uploader.send(*entry);
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.error.retryable());
}

TEST_F(HttpUploaderTest, MissingFileIsPermanent)
{
    FileEntry entry(getTestFilesDir() + "/gone.txt", "gone.txt", 5, 1);
    HttpUploader uploader(options());

    SendResult result = uploader.send(entry);
    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.retryable());
}

TEST_F(HttpUploaderTest, ManifestLayout)
{
    nlohmann::json manifest = HttpUploader::buildManifest(summaryWithOneUpload());

    EXPECT_EQ(manifest["total_files"], 1);
    EXPECT_EQ(manifest["total_size"], 5);
    EXPECT_EQ(manifest["scan_timestamp"], "2023-11-14T22:13:20Z");
    ASSERT_EQ(manifest["files"].size(), 1u);
    const auto &file = manifest["files"][0];
    EXPECT_EQ(file["filename"], "a.jpg");
    EXPECT_EQ(file["folder"], "photos/2023");
    EXPECT_EQ(file["mime"], "image/jpeg");
    EXPECT_EQ(file["hash"], "fp-a");
    EXPECT_EQ(file["filetype"], "image");
    EXPECT_EQ(file["remote_id"], "remote-a");
}

TEST_F(HttpUploaderTest, ManifestIsRetriedOnTransientErrors)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manifest_failures_ = 2;
    }
    HttpUploader uploader(options());
    EXPECT_TRUE(uploader.publishManifest(summaryWithOneUpload(), fastPolicy()));

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(manifest_requests_, 3);
    auto sent = nlohmann::json::parse(last_manifest_);
    EXPECT_EQ(sent["files"][0]["filename"], "a.jpg");
}

TEST_F(HttpUploaderTest, ManifestStopsOnPermanentError)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        manifest_failures_ = 10;
        manifest_failure_status_ = 400;
    }
    HttpUploader uploader(options());
    EXPECT_FALSE(uploader.publishManifest(summaryWithOneUpload(), fastPolicy()));

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(manifest_requests_, 1);
}

TEST_F(HttpUploaderTest, ManifestSkippedWithoutPathOrFiles)
{
    HttpUploaderOptions opts = options();
    opts.manifest_path.clear();
    HttpUploader without_path(opts);
    EXPECT_FALSE(without_path.publishManifest(summaryWithOneUpload(), fastPolicy()));

    HttpUploader uploader(options());
    RunSummary empty;
    EXPECT_TRUE(uploader.publishManifest(empty, fastPolicy()));

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(manifest_requests_, 0);
}
