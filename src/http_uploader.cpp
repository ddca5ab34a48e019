#include "core/http_uploader.hpp"
#include "logging/logger.hpp"
#include <httplib.h>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace
{
    constexpr size_t STREAM_CHUNK_SIZE = 64 * 1024;

    std::unique_ptr<httplib::Client> makeClient(const HttpUploaderOptions &options)
    {
        auto client = std::make_unique<httplib::Client>(options.endpoint);
        client->set_connection_timeout(options.connect_timeout_seconds, 0);
        client->set_read_timeout(options.read_timeout_seconds, 0);
        client->set_write_timeout(options.write_timeout_seconds, 0);
        if (!options.auth_token.empty())
            client->set_bearer_token_auth(options.auth_token);
        return client;
    }

    std::string formatTimestamp(std::chrono::system_clock::time_point tp)
    {
        std::time_t t = std::chrono::system_clock::to_time_t(tp);
        std::tm tm{};
        gmtime_r(&t, &tm);
        std::stringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    std::string folderOf(const std::string &relative_path)
    {
        auto pos = relative_path.find_last_of('/');
        return pos == std::string::npos ? std::string() : relative_path.substr(0, pos);
    }

    std::string filenameOf(const std::string &relative_path)
    {
        auto pos = relative_path.find_last_of('/');
        return pos == std::string::npos ? relative_path : relative_path.substr(pos + 1);
    }
}

HttpUploader::HttpUploader(HttpUploaderOptions options) : options_(std::move(options))
{
    if (options_.endpoint.empty())
        throw std::invalid_argument("HTTP uploader needs an endpoint");
    if (!isSupportedEndpoint(options_.endpoint))
        throw std::invalid_argument("Unsupported endpoint scheme: " + options_.endpoint);
}

bool HttpUploader::isSupportedEndpoint(const std::string &endpoint)
{
    return endpoint.rfind("http://", 0) == 0 || endpoint.rfind("https://", 0) == 0;
}

UploadErrorKind HttpUploader::classifyStatus(int status)
{
    if (status == 408 || status == 425 || status == 429 || status >= 500)
        return UploadErrorKind::Transient;
    return UploadErrorKind::Permanent;
}

SendResult HttpUploader::send(const FileEntry &entry)
{
    auto stream = std::make_shared<std::ifstream>(entry.path(), std::ios::binary);
    if (!stream->is_open())
        return SendResult::failure(UploadError::permanent("cannot open " + entry.path() + " for reading"));

    auto client = makeClient(options_);
    if (!client->is_valid())
        return SendResult::failure(UploadError::permanent("no HTTP client for " + options_.endpoint));

    httplib::Headers headers = {
        {"X-Content-Fingerprint", entry.fingerprint()},
        {"X-File-Path", entry.relativePath()},
        {"X-File-Size", std::to_string(entry.size())},
        {"X-File-Modified", std::to_string(entry.modifiedAtNs())},
        {"X-File-Category", entry.category()}};

    // The provider returns false on a local read failure, which cancels the request
    bool read_failed = false;
    auto buffer = std::make_shared<std::vector<char>>(STREAM_CHUNK_SIZE);
    auto provider = [stream, buffer, &read_failed](size_t /*offset*/, size_t length, httplib::DataSink &sink)
    {
        size_t to_read = std::min(length, buffer->size());
        stream->read(buffer->data(), static_cast<std::streamsize>(to_read));
        std::streamsize got = stream->gcount();
        if (got <= 0)
        {
            read_failed = true;
            return false;
        }
        return sink.write(buffer->data(), static_cast<size_t>(got));
    };

    Logger::debug("POST " + options_.endpoint + options_.upload_path + " <- " + entry.relativePath());
    auto res = client->Post(options_.upload_path, headers, static_cast<size_t>(entry.size()), provider,
                            entry.mimeType());

    if (!res)
    {
        if (read_failed)
            return SendResult::failure(UploadError::permanent("read failed while streaming " + entry.path()));
        return SendResult::failure(UploadError::transient("transport error: " + httplib::to_string(res.error())));
    }

    if (res->status < 200 || res->status >= 300)
    {
        std::string message = "HTTP " + std::to_string(res->status);
        if (!res->body.empty())
            message += ": " + res->body.substr(0, 200);
        return SendResult::failure(UploadError{classifyStatus(res->status), message});
    }

    std::string remote_id;
    auto body = nlohmann::json::parse(res->body, nullptr, false);
    if (!body.is_discarded() && body.is_object() && body.contains("id"))
    {
        const auto &id = body["id"];
        remote_id = id.is_string() ? id.get<std::string>() : id.dump();
    }
    if (remote_id.empty())
        remote_id = res->get_header_value("Location");
    if (remote_id.empty())
        remote_id = entry.fingerprint();

    return SendResult::ok(entry.size(), remote_id);
}

nlohmann::json HttpUploader::buildManifest(const RunSummary &summary)
{
    nlohmann::json files = nlohmann::json::array();
    for (const auto &file : summary.uploaded_files)
    {
        files.push_back({{"filename", filenameOf(file.relative_path)},
                         {"folder", folderOf(file.relative_path)},
                         {"size", file.size},
                         {"mime", file.mime_type},
                         {"hash", file.fingerprint},
                         {"filetype", file.category},
                         {"remote_id", file.remote_id}});
    }

    return nlohmann::json{{"files", files},
                          {"scan_timestamp", formatTimestamp(summary.started_at)},
                          {"total_files", summary.uploaded_files.size()},
                          {"total_size", summary.total_bytes}};
}

bool HttpUploader::publishManifest(const RunSummary &summary, const RetryPolicy &policy)
{
    if (options_.manifest_path.empty())
    {
        Logger::debug("No manifest path configured, skipping manifest");
        return false;
    }
    if (summary.uploaded_files.empty())
    {
        Logger::info("No uploaded files, manifest not published");
        return true;
    }

    const std::string payload = buildManifest(summary).dump();
    bool published = policy.retryWithBackoff(
        [this, &payload](std::string &error, bool &retryable)
        {
            auto client = makeClient(options_);
            if (!client->is_valid())
            {
                error = "no HTTP client for " + options_.endpoint;
                retryable = false;
                return false;
            }
            auto res = client->Post(options_.manifest_path, payload, "application/json");
            if (!res)
            {
                error = "transport error: " + httplib::to_string(res.error());
                return false;
            }
            if (res->status >= 200 && res->status < 300)
                return true;
            error = "HTTP " + std::to_string(res->status);
            retryable = classifyStatus(res->status) == UploadErrorKind::Transient;
            return false;
        },
        "publish manifest");

    if (published)
    {
        Logger::info("Published manifest for " + std::to_string(summary.uploaded_files.size()) + " files (" +
                     std::to_string(summary.total_bytes) + " bytes)");
    }
    return published;
}
