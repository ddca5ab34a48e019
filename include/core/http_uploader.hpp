#pragma once

#include "core/retry_policy.hpp"
#include "core/run_summary.hpp"
#include "core/uploader.hpp"
#include <nlohmann/json.hpp>
#include <string>

struct HttpUploaderOptions
{
    std::string endpoint;                    // scheme://host[:port]
    std::string upload_path = "/api/files";  // POST target for file bodies
    std::string manifest_path;               // empty: no manifest
    std::string auth_token;                  // sent as a bearer token when set
    int connect_timeout_seconds = 10;
    int read_timeout_seconds = 30;
    int write_timeout_seconds = 30;
};

/**
 * @brief Streams file bodies to an HTTP endpoint with cpp-httplib
 *
 * Each send() opens its own client, so one instance can be shared by every
 * upload worker.
 */
class HttpUploader : public Uploader
{
public:
    /**
     * @throws std::invalid_argument if the endpoint is empty or not http(s)
     */
    explicit HttpUploader(HttpUploaderOptions options);

    SendResult send(const FileEntry &entry) override;
    std::string name() const override { return "http(" + options_.endpoint + ")"; }

    /**
     * @brief POST the JSON manifest of uploaded files to manifest_path
     * @return true on a 2xx answer; false when it failed after retries or no
     *         manifest path is configured
     */
    bool publishManifest(const RunSummary &summary, const RetryPolicy &policy = RetryPolicy{});

    static nlohmann::json buildManifest(const RunSummary &summary);

    static bool isSupportedEndpoint(const std::string &endpoint);

    // 408, 425, 429 and 5xx are worth retrying
    static UploadErrorKind classifyStatus(int status);

    const HttpUploaderOptions &options() const { return options_; }

private:
    HttpUploaderOptions options_;
};
