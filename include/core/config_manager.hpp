#pragma once

#include <Poco/AutoPtr.h>
#include <Poco/Util/JSONConfiguration.h>
#include <nlohmann/json.hpp>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>
#include "core/http_uploader.hpp"
#include "core/pipeline_config.hpp"

/**
 * @brief Process-wide configuration with dotted keys ("upload.max_retries")
 *
 * Values start from built-in defaults; a JSON or YAML file and command line
 * overrides are layered on top with update().
 */
class ConfigManager
{
public:
    static ConfigManager &getInstance()
    {
        static ConfigManager instance;
        return instance;
    }

    // Core file operations; .yaml/.yml files go through yaml-cpp
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    int64_t getInt64(const std::string &key, int64_t def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;

    // Arrays, JSON-encoded arrays or comma separated strings
    std::vector<std::string> getStringList(const std::string &key) const;

    std::string getLogLevel() const;
    std::string getLogFile() const;

    // Scan configuration getters
    int getScanMaxDepth() const;
    bool getScanSkipHidden() const;
    std::vector<std::string> getIncludePatterns() const;
    std::vector<std::string> getExcludePatterns() const;

    // Upload configuration getters
    int getUploadConcurrency() const;
    int getUploadMaxRetries() const;
    int getUploadQueueCapacity() const;
    int getUploadBackoffBaseMs() const;
    int getUploadMaxBackoffMs() const;
    std::string getUploadEndpoint() const;

    // State configuration getters
    bool isStateEnabled() const;
    std::string getStateDbPath() const;

    bool isDryRun() const;

    // False, with the reason logged, for out-of-range or unparsable values
    bool validateConfig() const;

    PipelineConfig toPipelineConfig(const std::string &root) const;
    HttpUploaderOptions toHttpUploaderOptions() const;

    // Discard every value and restore the built-in defaults
    void initializeDefaultConfig();
    bool hasKey(const std::string &key) const;

private:
    ConfigManager();
    ~ConfigManager() = default;
    ConfigManager(const ConfigManager &) = delete;
    ConfigManager &operator=(const ConfigManager &) = delete;

    bool loadYaml(const std::string &path);
    bool checkValues() const;
    void applyLocked(const std::string &prefix, const nlohmann::json &node);
    nlohmann::json getNestedConfigLocked(const std::string &key) const;

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter);
