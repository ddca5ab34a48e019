#include "core/config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    bool hasYamlExtension(const std::string &path)
    {
        auto dot = path.find_last_of('.');
        if (dot == std::string::npos)
            return false;
        std::string ext = path.substr(dot + 1);
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        return ext == "yaml" || ext == "yml";
    }

    nlohmann::json yamlToJson(const YAML::Node &node)
    {
        switch (node.Type())
        {
        case YAML::NodeType::Map:
        {
            nlohmann::json object = nlohmann::json::object();
            for (const auto &item : node)
                object[item.first.as<std::string>()] = yamlToJson(item.second);
            return object;
        }
        case YAML::NodeType::Sequence:
        {
            nlohmann::json array = nlohmann::json::array();
            for (const auto &item : node)
                array.push_back(yamlToJson(item));
            return array;
        }
        case YAML::NodeType::Scalar:
        {
            // Quoted scalars stay strings
            if (node.Tag() == "!")
                return node.Scalar();
            long long integer = 0;
            if (YAML::convert<long long>::decode(node, integer))
                return integer;
            double number = 0.0;
            if (YAML::convert<double>::decode(node, number))
                return number;
            bool flag = false;
            if (YAML::convert<bool>::decode(node, flag))
                return flag;
            return node.Scalar();
        }
        case YAML::NodeType::Null:
        case YAML::NodeType::Undefined:
            break;
        }
        return nullptr;
    }

    std::string trim(const std::string &value)
    {
        auto begin = value.find_first_not_of(" \t");
        if (begin == std::string::npos)
            return "";
        auto end = value.find_last_not_of(" \t");
        return value.substr(begin, end - begin + 1);
    }
}

ConfigManager::ConfigManager()
{
    initializeDefaultConfig();
}

bool ConfigManager::load(const std::string &path)
{
    if (hasYamlExtension(path))
        return loadYaml(path);

    std::ifstream in(path);
    if (!in.good())
    {
        Logger::error("Cannot open configuration file: " + path);
        return false;
    }

    nlohmann::json patch;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        std::stringstream ss;
        tmp->save(ss);
        patch = nlohmann::json::parse(ss.str());
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Invalid JSON configuration in " + path + ": " + e.displayText());
        return false;
    }
    catch (const nlohmann::json::exception &e)
    {
        Logger::error("Invalid JSON configuration in " + path + ": " + e.what());
        return false;
    }

    update(patch);
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool ConfigManager::loadYaml(const std::string &path)
{
    nlohmann::json patch;
    try
    {
        YAML::Node root = YAML::LoadFile(path);
        patch = yamlToJson(root);
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Invalid YAML configuration in " + path + ": " + e.what());
        return false;
    }

    if (!patch.is_object())
    {
        Logger::error("YAML configuration must be a mapping: " + path);
        return false;
    }
    update(patch);
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool ConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json ConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void ConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    applyLocked("", patch);
}

void ConfigManager::applyLocked(const std::string &prefix, const nlohmann::json &node)
{
    // Flatten and set values
    if (node.is_object())
    {
        for (auto it = node.begin(); it != node.end(); ++it)
        {
            std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
            applyLocked(key, it.value());
        }
        return;
    }
    if (node.is_null())
        return;

    if (node.is_boolean())
        cfg_->setBool(prefix, node.get<bool>());
    else if (node.is_number_integer())
    {
        int64_t value = node.get<int64_t>();
        if (value >= std::numeric_limits<int>::min() && value <= std::numeric_limits<int>::max())
            cfg_->setInt(prefix, static_cast<int>(value));
        else
            cfg_->setInt64(prefix, value);
    }
    else if (node.is_number_float())
        cfg_->setDouble(prefix, node.get<double>());
    else if (node.is_string())
        cfg_->setString(prefix, node.get<std::string>());
    else
        cfg_->setString(prefix, node.dump());
}

// Basic configuration getters
std::string ConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int ConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

int64_t ConfigManager::getInt64(const std::string &key, int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt64(key, def);
}

bool ConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

std::vector<std::string> ConfigManager::getStringList(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> values;

    nlohmann::json node = getNestedConfigLocked(key);
    if (node.is_string())
    {
        const std::string raw = node.get<std::string>();
        auto parsed = nlohmann::json::parse(raw, nullptr, false);
        if (!parsed.is_discarded() && parsed.is_array())
            node = parsed;
        else
        {
            for (const auto &part : split(raw, ','))
            {
                std::string item = trim(part);
                if (!item.empty())
                    values.push_back(item);
            }
            return values;
        }
    }

    if (node.is_array())
    {
        for (const auto &item : node)
        {
            if (item.is_string())
                values.push_back(item.get<std::string>());
            else
                values.push_back(item.dump());
        }
    }
    return values;
}

std::string ConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string ConfigManager::getLogFile() const
{
    return getString("log_file", "");
}

// Scan configuration getters
int ConfigManager::getScanMaxDepth() const
{
    return getInt("scan.max_depth", -1);
}

bool ConfigManager::getScanSkipHidden() const
{
    return getBool("scan.skip_hidden", true);
}

std::vector<std::string> ConfigManager::getIncludePatterns() const
{
    return getStringList("scan.include");
}

std::vector<std::string> ConfigManager::getExcludePatterns() const
{
    return getStringList("scan.exclude");
}

// Upload configuration getters
int ConfigManager::getUploadConcurrency() const
{
    return getInt("upload.concurrency", 0);
}

int ConfigManager::getUploadMaxRetries() const
{
    return getInt("upload.max_retries", 3);
}

int ConfigManager::getUploadQueueCapacity() const
{
    return getInt("upload.queue_capacity", 256);
}

int ConfigManager::getUploadBackoffBaseMs() const
{
    return getInt("upload.backoff_base_ms", 200);
}

int ConfigManager::getUploadMaxBackoffMs() const
{
    return getInt("upload.max_backoff_ms", 10000);
}

std::string ConfigManager::getUploadEndpoint() const
{
    return getString("upload.endpoint", "");
}

// State configuration getters
bool ConfigManager::isStateEnabled() const
{
    return getBool("state.enabled", true);
}

std::string ConfigManager::getStateDbPath() const
{
    return getString("state.db_path", "tree_uploader_state.db");
}

bool ConfigManager::isDryRun() const
{
    return getBool("run.dry_run", false);
}

bool ConfigManager::validateConfig() const
{
    try
    {
        if (!checkValues())
            return false;
        // Every value a run reads has to parse, not only the range-checked ones
        toPipelineConfig(".");
        toHttpUploaderOptions();
        return true;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Invalid configuration value: " + e.displayText());
        return false;
    }
}

bool ConfigManager::checkValues() const
{
    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    int max_depth = getScanMaxDepth();
    if (max_depth < -1)
    {
        Logger::error("Invalid scan.max_depth: " + std::to_string(max_depth));
        return false;
    }

    if (getInt64("scan.min_file_size", 0) < 0)
    {
        Logger::error("scan.min_file_size must not be negative");
        return false;
    }

    int concurrency = getUploadConcurrency();
    if (concurrency < 0 || concurrency > 256)
    {
        Logger::error("Invalid upload.concurrency: " + std::to_string(concurrency));
        return false;
    }

    int max_retries = getUploadMaxRetries();
    if (max_retries < 0 || max_retries > 100)
    {
        Logger::error("Invalid upload.max_retries: " + std::to_string(max_retries));
        return false;
    }

    int capacity = getUploadQueueCapacity();
    if (capacity <= 0 || capacity > 1000000)
    {
        Logger::error("Invalid upload.queue_capacity: " + std::to_string(capacity));
        return false;
    }

    int base_ms = getUploadBackoffBaseMs();
    int max_ms = getUploadMaxBackoffMs();
    if (base_ms <= 0 || max_ms < base_ms)
    {
        Logger::error("Invalid backoff: base " + std::to_string(base_ms) + "ms, max " + std::to_string(max_ms) + "ms");
        return false;
    }

    for (const char *key : {"upload.connect_timeout_seconds", "upload.read_timeout_seconds",
                            "upload.write_timeout_seconds"})
    {
        if (getInt(key, 1) <= 0)
        {
            Logger::error(std::string("Invalid ") + key + ": must be positive");
            return false;
        }
    }

    std::string endpoint = getUploadEndpoint();
    if (!endpoint.empty() && !HttpUploader::isSupportedEndpoint(endpoint))
    {
        Logger::error("Unsupported upload.endpoint (expected http:// or https://): " + endpoint);
        return false;
    }

    if (isStateEnabled() && getStateDbPath().empty())
    {
        Logger::error("state.db_path is empty while state.enabled is true");
        return false;
    }

    return true;
}

PipelineConfig ConfigManager::toPipelineConfig(const std::string &root) const
{
    PipelineConfig config;
    config.root = root;

    config.scan.include_patterns = getIncludePatterns();
    config.scan.exclude_patterns = getExcludePatterns();
    config.scan.max_depth = getScanMaxDepth();
    config.scan.skip_hidden = getScanSkipHidden();
    config.scan.min_file_size = static_cast<uint64_t>(std::max<int64_t>(0, getInt64("scan.min_file_size", 0)));

    config.concurrency = static_cast<size_t>(std::max(0, getUploadConcurrency()));
    config.queue_capacity = static_cast<size_t>(std::max(1, getUploadQueueCapacity()));
    config.retry.max_retries = std::max(0, getUploadMaxRetries());
    config.retry.base_delay = std::chrono::milliseconds(getUploadBackoffBaseMs());
    config.retry.max_delay = std::chrono::milliseconds(getUploadMaxBackoffMs());

    config.dry_run = isDryRun();
    config.skip_unchanged = getBool("run.skip_unchanged", true);
    return config;
}

HttpUploaderOptions ConfigManager::toHttpUploaderOptions() const
{
    HttpUploaderOptions options;
    options.endpoint = getUploadEndpoint();
    options.upload_path = getString("upload.path", "/api/files");
    options.manifest_path = getString("upload.manifest_path", "");
    options.auth_token = getString("upload.auth_token", "");
    options.connect_timeout_seconds = getInt("upload.connect_timeout_seconds", 10);
    options.read_timeout_seconds = getInt("upload.read_timeout_seconds", 30);
    options.write_timeout_seconds = getInt("upload.write_timeout_seconds", 30);
    return options;
}

// Utility methods
void ConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);
    cfg_ = new JSONConfiguration();

    cfg_->setString("log_level", "INFO");
    cfg_->setString("log_file", "");

    // Scan defaults
    cfg_->setInt("scan.max_depth", -1);
    cfg_->setBool("scan.skip_hidden", true);
    cfg_->setInt64("scan.min_file_size", 0);
    cfg_->setString("scan.include", "[]");
    cfg_->setString("scan.exclude", "[]");

    // Upload defaults
    cfg_->setInt("upload.concurrency", 0);
    cfg_->setInt("upload.max_retries", 3);
    cfg_->setInt("upload.queue_capacity", 256);
    cfg_->setInt("upload.backoff_base_ms", 200);
    cfg_->setInt("upload.max_backoff_ms", 10000);
    cfg_->setString("upload.endpoint", "");
    cfg_->setString("upload.path", "/api/files");
    cfg_->setString("upload.manifest_path", "");
    cfg_->setString("upload.auth_token", "");
    cfg_->setInt("upload.connect_timeout_seconds", 10);
    cfg_->setInt("upload.read_timeout_seconds", 30);
    cfg_->setInt("upload.write_timeout_seconds", 30);

    // State defaults
    cfg_->setBool("state.enabled", true);
    cfg_->setString("state.db_path", "tree_uploader_state.db");

    // Run defaults
    cfg_->setBool("run.dry_run", false);
    cfg_->setBool("run.skip_unchanged", true);
}

bool ConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->has(key);
}

// Walks the dotted key through the saved JSON document
nlohmann::json ConfigManager::getNestedConfigLocked(const std::string &key) const
{
    std::stringstream ss;
    cfg_->save(ss);
    auto current = nlohmann::json::parse(ss.str(), nullptr, false);
    if (current.is_discarded())
        return nullptr;

    for (const auto &part : split(key, '.'))
    {
        if (!current.is_object() || !current.contains(part))
            return nullptr;
        nlohmann::json next = current[part];
        current = std::move(next);
    }
    return current;
}

// Helper function to split strings by delimiter
std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        tokens.push_back(token);
    }

    return tokens;
}
