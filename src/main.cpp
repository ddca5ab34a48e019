#include "core/config_manager.hpp"
#include "core/http_uploader.hpp"
#include "core/shutdown_manager.hpp"
#include "core/upload_pipeline.hpp"
#include "database/dedup_store.hpp"
#include "logging/logger.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{
    constexpr int EXIT_SETUP_ERROR = 4;

    struct CommandLine
    {
        std::string root;
        std::string config_path;
        std::string summary_path;
        std::vector<std::string> includes;
        std::vector<std::string> excludes;
        nlohmann::json overrides = nlohmann::json::object();
        bool reset_state = false;
        bool show_help = false;
    };

    void printUsage(const char *program)
    {
        std::cout << "Usage: " << program << " [options] <root>" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config <file>        JSON or YAML configuration file" << std::endl;
        std::cout << "  --endpoint <url>       Upload endpoint, e.g. http://host:8080" << std::endl;
        std::cout << "  --concurrency <n>      Upload workers (0 = auto)" << std::endl;
        std::cout << "  --max-retries <n>      Retries for transient failures" << std::endl;
        std::cout << "  --include <glob>       Only upload matching files (repeatable)" << std::endl;
        std::cout << "  --exclude <glob>       Skip matching files and directories (repeatable)" << std::endl;
        std::cout << "  --max-depth <n>        Maximum directory depth (-1 = unlimited)" << std::endl;
        std::cout << "  --dry-run              List files without uploading" << std::endl;
        std::cout << "  --state-db <file>      Upload state database" << std::endl;
        std::cout << "  --no-state             Do not read or write the state database" << std::endl;
        std::cout << "  --reset-state          Forget previous uploads before running" << std::endl;
        std::cout << "  --summary <file>       Write the run summary as JSON" << std::endl;
        std::cout << "  --log-level <level>    TRACE, DEBUG, INFO, WARN or ERROR" << std::endl;
        std::cout << "  --log-file <file>      Also write the log to a file" << std::endl;
        std::cout << "  --help, -h             Show this help message" << std::endl;
    }

    int parseInt(const std::string &flag, const std::string &value)
    {
        try
        {
            size_t consumed = 0;
            int parsed = std::stoi(value, &consumed);
            if (consumed != value.size())
                throw std::invalid_argument(value);
            return parsed;
        }
        catch (const std::logic_error &)
        {
            throw std::invalid_argument(flag + " expects an integer, got '" + value + "'");
        }
    }

    CommandLine parseCommandLine(int argc, char *argv[])
    {
        CommandLine cli;
        auto next_value = [&](int &i, const std::string &flag) -> std::string
        {
            if (i + 1 >= argc)
                throw std::invalid_argument(flag + " requires a value");
            return argv[++i];
        };

        for (int i = 1; i < argc; i++)
        {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
                cli.show_help = true;
            else if (arg == "--config")
                cli.config_path = next_value(i, arg);
            else if (arg == "--endpoint")
                cli.overrides["upload"]["endpoint"] = next_value(i, arg);
            else if (arg == "--concurrency")
                cli.overrides["upload"]["concurrency"] = parseInt(arg, next_value(i, arg));
            else if (arg == "--max-retries")
                cli.overrides["upload"]["max_retries"] = parseInt(arg, next_value(i, arg));
            else if (arg == "--include")
                cli.includes.push_back(next_value(i, arg));
            else if (arg == "--exclude")
                cli.excludes.push_back(next_value(i, arg));
            else if (arg == "--max-depth")
                cli.overrides["scan"]["max_depth"] = parseInt(arg, next_value(i, arg));
            else if (arg == "--dry-run")
                cli.overrides["run"]["dry_run"] = true;
            else if (arg == "--state-db")
                cli.overrides["state"]["db_path"] = next_value(i, arg);
            else if (arg == "--no-state")
                cli.overrides["state"]["enabled"] = false;
            else if (arg == "--reset-state")
                cli.reset_state = true;
            else if (arg == "--summary")
                cli.summary_path = next_value(i, arg);
            else if (arg == "--log-level")
                cli.overrides["log_level"] = next_value(i, arg);
            else if (arg == "--log-file")
                cli.overrides["log_file"] = next_value(i, arg);
            else if (!arg.empty() && arg[0] == '-')
                throw std::invalid_argument("Unknown option: " + arg);
            else if (cli.root.empty())
                cli.root = arg;
            else
                throw std::invalid_argument("Only one root directory may be given");
        }

        if (!cli.includes.empty())
            cli.overrides["scan"]["include"] = cli.includes;
        if (!cli.excludes.empty())
            cli.overrides["scan"]["exclude"] = cli.excludes;
        return cli;
    }

    bool writeSummary(const RunSummary &summary, const std::string &path)
    {
        std::ofstream out(path);
        if (!out.is_open())
        {
            Logger::error("Cannot write summary to " + path);
            return false;
        }
        out << summary.toJson().dump(2) << std::endl;
        Logger::info("Summary written to " + path);
        return true;
    }
}

int main(int argc, char *argv[])
{
    CommandLine cli;
    try
    {
        cli = parseCommandLine(argc, argv);
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << e.what() << std::endl;
        printUsage(argv[0]);
        return EXIT_SETUP_ERROR;
    }

    if (cli.show_help)
    {
        printUsage(argv[0]);
        return 0;
    }
    if (cli.root.empty())
    {
        std::cerr << "No root directory given" << std::endl;
        printUsage(argv[0]);
        return EXIT_SETUP_ERROR;
    }

    auto &config = ConfigManager::getInstance();
    if (!cli.config_path.empty() && !config.load(cli.config_path))
        return EXIT_SETUP_ERROR;
    config.update(cli.overrides);

    Logger::init(config.getLogLevel(), config.getLogFile());
    if (!config.validateConfig())
    {
        Logger::error("Configuration is invalid, aborting");
        return EXIT_SETUP_ERROR;
    }

    PipelineConfig pipeline_config;
    std::unique_ptr<HttpUploader> uploader;
    std::unique_ptr<DedupStore> store;
    try
    {
        pipeline_config = config.toPipelineConfig(cli.root);
        if (!pipeline_config.dry_run)
        {
            HttpUploaderOptions options = config.toHttpUploaderOptions();
            if (options.endpoint.empty())
            {
                Logger::error("No upload endpoint configured (use --endpoint or upload.endpoint)");
                return EXIT_SETUP_ERROR;
            }
            uploader = std::make_unique<HttpUploader>(options);

            if (config.isStateEnabled())
            {
                store = std::make_unique<DedupStore>(config.getStateDbPath());
                if (cli.reset_state)
                {
                    DBOpResult cleared = store->clear();
                    if (!cleared.success)
                        Logger::warn("Could not reset upload state: " + cleared.error_message);
                }
            }
        }
    }
    catch (const std::exception &e)
    {
        Logger::error(std::string("Setup failed: ") + e.what());
        return EXIT_SETUP_ERROR;
    }

    UploadPipeline pipeline(pipeline_config, uploader.get(), store.get());
    // Workers call this concurrently; one write per line keeps lines whole
    pipeline.setProgressCallback([](const UploadedFile &file)
                                 { std::cout << ("uploaded " + file.relative_path + " (" + std::to_string(file.size) +
                                                 " bytes, " + file.mime_type + ", " + file.category + ")\n")
                                             << std::flush; });

    auto &shutdown = ShutdownManager::getInstance();
    shutdown.setShutdownCallback([&pipeline](int)
                                 { pipeline.cancel(); });
    shutdown.installSignalHandlers();

    RunSummary summary;
    try
    {
        summary = pipeline.run();
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error(e.what());
        shutdown.reset();
        return EXIT_SETUP_ERROR;
    }
    catch (const std::runtime_error &e)
    {
        Logger::error(std::string("Run failed to start: ") + e.what());
        shutdown.reset();
        return EXIT_SETUP_ERROR;
    }
    if (shutdown.isShutdownRequested() && shutdown.signalNumber() != 0)
        Logger::info("Run cancelled by signal " + std::to_string(shutdown.signalNumber()));
    shutdown.reset();

    std::cout << summary.toString();

    if (!cli.summary_path.empty())
        writeSummary(summary, cli.summary_path);

    if (uploader && summary.state == RunState::Completed && !uploader->options().manifest_path.empty())
    {
        RetryPolicy manifest_policy = pipeline_config.retry;
        if (!uploader->publishManifest(summary, manifest_policy))
            Logger::warn("Manifest was not published");
    }

    return summary.exitCode();
}
