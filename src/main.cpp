#include "ai/replicate_ai_client.hpp"
#include "core/config_manager.hpp"
#include "core/job_runner.hpp"
#include "core/pipeline_orchestrator.hpp"
#include "core/shutdown_manager.hpp"
#include "core/tag_vocabulary_loader.hpp"
#include "database/sqlite_catalog_store.hpp"
#include "logging/logger.hpp"
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

namespace
{
    struct Action
    {
        std::string name;
        std::string argument;
    };

    void printUsage(const char *program)
    {
        std::cout << "Memelet - meme catalog ingestion and analysis" << std::endl;
        std::cout << "Usage: " << program << " [--config <file>] <action>..." << std::endl;
        std::cout << "Actions run in the order given:" << std::endl;
        std::cout << "  --scan                  Verify catalogued files and register new ones" << std::endl;
        std::cout << "  --process               Analyze every new record" << std::endl;
        std::cout << "  --retry-errors          Re-verify errored records and analyze the reachable ones" << std::endl;
        std::cout << "  --process-one <id>      Analyze a single record" << std::endl;
        std::cout << "  --tag-scan <ids|all>    Re-run tagging for comma-separated ids or every record" << std::endl;
        std::cout << "  --job-status <job_id>   Show the state of a job" << std::endl;
        std::cout << "  --import-tags <yaml>    Add tags from a vocabulary file" << std::endl;
        std::cout << "  --stats                 Show record counts per status" << std::endl;
        std::cout << "  --help, -h              Show this help message" << std::endl;
    }

    bool parseIds(const std::string &text, std::vector<int64_t> &ids)
    {
        std::stringstream stream(text);
        std::string token;
        while (std::getline(stream, token, ','))
        {
            if (token.empty())
                continue;
            try
            {
                size_t consumed = 0;
                long long id = std::stoll(token, &consumed);
                if (consumed != token.size() || id <= 0)
                    return false;
                ids.push_back(id);
            }
            catch (const std::logic_error &)
            {
                return false;
            }
        }
        return !ids.empty();
    }

    void printJob(const JobRecord &job)
    {
        std::cout << "job " << job.job_id << " (" << MediaTypes::getJobKindName(job.kind) << " id=" << job.target
                  << "): " << (job.state == JobState::COMPLETED ? "completed" : "pending");
        if (job.state == JobState::COMPLETED)
            std::cout << " applied=" << (job.applied ? "true" : "false");
        std::cout << std::endl;
    }

    void printStats(CatalogStore &store)
    {
        auto counts = store.countByStatus();
        int total = 0;
        for (const auto &entry : counts)
            total += entry.second;
        std::cout << "Total records: " << total << std::endl;
        for (auto status : {MediaStatus::NEW, MediaStatus::PROCESSING, MediaStatus::DONE, MediaStatus::ERROR})
        {
            auto it = counts.find(status);
            std::cout << "  " << MediaTypes::getStatusName(status) << ": " << (it == counts.end() ? 0 : it->second)
                      << std::endl;
        }
    }
}

int main(int argc, char *argv[])
{
    Logger::init("INFO");

    std::string config_path;
    std::vector<Action> actions;
    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        auto needsValue = [&](const std::string &option) -> bool
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << option << " requires a value" << std::endl;
                return false;
            }
            return true;
        };

        if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else if (arg == "--config")
        {
            if (!needsValue(arg))
                return 1;
            config_path = argv[++i];
        }
        else if (arg == "--scan" || arg == "--process" || arg == "--retry-errors" || arg == "--stats")
        {
            actions.push_back({arg, ""});
        }
        else if (arg == "--process-one" || arg == "--tag-scan" || arg == "--job-status" || arg == "--import-tags")
        {
            if (!needsValue(arg))
                return 1;
            actions.push_back({arg, argv[++i]});
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }
    if (actions.empty())
    {
        printUsage(argv[0]);
        return 1;
    }

    ConfigManager config;
    if (!config_path.empty() && !config.load(config_path))
    {
        return 1;
    }
    PipelineSettings settings = config.toSettings();
    Logger::init(settings.log_level);
    if (!settings.log_file.empty())
    {
        Logger::addFileSink(settings.log_file);
    }
    Logger::debug("Effective configuration: " + config.getAll().dump());

    SqliteCatalogStore store(settings.database_path);
    if (!store.isOpen())
    {
        Logger::error("Cannot open catalog database " + settings.database_path);
        return 1;
    }

    ReplicateAiClient ai_client(settings);
    PipelineOrchestrator orchestrator(store, settings, ai_client);
    JobRunner jobs(store, orchestrator);

    auto &shutdown = ShutdownManager::getInstance();
    shutdown.installSignalHandlers();
    shutdown.onShutdown([&orchestrator]()
                        { orchestrator.cancel(); });

    int exit_code = 0;
    auto finish = [&](const std::string &job_id)
    {
        jobs.waitForAll();
        auto job = jobs.getJobStatus(job_id);
        if (job)
            printJob(*job);
    };

    for (const auto &action : actions)
    {
        if (shutdown.isShutdownRequested())
        {
            Logger::warn("Shutdown requested, skipping remaining actions");
            exit_code = 130;
            break;
        }

        if (action.name == "--scan")
        {
            finish(jobs.triggerIngest());
        }
        else if (action.name == "--process")
        {
            finish(jobs.triggerProcessPending(false));
        }
        else if (action.name == "--retry-errors")
        {
            finish(jobs.triggerRetryErrors());
        }
        else if (action.name == "--process-one" || action.name == "--tag-scan")
        {
            std::vector<int64_t> ids;
            bool all = action.name == "--tag-scan" && action.argument == "all";
            if (!all && !parseIds(action.argument, ids))
            {
                std::cerr << "Error: invalid record id list: " << action.argument << std::endl;
                exit_code = 1;
                continue;
            }
            if (action.name == "--tag-scan")
            {
                finish(jobs.triggerTagScan(ids));
            }
            else
            {
                for (int64_t id : ids)
                    finish(jobs.triggerProcessOne(id));
            }
        }
        else if (action.name == "--job-status")
        {
            auto job = jobs.getJobStatus(action.argument);
            if (!job)
            {
                std::cerr << "Error: unknown job " << action.argument << std::endl;
                exit_code = 1;
                continue;
            }
            printJob(*job);
        }
        else if (action.name == "--import-tags")
        {
            TagVocabularyLoader loader(store);
            auto result = loader.loadFile(action.argument);
            if (!result.success)
            {
                std::cerr << "Error: " << result.error_message << std::endl;
                exit_code = 1;
                continue;
            }
            std::cout << "Tags imported: " << result.inserted << " new, " << result.existing << " already present"
                      << std::endl;
        }
        else if (action.name == "--stats")
        {
            printStats(store);
        }
    }

    jobs.waitForAll();
    if (shutdown.isShutdownRequested() && exit_code == 0)
        exit_code = 130;
    return exit_code;
}
