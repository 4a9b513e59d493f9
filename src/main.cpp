#include "core/config_manager.hpp"
#include "core/embedding/embedding_model_provider.hpp"
#include "core/error_types.hpp"
#include "core/job_serializer.hpp"
#include "core/jobs/job_orchestrator.hpp"
#include "core/jobs/job_store.hpp"
#include "core/logger_observer.hpp"
#include "core/request_parser.hpp"
#include "core/shutdown_manager.hpp"
#include "core/storage/artifact_store.hpp"
#include "core/summary_modes.hpp"
#include "database/job_repository.hpp"
#include "logging/logger.hpp"
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>

namespace
{
    void printUsage(const char *program)
    {
        std::cout << "Video Summarizer - scene-selecting video summaries" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <file>     Configuration file (default config.yaml, created if missing)"
                  << std::endl;
        std::cout << "  --request, -r <file>    Submit a JSON summary request and follow it to completion"
                  << std::endl;
        std::cout << "  --list-categories       Print the category catalog" << std::endl;
        std::cout << "  --help, -h              Show this help message" << std::endl;
    }

    std::string readFile(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            throw ValidationError("Could not read request file: " + path);
        }
        std::stringstream buffer;
        buffer << file.rdbuf();
        return buffer.str();
    }
}

int main(int argc, char *argv[])
{
    ShutdownManager::getInstance().installSignalHandlers();

    std::string config_path = "config.yaml";
    std::string request_path;
    bool list_categories = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if ((arg == "--request" || arg == "-r") && i + 1 < argc)
        {
            request_path = argv[++i];
        }
        else if (arg == "--list-categories")
        {
            list_categories = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Unknown or incomplete option: " << arg << std::endl;
            printUsage(argv[0]);
            return 2;
        }
    }

    if (list_categories)
    {
        std::cout << JobSerializer::categoriesToJson().dump(2) << std::endl;
        return 0;
    }
    if (request_path.empty())
    {
        printUsage(argv[0]);
        return 2;
    }

    auto &config_manager = ConfigManager::getInstance();
    if (!config_manager.loadOrCreate(config_path))
    {
        std::cerr << "Error: could not load configuration from " << config_path << std::endl;
        return 1;
    }
    Logger::init(config_manager.getLogLevel());

    LoggerObserver logger_observer;
    config_manager.subscribe(&logger_observer);

    int exit_code = 1;
    try
    {
        const PipelineSettings settings = config_manager.pipelineSettings();
        CreateJobRequest request = RequestParser::parse(readFile(request_path), settings);

        std::shared_ptr<JobRepository> repository;
        if (!settings.database_path.empty())
        {
            repository = std::make_shared<JobRepository>(settings.database_path);
        }
        auto store = std::make_shared<JobStore>(repository);
        store->restore();

        auto artifacts = std::make_shared<LocalArtifactStore>(settings.artifact_dir);
        auto orchestrator = std::make_shared<JobOrchestrator>(settings, store,
                                                              EmbeddingModelProvider::forClip(settings), artifacts);

        const std::string job_id = orchestrator->submit(request);
        std::weak_ptr<JobOrchestrator> weak_orchestrator = orchestrator;
        ShutdownManager::getInstance().addShutdownCallback([weak_orchestrator, job_id](const std::string &reason)
                                                           {
            if (auto running = weak_orchestrator.lock())
            {
                Logger::warn("Shutdown requested (" + reason + "), cancelling job " + job_id);
                running->cancel(job_id);
            } });

        int last_percent = -1;
        JobStatus last_status = JobStatus::QUEUED;
        const bool interrupted = ShutdownManager::getInstance().waitForShutdownOr([&]()
                                                                                  {
            auto current = orchestrator->progress(job_id);
            if (!current)
                return true;
            if (current->progress_percent != last_percent || current->status != last_status)
            {
                last_percent = current->progress_percent;
                last_status = current->status;
                Logger::info("Job " + job_id + ": " + SummaryModes::getStatusName(current->status) + " " +
                             std::to_string(current->progress_percent) + "%");
            }
            return SummaryModes::isTerminal(current->status); }, 200);

        // A cancelled job still cleans up its scratch files before it is terminal
        orchestrator->waitForCompletion(job_id, std::chrono::hours(1));

        auto result = orchestrator->result(job_id);
        if (result)
        {
            std::cout << JobSerializer::jobToJson(*result).dump(2) << std::endl;
            exit_code = (result->status == JobStatus::COMPLETED && !interrupted) ? 0 : 1;
        }

        orchestrator->shutdown();
        store->flush();
    }
    catch (const ValidationError &e)
    {
        std::cerr << "Invalid request: " << e.what() << std::endl;
        exit_code = 2;
    }
    catch (const SummarizerError &e)
    {
        Logger::error("Summarizer error (" + ErrorKinds::getKindName(e.kind()) + "): " + std::string(e.what()));
        exit_code = 1;
    }
    catch (const std::exception &e)
    {
        Logger::error("Fatal error: " + std::string(e.what()));
        exit_code = 1;
    }

    config_manager.unsubscribe(&logger_observer);
    return exit_code;
}
