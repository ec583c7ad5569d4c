#pragma once

#include "core/pipeline_orchestrator.hpp"
#include "database/catalog_store.hpp"
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

/**
 * @brief Runs orchestrator entry points in the background and tracks them as jobs.
 *
 * Each trigger creates a pending job row, logs "JOB <id> START id=<target>",
 * and returns the job id at once. When the work finishes the row is marked
 * completed with its applied flag and "JOB <id> COMPLETE id=<target>
 * applied=<true|false>" is logged.
 */
class JobRunner
{
public:
    JobRunner(CatalogStore &store, PipelineOrchestrator &orchestrator);
    ~JobRunner();

    JobRunner(const JobRunner &) = delete;
    JobRunner &operator=(const JobRunner &) = delete;

    std::string triggerIngest();
    std::string triggerProcessOne(int64_t record_id);
    std::string triggerProcessPending(bool include_errors);
    std::string triggerRetryErrors();

    // An empty list means every record
    std::string triggerTagScan(const std::vector<int64_t> &record_ids);

    std::optional<JobRecord> getJobStatus(const std::string &job_id);

    // Block until every job started by this runner has finished
    void waitForAll();

    static std::string generateJobId();

    // Threads not yet joined; finished ones are joined first
    size_t workerCount();

private:
    struct Worker
    {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Join workers whose job has finished; caller holds workers_mutex_
    void reapFinishedLocked();

    // Work returns the applied flag of the job
    std::string launch(JobKind kind, const std::string &target, std::function<bool()> work);

    CatalogStore &store_;
    PipelineOrchestrator &orchestrator_;
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};
