#include "core/job_runner.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

JobRunner::JobRunner(CatalogStore &store, PipelineOrchestrator &orchestrator)
    : store_(store), orchestrator_(orchestrator)
{
}

JobRunner::~JobRunner()
{
    waitForAll();
}

std::string JobRunner::generateJobId()
{
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis(0, 0xFFFFFFFFFFFFULL);

    std::ostringstream oss;
    oss << std::hex << std::setfill('0') << std::setw(12) << dis(gen);
    return oss.str();
}

std::string JobRunner::launch(JobKind kind, const std::string &target, std::function<bool()> work)
{
    JobRecord job;
    job.job_id = generateJobId();
    job.kind = kind;
    job.target = target;
    auto created = store_.createJob(job);
    if (!created.success)
    {
        Logger::error("Could not record job " + job.job_id + ": " + created.error_message);
    }
    Logger::info("JOB " + job.job_id + " START id=" + target);

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::lock_guard<std::mutex> lock(workers_mutex_);
    reapFinishedLocked();
    Worker worker;
    worker.done = done;
    worker.thread = std::thread(
        [this, job_id = job.job_id, target, work = std::move(work), done]()
        {
            bool applied = false;
            try
            {
                applied = work();
            }
            catch (const std::exception &e)
            {
                Logger::error("JOB " + job_id + " failed: " + e.what());
            }
            auto completed = store_.completeJob(job_id, applied);
            if (!completed.success)
            {
                Logger::error("Could not mark job " + job_id + " completed: " + completed.error_message);
            }
            Logger::info("JOB " + job_id + " COMPLETE id=" + target + " applied=" + (applied ? "true" : "false"));
            done->store(true);
        });
    workers_.push_back(std::move(worker));
    return job.job_id;
}

std::string JobRunner::triggerIngest()
{
    return launch(JobKind::INGEST, "all",
                  [this]()
                  {
                      auto summary = orchestrator_.ingest();
                      return summary.scan.added + summary.scan.duplicates + summary.verification.relocated +
                                 summary.verification.hashed + summary.verification.errored + summary.tags_applied >
                             0;
                  });
}

std::string JobRunner::triggerProcessOne(int64_t record_id)
{
    return launch(JobKind::PROCESS_ONE, std::to_string(record_id),
                  [this, record_id]()
                  { return orchestrator_.processOne(record_id).success; });
}

std::string JobRunner::triggerProcessPending(bool include_errors)
{
    return launch(JobKind::PROCESS_PENDING, include_errors ? "pending+errors" : "pending",
                  [this, include_errors]()
                  { return orchestrator_.processPending(include_errors).succeeded > 0; });
}

std::string JobRunner::triggerRetryErrors()
{
    return launch(JobKind::PROCESS_PENDING, "errors",
                  [this]()
                  { return orchestrator_.retryErrors().succeeded > 0; });
}

std::string JobRunner::triggerTagScan(const std::vector<int64_t> &record_ids)
{
    std::string target;
    for (int64_t id : record_ids)
    {
        if (!target.empty())
            target += ",";
        target += std::to_string(id);
    }
    if (target.empty())
        target = "all";

    return launch(JobKind::TAG_SCAN, target,
                  [this, record_ids]()
                  {
                      int applied = record_ids.empty() ? orchestrator_.tagScanAll() : orchestrator_.tagScan(record_ids);
                      return applied > 0;
                  });
}

std::optional<JobRecord> JobRunner::getJobStatus(const std::string &job_id)
{
    return store_.getJob(job_id);
}

void JobRunner::reapFinishedLocked()
{
    auto running = std::partition(workers_.begin(), workers_.end(), [](const Worker &worker)
                                  { return !worker.done->load(); });
    for (auto it = running; it != workers_.end(); ++it)
    {
        // The thread has finished its work and only needs to exit
        if (it->thread.joinable())
            it->thread.join();
    }
    workers_.erase(running, workers_.end());
}

size_t JobRunner::workerCount()
{
    std::lock_guard<std::mutex> lock(workers_mutex_);
    reapFinishedLocked();
    return workers_.size();
}

void JobRunner::waitForAll()
{
    for (;;)
    {
        std::vector<Worker> finished;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            finished.swap(workers_);
        }
        if (finished.empty())
            return;
        for (auto &worker : finished)
        {
            if (worker.thread.joinable())
                worker.thread.join();
        }
    }
}
