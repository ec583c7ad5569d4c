#include "core/pipeline_orchestrator.hpp"
#include "core/frame_workspace.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <chrono>
#include <set>

namespace
{
    ItemOutcome skipped(int64_t record_id, const std::string &reason)
    {
        ItemOutcome outcome;
        outcome.record_id = record_id;
        outcome.message = reason;
        return outcome;
    }
}

PipelineOrchestrator::PipelineOrchestrator(CatalogStore &store, const PipelineSettings &settings, AiClient &ai_client)
    : store_(store),
      settings_(settings),
      verifier_(store, settings),
      scanner_(store, settings),
      dispatcher_(store, settings, ai_client),
      tagger_(store, settings)
{
}

DecodeDeadline PipelineOrchestrator::itemDeadline() const
{
    return DecodeDeadline::after(std::chrono::seconds(settings_.ai_timeout_seconds));
}

IngestSummary PipelineOrchestrator::ingest()
{
    Logger::info("Ingest started for " + settings_.getMediaRoot().string());
    IngestSummary summary;
    summary.verification = verifier_.verifyAll();
    summary.scan = scanner_.scan();
    summary.tags_applied = tagger_.applyPathTagsToAll();
    Logger::info("Ingest finished: added=" + std::to_string(summary.scan.added) +
                 " duplicates=" + std::to_string(summary.scan.duplicates) +
                 " relocated=" + std::to_string(summary.verification.relocated) +
                 " identity_errors=" + std::to_string(summary.verification.errored) +
                 " tags=" + std::to_string(summary.tags_applied));
    return summary;
}

int PipelineOrchestrator::recoverInterrupted()
{
    int reset = store_.resetInterruptedProcessing(
        PipelineErrors::format(PipelineErrorKind::ANALYSIS, "processing was interrupted before it finished"));
    if (reset > 0)
    {
        Logger::warn("Moved " + std::to_string(reset) + " interrupted record(s) from processing to error");
    }
    return reset;
}

ItemOutcome PipelineOrchestrator::processRecord(const MediaRecord &record)
{
    auto workspace = FrameWorkspace::acquire(store_, settings_, record.id);
    if (!workspace)
    {
        return skipped(record.id, "record is being processed elsewhere");
    }
    if (!store_.transitionToProcessing(record.id))
    {
        return skipped(record.id, "record is not eligible for processing");
    }

    ItemOutcome outcome;
    outcome.record_id = record.id;
    outcome.attempted = true;
    auto started = std::chrono::steady_clock::now();

    AnalysisOutcome analysis;
    try
    {
        analysis = dispatcher_.analyze(record, *workspace, itemDeadline());
    }
    catch (const std::exception &e)
    {
        analysis.status = ProcessingResult::Failure(PipelineErrorKind::ANALYSIS, std::string("unexpected failure: ") + e.what());
    }

    if (analysis.status.success)
    {
        if (store_.completeAnalysis(record.id, analysis.analysis.fields))
        {
            outcome.success = true;
            outcome.tags_applied = tagger_.applyPathTags(record) + tagger_.applyAiTags(record, analysis.analysis.tag_names);
        }
        else
        {
            outcome.message = "record left the processing state before its result was stored";
            Logger::warn("Record " + std::to_string(record.id) + ": " + outcome.message);
        }
    }
    else
    {
        outcome.message = analysis.status.formatted();
        if (!store_.failAnalysis(record.id, outcome.message))
        {
            Logger::warn("Record " + std::to_string(record.id) + " left the processing state before its error was stored");
        }
        Logger::error("Record " + std::to_string(record.id) + " failed: " + outcome.message);
    }

    outcome.processing_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::steady_clock::now() - started)
                                     .count();
    if (outcome.success)
    {
        Logger::info("Record " + std::to_string(record.id) + " done in " + std::to_string(outcome.processing_time_ms) +
                     " ms, " + std::to_string(outcome.tags_applied) + " new tag(s)");
    }
    return outcome;
}

ItemOutcome PipelineOrchestrator::processOne(int64_t record_id)
{
    auto record = store_.getMedia(record_id);
    if (!record)
    {
        return skipped(record_id, "record not found");
    }
    if (record->isDuplicate())
    {
        return skipped(record_id, "duplicate records are not processed");
    }
    if (record->status == MediaStatus::DONE)
    {
        return skipped(record_id, "record is already done");
    }
    if (record->status == MediaStatus::PROCESSING)
    {
        return skipped(record_id, "record is being processed elsewhere");
    }

    auto verification = verifier_.verify({*record});
    if (std::find(verification.reachable_ids.begin(), verification.reachable_ids.end(), record_id) ==
        verification.reachable_ids.end())
    {
        return skipped(record_id, "files are unreachable");
    }
    // Verification may have moved the record
    record = store_.getMedia(record_id);
    if (!record)
    {
        return skipped(record_id, "record not found");
    }
    return processRecord(*record);
}

BatchSummary PipelineOrchestrator::runBatch(const std::vector<MediaRecord> &records, const ItemObserver &on_item)
{
    BatchSummary summary;
    for (const auto &record : records)
    {
        if (isCancelled())
        {
            Logger::warn("Batch cancelled, " + std::to_string(summary.succeeded + summary.failed) + " item(s) finished");
            summary.cancelled = true;
            break;
        }
        ItemOutcome outcome = processRecord(record);
        if (!outcome.attempted)
            summary.skipped++;
        else if (outcome.success)
            summary.succeeded++;
        else
            summary.failed++;
        if (on_item)
            on_item(outcome);
    }
    return summary;
}

std::vector<MediaRecord> PipelineOrchestrator::reachableErrored()
{
    std::vector<MediaRecord> errored;
    for (auto &record : store_.listMediaByStatus(MediaStatus::ERROR))
    {
        if (!record.isDuplicate())
            errored.push_back(std::move(record));
    }
    if (errored.empty())
        return errored;

    auto verification = verifier_.verify(errored);
    std::set<int64_t> reachable(verification.reachable_ids.begin(), verification.reachable_ids.end());

    std::vector<MediaRecord> retry;
    for (const auto &record : errored)
    {
        if (reachable.count(record.id) == 0)
        {
            Logger::info("Record " + std::to_string(record.id) + " is still unreachable, not retried");
            continue;
        }
        // Reload to pick up relocated paths
        auto current = store_.getMedia(record.id);
        if (current)
            retry.push_back(*current);
    }
    return retry;
}

BatchSummary PipelineOrchestrator::processPending(bool include_errors, const ItemObserver &on_item)
{
    recoverInterrupted();

    std::vector<MediaRecord> records = store_.listMediaByStatus(MediaStatus::NEW);
    Logger::info("Processing " + std::to_string(records.size()) + " new record(s)");
    BatchSummary summary = runBatch(records, on_item);

    if (include_errors && !summary.cancelled)
    {
        BatchSummary retried = runBatch(reachableErrored(), on_item);
        summary.succeeded += retried.succeeded;
        summary.failed += retried.failed;
        summary.skipped += retried.skipped;
        summary.cancelled = retried.cancelled;
    }

    Logger::info("Batch finished: succeeded=" + std::to_string(summary.succeeded) +
                 " failed=" + std::to_string(summary.failed) +
                 " skipped=" + std::to_string(summary.skipped) +
                 (summary.cancelled ? " (cancelled)" : ""));
    return summary;
}

BatchSummary PipelineOrchestrator::retryErrors(const ItemObserver &on_item)
{
    recoverInterrupted();
    auto records = reachableErrored();
    Logger::info("Retrying " + std::to_string(records.size()) + " errored record(s)");
    BatchSummary summary = runBatch(records, on_item);
    Logger::info("Retry finished: succeeded=" + std::to_string(summary.succeeded) +
                 " failed=" + std::to_string(summary.failed) +
                 " skipped=" + std::to_string(summary.skipped));
    return summary;
}

int PipelineOrchestrator::tagScanRecord(const MediaRecord &record, bool with_ai)
{
    int applied = tagger_.applyPathTags(record);
    if (!with_ai)
        return applied;

    auto workspace = FrameWorkspace::acquire(store_, settings_, record.id);
    if (!workspace)
    {
        Logger::info("Record " + std::to_string(record.id) + " is busy, AI tagging skipped");
        return applied;
    }
    AnalysisOutcome analysis;
    try
    {
        analysis = dispatcher_.analyze(record, *workspace, itemDeadline());
    }
    catch (const std::exception &e)
    {
        analysis.status = ProcessingResult::Failure(PipelineErrorKind::ANALYSIS, e.what());
    }
    if (!analysis.status.success)
    {
        Logger::warn("AI tagging of record " + std::to_string(record.id) + " failed: " + analysis.status.formatted());
        return applied;
    }
    return applied + tagger_.applyAiTags(record, analysis.analysis.tag_names);
}

int PipelineOrchestrator::tagScan(const std::vector<int64_t> &record_ids, bool with_ai)
{
    int applied = 0;
    for (int64_t id : record_ids)
    {
        if (isCancelled())
            break;
        auto record = store_.getMedia(id);
        if (!record)
        {
            Logger::warn("Tag scan: record " + std::to_string(id) + " not found");
            continue;
        }
        if (record->isDuplicate())
            continue;
        applied += tagScanRecord(*record, with_ai);
    }
    Logger::info("Tag scan applied " + std::to_string(applied) + " new tag(s)");
    return applied;
}

int PipelineOrchestrator::tagScanAll(bool with_ai)
{
    std::vector<int64_t> ids;
    for (const auto &record : store_.listMedia())
    {
        if (!record.isDuplicate())
            ids.push_back(record.id);
    }
    return tagScan(ids, with_ai);
}
