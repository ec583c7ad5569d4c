#pragma once

#include "ai/ai_client.hpp"
#include "ai/analysis_dispatcher.hpp"
#include "core/directory_scanner.hpp"
#include "core/identity_verifier.hpp"
#include "core/pipeline_settings.hpp"
#include "core/tag_reconciler.hpp"
#include "database/catalog_store.hpp"
#include <atomic>
#include <functional>
#include <string>
#include <vector>

/**
 * @brief Result of processing a single record
 */
struct ItemOutcome
{
    int64_t record_id = 0;
    bool attempted = false; // false when the record was skipped before any status change
    bool success = false;
    std::string message;    // error message as persisted, or the reason for skipping
    int tags_applied = 0;
    long long processing_time_ms = 0;
};

struct BatchSummary
{
    int succeeded = 0;
    int failed = 0;
    int skipped = 0;
    bool cancelled = false;
};

struct IngestSummary
{
    VerificationSummary verification;
    ScanSummary scan;
    int tags_applied = 0;
};

/**
 * @brief Entry points of the pipeline and the record status state machine.
 *
 * Status moves new -> processing -> done|error and error -> processing. Errors
 * from extraction, the AI call or parsing end up on the failing record; no
 * entry point throws for a single bad item.
 *
 * Single-item calls may run concurrently with each other and with a batch.
 * Each item holds its workspace lease for the whole attempt, so the same
 * record is never processed twice at once.
 */
class PipelineOrchestrator
{
public:
    using ItemObserver = std::function<void(const ItemOutcome &)>;

    PipelineOrchestrator(CatalogStore &store, const PipelineSettings &settings, AiClient &ai_client);

    // Verify identities, register new files, apply path tags to everything
    IngestSummary ingest();

    // Process one record in status new or error; done records are left alone
    ItemOutcome processOne(int64_t record_id);

    /**
     * @brief Process every new record, then (optionally) every reachable errored one
     * @param on_item Called after each item
     */
    BatchSummary processPending(bool include_errors = false, const ItemObserver &on_item = nullptr);

    // Verify errored records and process the reachable ones
    BatchSummary retryErrors(const ItemObserver &on_item = nullptr);

    /**
     * @brief Re-run tagging without touching status or descriptive fields
     * @param with_ai Also ask the AI capability for tag suggestions
     * @return Number of associations created
     */
    int tagScan(const std::vector<int64_t> &record_ids, bool with_ai = true);
    int tagScanAll(bool with_ai = true);

    // Move records left in processing by a crashed run to error
    int recoverInterrupted();

    void cancel() { cancelled_.store(true); }
    void resetCancel() { cancelled_.store(false); }
    bool isCancelled() const { return cancelled_.load(); }

private:
    ItemOutcome processRecord(const MediaRecord &record);
    BatchSummary runBatch(const std::vector<MediaRecord> &records, const ItemObserver &on_item);
    std::vector<MediaRecord> reachableErrored();
    int tagScanRecord(const MediaRecord &record, bool with_ai);
    DecodeDeadline itemDeadline() const;

    CatalogStore &store_;
    PipelineSettings settings_;
    IdentityVerifier verifier_;
    DirectoryScanner scanner_;
    AnalysisDispatcher dispatcher_;
    TagReconciler tagger_;
    std::atomic<bool> cancelled_{false};
};
