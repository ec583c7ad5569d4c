#pragma once

#include "ai/ai_client.hpp"
#include "ai/response_parser.hpp"
#include "ai/sample_ref_resolver.hpp"
#include "core/frame_extractor.hpp"
#include "core/frame_workspace.hpp"
#include "core/pipeline_settings.hpp"
#include "database/catalog_store.hpp"

struct AnalysisOutcome
{
    ProcessingResult status;
    ParsedAnalysis analysis;
    size_t sample_count = 0;
};

/**
 * @brief Runs extraction, prompting, the AI call and parsing for one record.
 *
 * Nothing is written to the catalog here; the orchestrator persists the
 * outcome.
 */
class AnalysisDispatcher
{
public:
    AnalysisDispatcher(CatalogStore &store, const PipelineSettings &settings, AiClient &ai_client);

    AnalysisOutcome analyze(const MediaRecord &record, FrameWorkspace &workspace, const DecodeDeadline &deadline);

private:
    std::vector<Tag> suggestableTags();

    CatalogStore &store_;
    PipelineSettings settings_;
    AiClient &ai_client_;
    FrameExtractor extractor_;
    SampleRefResolver resolver_;
};
