#include "ai/analysis_dispatcher.hpp"
#include "ai/prompt_builder.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace
{
    AnalysisOutcome outcomeFailure(const ProcessingResult &status)
    {
        AnalysisOutcome outcome;
        outcome.status = status;
        return outcome;
    }
}

AnalysisDispatcher::AnalysisDispatcher(CatalogStore &store, const PipelineSettings &settings, AiClient &ai_client)
    : store_(store), settings_(settings), ai_client_(ai_client), extractor_(settings), resolver_(settings)
{
}

std::vector<Tag> AnalysisDispatcher::suggestableTags()
{
    std::vector<Tag> tags;
    for (auto &tag : store_.listTags())
    {
        if (tag.ai_can_suggest)
            tags.push_back(std::move(tag));
    }
    return tags;
}

AnalysisOutcome AnalysisDispatcher::analyze(const MediaRecord &record, FrameWorkspace &workspace,
                                            const DecodeDeadline &deadline)
{
    std::vector<AlbumItem> items;
    if (record.isAlbum())
        items = store_.getAlbumItems(record.id);
    MediaKind kind = MediaTypes::toMediaKind(record, items);

    ExtractionResult extraction = extractor_.extract(kind, workspace, deadline);
    if (!extraction.status.success)
        return outcomeFailure(extraction.status);

    std::string error;
    std::vector<std::string> refs = resolver_.resolveAll(extraction.sample_paths, error);
    if (refs.empty())
    {
        return outcomeFailure(ProcessingResult::Failure(PipelineErrorKind::ANALYSIS,
                                                        error.empty() ? "no samples to send" : error));
    }

    auto remaining = std::min(deadline.remaining(),
                              std::chrono::milliseconds(std::chrono::seconds(settings_.ai_timeout_seconds)));
    if (remaining <= std::chrono::milliseconds(0))
    {
        return outcomeFailure(ProcessingResult::Failure(PipelineErrorKind::TIMEOUT,
                                                        "deadline exceeded before the AI call for record " +
                                                            std::to_string(record.id)));
    }

    std::string user_prompt = PromptBuilder::userPrompt(kind, refs.size(), suggestableTags());
    Logger::info("Analyzing record " + std::to_string(record.id) + " (" + MediaTypes::getTypeName(record.media_type) +
                 ", " + std::to_string(refs.size()) + " sample(s))");
    AiResponse response = ai_client_.analyze(PromptBuilder::systemPrompt(), user_prompt, refs, remaining);
    if (!response.success)
    {
        auto kind_of_failure = response.timed_out ? PipelineErrorKind::TIMEOUT : PipelineErrorKind::ANALYSIS;
        return outcomeFailure(ProcessingResult::Failure(kind_of_failure, response.error_message));
    }

    AnalysisOutcome outcome;
    outcome.sample_count = refs.size();
    outcome.status = ResponseParser::parse(response.text, outcome.analysis);
    if (!outcome.status.success)
    {
        Logger::debug("Unparseable AI output for record " + std::to_string(record.id) + ": " + response.text);
    }
    return outcome;
}
