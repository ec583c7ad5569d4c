#pragma once

#include <string>

/**
 * @brief Failure categories of the pipeline.
 *
 * IDENTITY and DUPLICATE are persisted as error records at ingest/verify time.
 * EXTRACTION, ANALYSIS, PARSE and TIMEOUT are persisted on the failing record
 * during processing and never cross the per-item boundary. TIMEOUT is always
 * retryable.
 */
enum class PipelineErrorKind
{
    NONE,
    IDENTITY,
    DUPLICATE,
    EXTRACTION,
    ANALYSIS,
    PARSE,
    TIMEOUT
};

class PipelineErrors
{
public:
    static std::string getKindName(PipelineErrorKind kind)
    {
        switch (kind)
        {
        case PipelineErrorKind::NONE:
            return "None";
        case PipelineErrorKind::IDENTITY:
            return "IdentityError";
        case PipelineErrorKind::DUPLICATE:
            return "DuplicateError";
        case PipelineErrorKind::EXTRACTION:
            return "ExtractionError";
        case PipelineErrorKind::ANALYSIS:
            return "AnalysisError";
        case PipelineErrorKind::PARSE:
            return "ParseError";
        case PipelineErrorKind::TIMEOUT:
            return "TimeoutError";
        }
        return "Unknown";
    }

    // Message as stored in error_message, e.g. "ParseError: AI response is empty"
    static std::string format(PipelineErrorKind kind, const std::string &message)
    {
        return getKindName(kind) + ": " + message;
    }
};
