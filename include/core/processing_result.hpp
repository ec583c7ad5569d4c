#pragma once

#include "core/pipeline_errors.hpp"
#include <string>

/**
 * @brief Outcome of one per-item pipeline step (extraction, analysis, parsing)
 */
struct ProcessingResult
{
    bool success;
    std::string error_message;
    PipelineErrorKind error_kind;

    ProcessingResult() : success(false), error_kind(PipelineErrorKind::NONE) {}
    ProcessingResult(bool s, const std::string &msg = "", PipelineErrorKind kind = PipelineErrorKind::NONE)
        : success(s), error_message(msg), error_kind(kind) {}

    static ProcessingResult Failure(PipelineErrorKind kind, const std::string &msg)
    {
        return ProcessingResult(false, msg, kind);
    }

    // Message as persisted on the record
    std::string formatted() const
    {
        return PipelineErrors::format(error_kind, error_message);
    }
};
