#pragma once

#include "core/media_types.hpp"
#include "core/processing_result.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Structured content of an AI reply
 */
struct ParsedAnalysis
{
    AnalysisFields fields;
    std::vector<std::string> tag_names; // de-duplicated case-insensitively, first spelling kept
};

/**
 * @brief Tolerant reader for model output that is supposed to be a JSON object
 */
class ResponseParser
{
public:
    /**
     * @brief Parse raw model text
     * @param raw Model output, optionally wrapped in a ``` fence
     * @param out Filled on success
     * @return PARSE failure when the text is empty or not a JSON object
     */
    static ProcessingResult parse(const std::string &raw, ParsedAnalysis &out);

    // Trim, drop an opening ``` (with optional language tag) and a closing ```
    static std::string stripCodeFence(const std::string &raw);

    // Storable text for a descriptive value; nullopt for null
    static std::optional<std::string> normalizeValue(const nlohmann::json &value);

    static std::vector<std::string> parseTagNames(const nlohmann::json &value);
};
