#pragma once

#include "core/media_types.hpp"
#include <string>
#include <vector>

/**
 * @brief Prompt text for the analysis request.
 *
 * The user prompt frames the samples according to the media kind and asks
 * for one JSON object with the descriptive fields plus "tags".
 */
class PromptBuilder
{
public:
    static std::string systemPrompt();

    /**
     * @brief Build the user prompt
     * @param kind Media kind being analyzed
     * @param sample_count Number of images that accompany the prompt
     * @param suggestable_tags Tags the model may choose from (ai_can_suggest)
     */
    static std::string userPrompt(const MediaKind &kind, size_t sample_count, const std::vector<Tag> &suggestable_tags);

    // Empty when there are no suggestable tags
    static std::string tagsInstruction(const std::vector<Tag> &suggestable_tags);

private:
    static std::string framing(const MediaKind &kind, size_t sample_count);
};
