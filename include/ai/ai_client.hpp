#pragma once

#include <chrono>
#include <string>
#include <vector>

/**
 * @brief Raw outcome of one AI invocation
 */
struct AiResponse
{
    bool success = false;
    std::string text;          // model output, unparsed
    std::string error_message;
    bool timed_out = false;
};

/**
 * @brief Vendor-agnostic transport to a multimodal model.
 *
 * Implementations only move prompts and sample references to the model and
 * return its text; parsing happens in ResponseParser.
 */
class AiClient
{
public:
    virtual ~AiClient() = default;

    /**
     * @brief Ask the model about a set of images
     * @param system_prompt Persona/system instruction
     * @param user_prompt Task instruction including the expected JSON shape
     * @param sample_refs Image references (URLs or data URIs), in order
     * @param timeout Upper bound for the whole call including polling
     */
    virtual AiResponse analyze(const std::string &system_prompt, const std::string &user_prompt,
                               const std::vector<std::string> &sample_refs, std::chrono::milliseconds timeout) = 0;
};
