#pragma once

#include "ai/ai_client.hpp"
#include "core/pipeline_settings.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>

/**
 * @brief AiClient over a Replicate-style predictions API.
 *
 * Creates a prediction for the configured model with "Prefer: wait" and, if
 * the prediction is still running when the server returns, polls its
 * urls.get location until it reaches a terminal state or the timeout passes.
 */
class ReplicateAiClient : public AiClient
{
public:
    explicit ReplicateAiClient(const PipelineSettings &settings);

    AiResponse analyze(const std::string &system_prompt, const std::string &user_prompt,
                       const std::vector<std::string> &sample_refs, std::chrono::milliseconds timeout) override;

    nlohmann::json buildRequestBody(const std::string &system_prompt, const std::string &user_prompt,
                                    const std::vector<std::string> &sample_refs) const;

    // Output of a succeeded prediction; list outputs (streamed tokens) are concatenated
    static std::optional<std::string> extractOutputText(const nlohmann::json &prediction);

    // "https://host:port/a/b" -> {"https://host:port", "/a/b"}
    static std::pair<std::string, std::string> splitUrl(const std::string &url);

private:
    AiResponse interpret(const nlohmann::json &prediction) const;

    PipelineSettings settings_;
};
