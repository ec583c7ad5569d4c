#pragma once

#include "core/pipeline_settings.hpp"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Turns local sample files into references the AI capability can fetch.
 *
 * "url" mode publishes a file as ai.public_base_url plus its path relative to
 * the media root (percent-encoded per segment). "data_uri" mode inlines the
 * bytes as a base64 data: URI.
 */
class SampleRefResolver
{
public:
    explicit SampleRefResolver(const PipelineSettings &settings);

    std::optional<std::string> resolve(const std::string &file_path) const;

    /**
     * @brief Resolve every sample in order
     * @param error Set to the first failure when the result is empty
     */
    std::vector<std::string> resolveAll(const std::vector<std::string> &file_paths, std::string &error) const;

    std::string toPublicUrl(const std::string &file_path) const;
    static std::optional<std::string> toDataUri(const std::string &file_path);

    static std::string mimeTypeFor(const std::string &file_path);
    static std::string base64Encode(const std::vector<unsigned char> &data);
    static std::string percentEncodeSegment(const std::string &segment);

private:
    PipelineSettings settings_;
};
