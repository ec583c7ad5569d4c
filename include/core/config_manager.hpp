#pragma once

#include "core/pipeline_settings.hpp"
#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <nlohmann/json.hpp>
#include <mutex>
#include <string>
#include <vector>

/**
 * @brief JSON configuration backed by Poco::Util::JSONConfiguration.
 *
 * Keys are dotted paths ("extraction.gif_max_frames"); arrays are addressed
 * as "files.image_extensions[0]". Absent keys fall back to the defaults of
 * PipelineSettings.
 */
class ConfigManager
{
public:
    ConfigManager();

    bool load(const std::string &path);
    bool loadFromString(const std::string &json_text);

    nlohmann::json getAll() const;

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    bool getBool(const std::string &key, bool def) const;
    double getDouble(const std::string &key, double def) const;
    std::vector<std::string> getStringList(const std::string &key, const std::vector<std::string> &def) const;

    /**
     * @brief Materialize the configuration, then apply deployment environment
     * overrides (MEMES_DIR, DB_PATH, LOG_DIR, MEMES_URL_BASE, REPLICATE_API_TOKEN)
     */
    PipelineSettings toSettings() const;

private:
    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
