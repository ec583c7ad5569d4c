#include "core/config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

namespace
{
    std::optional<std::string> readEnv(const char *name)
    {
        const char *value = std::getenv(name);
        if (value == nullptr || *value == '\0')
            return std::nullopt;
        return std::string(value);
    }
}

ConfigManager::ConfigManager()
{
    cfg_ = new JSONConfiguration();
}

bool ConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Configuration file not readable: " + path);
        return false;
    }
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration " + path + ": " + e.displayText());
        return false;
    }
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool ConfigManager::loadFromString(const std::string &json_text)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::istringstream in(json_text);
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration: " + e.displayText());
        return false;
    }
    return true;
}

nlohmann::json ConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    auto all = nlohmann::json::parse(ss.str(), nullptr, false);
    if (all.is_discarded())
        return nlohmann::json::object();
    if (all.contains("ai") && all["ai"].contains("api_token"))
        all["ai"]["api_token"] = "***";
    return all;
}

std::string ConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int ConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getInt(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Invalid integer for " + key + ", using default: " + e.displayText());
        return def;
    }
}

bool ConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getBool(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Invalid boolean for " + key + ", using default: " + e.displayText());
        return def;
    }
}

double ConfigManager::getDouble(const std::string &key, double def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    try
    {
        return cfg_->getDouble(key, def);
    }
    catch (const Poco::SyntaxException &e)
    {
        Logger::warn("Invalid number for " + key + ", using default: " + e.displayText());
        return def;
    }
}

std::vector<std::string> ConfigManager::getStringList(const std::string &key,
                                                      const std::vector<std::string> &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cfg_->has(key + "[0]"))
        return def;
    std::vector<std::string> values;
    for (size_t i = 0;; ++i)
    {
        std::string element_key = key + "[" + std::to_string(i) + "]";
        if (!cfg_->has(element_key))
            break;
        values.push_back(cfg_->getString(element_key));
    }
    return values;
}

PipelineSettings ConfigManager::toSettings() const
{
    PipelineSettings s;

    s.media_root = getString("paths.media_root", s.media_root);
    s.database_path = getString("paths.database", s.database_path);
    s.system_dir = getString("paths.system_dir", s.system_dir);
    s.albums_dir = getString("paths.albums_dir", s.albums_dir);
    s.thumbnails_dir = getString("paths.thumbnails_dir", s.thumbnails_dir);
    s.temp_dir = getString("paths.temp_dir", s.temp_dir);

    s.image_extensions = getStringList("files.image_extensions", s.image_extensions);
    s.gif_extensions = getStringList("files.gif_extensions", s.gif_extensions);
    s.video_extensions = getStringList("files.video_extensions", s.video_extensions);
    s.reserved_suffixes = getStringList("files.reserved_suffixes", s.reserved_suffixes);

    s.gif_max_frames = getInt("extraction.gif_max_frames", s.gif_max_frames);
    s.video_fps = getDouble("extraction.video_fps", s.video_fps);
    s.video_max_frames = getInt("extraction.video_max_frames", s.video_max_frames);
    s.preview_fps = getDouble("extraction.preview_fps", s.preview_fps);
    s.preview_seconds = getDouble("extraction.preview_seconds", s.preview_seconds);
    s.thumbnail_max_width = getInt("extraction.thumbnail_max_width", s.thumbnail_max_width);
    s.jpeg_quality = getInt("extraction.jpeg_quality", s.jpeg_quality);

    s.ai_endpoint = getString("ai.endpoint", s.ai_endpoint);
    s.ai_model = getString("ai.model", s.ai_model);
    s.ai_api_token = getString("ai.api_token", s.ai_api_token);
    s.ai_temperature = getDouble("ai.temperature", s.ai_temperature);
    s.ai_top_p = getDouble("ai.top_p", s.ai_top_p);
    s.ai_max_completion_tokens = getInt("ai.max_completion_tokens", s.ai_max_completion_tokens);
    s.ai_timeout_seconds = getInt("ai.timeout_seconds", s.ai_timeout_seconds);
    s.sample_ref_mode = getString("ai.sample_ref_mode", s.sample_ref_mode);
    s.public_base_url = getString("ai.public_base_url", s.public_base_url);

    s.progress_interval = getInt("identity.progress_interval", s.progress_interval);

    s.log_level = getString("logging.level", s.log_level);
    s.log_file = getString("logging.file", s.log_file);

    // Deployment environment wins over the file
    if (auto v = readEnv("MEMES_DIR"))
        s.media_root = *v;
    if (auto v = readEnv("DB_PATH"))
        s.database_path = *v;
    if (auto v = readEnv("LOG_DIR"))
        s.log_file = (std::filesystem::path(*v) / "scan.log").string();
    if (auto v = readEnv("MEMES_URL_BASE"))
        s.public_base_url = *v;
    if (auto v = readEnv("REPLICATE_API_TOKEN"))
        s.ai_api_token = *v;

    if (s.sample_ref_mode != "url" && s.sample_ref_mode != "data_uri")
    {
        Logger::warn("Unknown ai.sample_ref_mode '" + s.sample_ref_mode + "', falling back to url");
        s.sample_ref_mode = "url";
    }
    if (s.gif_max_frames < 1)
        s.gif_max_frames = 1;
    if (s.video_max_frames < 1)
        s.video_max_frames = 1;
    if (s.video_fps <= 0.0)
        s.video_fps = 2.0;
    if (s.preview_fps <= 0.0)
        s.preview_fps = 10.0;
    if (s.progress_interval < 1)
        s.progress_interval = 1;
    if (s.ai_timeout_seconds < 1)
        s.ai_timeout_seconds = 120;
    return s;
}
