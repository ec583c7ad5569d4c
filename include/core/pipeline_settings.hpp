#pragma once

#include <filesystem>
#include <string>
#include <vector>

/**
 * @brief Static configuration consumed by the pipeline components.
 *
 * Built once by ConfigManager and passed by value; components never read
 * configuration files themselves.
 */
struct PipelineSettings
{
    // Paths
    std::string media_root = "files";
    std::string database_path = "memelet.db";
    std::string system_dir = "_system";     // reserved subtree under media_root
    std::string albums_dir = "albums";      // top-level folders below it are albums
    std::string thumbnails_dir = "thumbnails";
    std::string temp_dir = "temp";

    // File classification
    std::vector<std::string> image_extensions = {"jpg", "jpeg", "png", "webp", "bmp"};
    std::vector<std::string> gif_extensions = {"gif"};
    std::vector<std::string> video_extensions = {"mp4", "webm", "mov", "mkv", "avi", "m4v"};
    std::vector<std::string> reserved_suffixes = {"_thumb.jpg", "_preview.mp4"};

    // Frame extraction
    int gif_max_frames = 10;
    double video_fps = 2.0;
    int video_max_frames = 20;
    double preview_fps = 10.0;
    double preview_seconds = 5.0;
    int thumbnail_max_width = 400;
    int jpeg_quality = 90;

    // AI capability
    std::string ai_endpoint = "https://api.replicate.com";
    std::string ai_model = "openai/gpt-4.1-mini";
    std::string ai_api_token;
    double ai_temperature = 1.0;
    double ai_top_p = 1.0;
    int ai_max_completion_tokens = 2048;
    int ai_timeout_seconds = 120;
    std::string sample_ref_mode = "url"; // "url" or "data_uri"
    std::string public_base_url = "http://localhost:5000/files/";

    // Identity verification
    int progress_interval = 500; // files hashed between slow-scan progress lines

    // Logging
    std::string log_level = "INFO";
    std::string log_file;

    // Absolute and normalized, without a trailing separator
    std::filesystem::path getMediaRoot() const
    {
        auto root = std::filesystem::absolute(std::filesystem::path(media_root)).lexically_normal();
        if (root.has_parent_path() && root.filename().empty())
            root = root.parent_path();
        return root;
    }
    std::filesystem::path getSystemRoot() const { return getMediaRoot() / system_dir; }
    std::filesystem::path getAlbumsRoot() const { return getMediaRoot() / albums_dir; }
    std::filesystem::path getThumbnailsRoot() const { return getSystemRoot() / thumbnails_dir; }
    std::filesystem::path getTempRoot() const { return getSystemRoot() / temp_dir; }
};
