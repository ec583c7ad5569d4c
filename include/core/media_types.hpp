#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

enum class MediaType
{
    IMAGE,
    GIF,
    VIDEO,
    ALBUM
};

enum class MediaStatus
{
    NEW,
    PROCESSING,
    DONE,
    ERROR
};

/**
 * @brief One ordered image inside an album folder
 */
struct AlbumItem
{
    int64_t album_id = 0;
    std::string path;
    int display_order = 0; // 1-based, dense within the album
    std::optional<std::string> content_hash;
    uint64_t size = 0;
};

/**
 * @brief Descriptive text produced by the analysis step
 */
struct AnalysisFields
{
    std::optional<std::string> references;
    std::optional<std::string> template_text;
    std::optional<std::string> caption;
    std::optional<std::string> description;
    std::optional<std::string> meaning;
};

/**
 * @brief Catalog entry for a single media file or an album folder
 */
struct MediaRecord
{
    int64_t id = 0;
    std::string path;
    MediaType media_type = MediaType::IMAGE;
    MediaStatus status = MediaStatus::NEW;
    std::optional<std::string> content_hash; // never set for albums
    uint64_t size = 0;
    std::optional<std::string> title;        // album folder name
    std::optional<int64_t> duplicate_of;     // set only on duplicate audit records
    AnalysisFields fields;
    std::optional<std::string> error_message;
    std::string created_at;
    std::string updated_at;

    bool isAlbum() const { return media_type == MediaType::ALBUM; }
    bool isDuplicate() const { return duplicate_of.has_value(); }
};

struct Tag
{
    int64_t id = 0;
    std::string name;
    std::string description;
    std::string color;
    bool parse_from_filename = false;
    bool ai_can_suggest = false;
};

enum class JobKind
{
    INGEST,
    PROCESS_ONE,
    PROCESS_PENDING,
    TAG_SCAN
};

enum class JobState
{
    PENDING,
    COMPLETED
};

/**
 * @brief Status row for an asynchronously triggered pipeline operation
 */
struct JobRecord
{
    std::string job_id;
    JobKind kind = JobKind::INGEST;
    std::string target;
    JobState state = JobState::PENDING;
    bool applied = false;
    std::string started_at;
    std::string completed_at;
};

// Per-kind payloads; each carries only what extraction and prompting need
struct ImageMedia
{
    int64_t record_id = 0;
    std::string path;
};

struct GifMedia
{
    int64_t record_id = 0;
    std::string path;
};

struct VideoMedia
{
    int64_t record_id = 0;
    std::string path;
};

struct AlbumMedia
{
    int64_t record_id = 0;
    std::string folder;
    std::vector<AlbumItem> items; // display_order ascending
};

using MediaKind = std::variant<ImageMedia, GifMedia, VideoMedia, AlbumMedia>;

class MediaTypes
{
public:
    static std::string getTypeName(MediaType type);
    static std::optional<MediaType> typeFromString(const std::string &type_str);

    static std::string getStatusName(MediaStatus status);
    static std::optional<MediaStatus> statusFromString(const std::string &status_str);

    static std::string getJobKindName(JobKind kind);
    static JobKind jobKindFromString(const std::string &kind_str);

    /**
     * @brief Build the kind payload for a record
     * @param record Catalog record
     * @param album_items Items of the album (ignored for non-album records)
     */
    static MediaKind toMediaKind(const MediaRecord &record, const std::vector<AlbumItem> &album_items = {});
};
