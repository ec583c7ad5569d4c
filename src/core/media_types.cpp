#include "core/media_types.hpp"
#include <algorithm>

std::string MediaTypes::getTypeName(MediaType type)
{
    switch (type)
    {
    case MediaType::IMAGE:
        return "image";
    case MediaType::GIF:
        return "gif";
    case MediaType::VIDEO:
        return "video";
    case MediaType::ALBUM:
        return "album";
    }
    return "image";
}

std::optional<MediaType> MediaTypes::typeFromString(const std::string &type_str)
{
    if (type_str == "image")
        return MediaType::IMAGE;
    if (type_str == "gif")
        return MediaType::GIF;
    if (type_str == "video")
        return MediaType::VIDEO;
    if (type_str == "album")
        return MediaType::ALBUM;
    return std::nullopt;
}

std::string MediaTypes::getStatusName(MediaStatus status)
{
    switch (status)
    {
    case MediaStatus::NEW:
        return "new";
    case MediaStatus::PROCESSING:
        return "processing";
    case MediaStatus::DONE:
        return "done";
    case MediaStatus::ERROR:
        return "error";
    }
    return "new";
}

std::optional<MediaStatus> MediaTypes::statusFromString(const std::string &status_str)
{
    if (status_str == "new")
        return MediaStatus::NEW;
    if (status_str == "processing")
        return MediaStatus::PROCESSING;
    if (status_str == "done")
        return MediaStatus::DONE;
    if (status_str == "error")
        return MediaStatus::ERROR;
    return std::nullopt;
}

std::string MediaTypes::getJobKindName(JobKind kind)
{
    switch (kind)
    {
    case JobKind::INGEST:
        return "ingest";
    case JobKind::PROCESS_ONE:
        return "process_one";
    case JobKind::PROCESS_PENDING:
        return "process_pending";
    case JobKind::TAG_SCAN:
        return "tag_scan";
    }
    return "ingest";
}

JobKind MediaTypes::jobKindFromString(const std::string &kind_str)
{
    if (kind_str == "process_one")
        return JobKind::PROCESS_ONE;
    if (kind_str == "process_pending")
        return JobKind::PROCESS_PENDING;
    if (kind_str == "tag_scan")
        return JobKind::TAG_SCAN;
    return JobKind::INGEST;
}

MediaKind MediaTypes::toMediaKind(const MediaRecord &record, const std::vector<AlbumItem> &album_items)
{
    switch (record.media_type)
    {
    case MediaType::GIF:
        return GifMedia{record.id, record.path};
    case MediaType::VIDEO:
        return VideoMedia{record.id, record.path};
    case MediaType::ALBUM:
    {
        AlbumMedia album{record.id, record.path, album_items};
        std::sort(album.items.begin(), album.items.end(),
                  [](const AlbumItem &a, const AlbumItem &b)
                  { return a.display_order < b.display_order; });
        return album;
    }
    case MediaType::IMAGE:
        break;
    }
    return ImageMedia{record.id, record.path};
}
