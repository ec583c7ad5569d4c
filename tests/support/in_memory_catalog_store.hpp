#pragma once

#include "core/file_utils.hpp"
#include "database/catalog_store.hpp"
#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>

/**
 * @brief CatalogStore kept in process memory, same observable semantics as
 * the SQLite store. Leases can be manipulated directly by tests.
 */
class InMemoryCatalogStore : public CatalogStore
{
public:
    std::pair<DBOpResult, int64_t> insertMedia(const MediaRecord &record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!record.duplicate_of && ownerOfPath(record.path))
            return {DBOpResult(false, "UNIQUE constraint failed: media.file_path"), 0};
        MediaRecord stored = record;
        stored.id = next_media_id_++;
        media_[stored.id] = stored;
        return {DBOpResult(true), stored.id};
    }

    std::pair<DBOpResult, int64_t> insertAlbum(const MediaRecord &album, const std::vector<AlbumItem> &items) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (ownerOfPath(album.path))
            return {DBOpResult(false, "UNIQUE constraint failed: media.file_path"), 0};
        MediaRecord stored = album;
        stored.id = next_media_id_++;
        stored.media_type = MediaType::ALBUM;
        stored.status = MediaStatus::NEW;
        media_[stored.id] = stored;
        for (auto item : items)
        {
            item.album_id = stored.id;
            items_[stored.id].push_back(item);
        }
        return {DBOpResult(true), stored.id};
    }

    std::optional<MediaRecord> getMedia(int64_t id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = media_.find(id);
        if (it == media_.end())
            return std::nullopt;
        return it->second;
    }

    std::optional<MediaRecord> findMediaByPath(const std::string &path) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto owner = ownerOfPath(path);
        if (!owner)
            return std::nullopt;
        return media_[*owner];
    }

    std::optional<MediaRecord> findOriginalByContentHash(const std::string &content_hash) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &entry : media_)
        {
            const auto &record = entry.second;
            if (!record.duplicate_of && record.content_hash && *record.content_hash == content_hash)
                return record;
        }
        return std::nullopt;
    }

    std::vector<MediaRecord> listMedia() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MediaRecord> records;
        for (const auto &entry : media_)
            records.push_back(entry.second);
        return records;
    }

    std::vector<MediaRecord> listMediaByStatus(MediaStatus status) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<MediaRecord> records;
        for (const auto &entry : media_)
        {
            if (entry.second.status == status)
                records.push_back(entry.second);
        }
        return records;
    }

    bool isPathCatalogued(const std::string &path) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &entry : media_)
        {
            if (entry.second.path == path)
                return true;
        }
        return isAlbumItemPath(path);
    }

    bool isPathClaimed(const std::string &path) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return ownerOfPath(path).has_value() || isAlbumItemPath(path);
    }

    DBOpResult updateContentHash(int64_t id, const std::string &content_hash, uint64_t size) override
    {
        return update(id, [&](MediaRecord &record)
                      {
            record.content_hash = content_hash;
            record.size = size; });
    }

    DBOpResult relocateMedia(int64_t id, const std::string &new_path, uint64_t size) override
    {
        return update(id, [&](MediaRecord &record)
                      {
            record.path = new_path;
            record.size = size; });
    }

    DBOpResult updateMediaPath(int64_t id, const std::string &new_path) override
    {
        return update(id, [&](MediaRecord &record)
                      {
            record.path = new_path;
            std::string name = fs::path(new_path).filename().string();
            if (!name.empty())
                record.title = name; });
    }

    DBOpResult markError(int64_t id, const std::string &message) override
    {
        return update(id, [&](MediaRecord &record)
                      {
            record.status = MediaStatus::ERROR;
            record.error_message = message; });
    }

    bool transitionToProcessing(int64_t id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = media_.find(id);
        if (it == media_.end() || it->second.duplicate_of)
            return false;
        if (it->second.status != MediaStatus::NEW && it->second.status != MediaStatus::ERROR)
            return false;
        it->second.status = MediaStatus::PROCESSING;
        return true;
    }

    bool completeAnalysis(int64_t id, const AnalysisFields &fields) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = media_.find(id);
        if (it == media_.end() || it->second.status != MediaStatus::PROCESSING)
            return false;
        it->second.status = MediaStatus::DONE;
        it->second.fields = fields;
        it->second.error_message.reset();
        return true;
    }

    bool failAnalysis(int64_t id, const std::string &message) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = media_.find(id);
        if (it == media_.end() || it->second.status != MediaStatus::PROCESSING)
            return false;
        it->second.status = MediaStatus::ERROR;
        it->second.error_message = message;
        return true;
    }

    int resetInterruptedProcessing(const std::string &message) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        int reset = 0;
        for (auto &entry : media_)
        {
            auto &record = entry.second;
            if (record.status != MediaStatus::PROCESSING)
                continue;
            if (leases_.count("record-" + std::to_string(record.id)))
                continue;
            record.status = MediaStatus::ERROR;
            record.error_message = message;
            reset++;
        }
        return reset;
    }

    std::vector<AlbumItem> getAlbumItems(int64_t album_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto items = items_[album_id];
        std::sort(items.begin(), items.end(), [](const AlbumItem &a, const AlbumItem &b)
                  { return a.display_order < b.display_order; });
        return items;
    }

    DBOpResult updateAlbumItem(const AlbumItem &item) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &stored : items_[item.album_id])
        {
            if (stored.display_order == item.display_order)
            {
                stored.path = item.path;
                stored.content_hash = item.content_hash;
                stored.size = item.size;
                return DBOpResult(true);
            }
        }
        return DBOpResult(false, "album item not found");
    }

    std::pair<DBOpResult, int64_t> insertTag(const Tag &tag) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &entry : tags_)
        {
            if (FileUtils::toLower(entry.second.name) == FileUtils::toLower(tag.name))
                return {DBOpResult(false, "UNIQUE constraint failed: tags.name"), 0};
        }
        Tag stored = tag;
        stored.id = next_tag_id_++;
        tags_[stored.id] = stored;
        return {DBOpResult(true), stored.id};
    }

    std::vector<Tag> listTags() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Tag> tags;
        for (const auto &entry : tags_)
            tags.push_back(entry.second);
        return tags;
    }

    bool addMemeTagIfAbsent(int64_t media_id, int64_t tag_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return meme_tags_.insert({media_id, tag_id}).second;
    }

    std::vector<int64_t> getTagIdsForMedia(int64_t media_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<int64_t> ids;
        for (const auto &entry : meme_tags_)
        {
            if (entry.first == media_id)
                ids.push_back(entry.second);
        }
        return ids;
    }

    bool tryAcquireWorkspace(const std::string &name, const std::string &owner, std::chrono::seconds) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return leases_.emplace(name, owner).second;
    }

    void releaseWorkspace(const std::string &name, const std::string &owner) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = leases_.find(name);
        if (it != leases_.end() && it->second == owner)
            leases_.erase(it);
    }

    DBOpResult createJob(const JobRecord &job) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!jobs_.emplace(job.job_id, job).second)
            return DBOpResult(false, "duplicate job id");
        jobs_[job.job_id].state = JobState::PENDING;
        return DBOpResult(true);
    }

    DBOpResult completeJob(const std::string &job_id, bool applied) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end())
            return DBOpResult(false, "unknown job");
        it->second.state = JobState::COMPLETED;
        it->second.applied = applied;
        return DBOpResult(true);
    }

    std::optional<JobRecord> getJob(const std::string &job_id) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = jobs_.find(job_id);
        if (it == jobs_.end())
            return std::nullopt;
        return it->second;
    }

    std::map<MediaStatus, int> countByStatus() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::map<MediaStatus, int> counts;
        for (const auto &entry : media_)
            counts[entry.second.status]++;
        return counts;
    }

    // Test hooks

    void holdLease(const std::string &name, const std::string &owner = "test")
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leases_[name] = owner;
    }

    bool hasLease(const std::string &name)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return leases_.count(name) > 0;
    }

    void setStatus(int64_t id, MediaStatus status)
    {
        update(id, [status](MediaRecord &record)
               { record.status = status; });
    }

    void setFields(int64_t id, const AnalysisFields &fields)
    {
        update(id, [&fields](MediaRecord &record)
               { record.fields = fields; });
    }

private:
    template <typename Fn>
    DBOpResult update(int64_t id, Fn fn)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = media_.find(id);
        if (it == media_.end())
            return DBOpResult(false, "record not found");
        fn(it->second);
        return DBOpResult(true);
    }

    // Caller holds mutex_
    std::optional<int64_t> ownerOfPath(const std::string &path) const
    {
        for (const auto &entry : media_)
        {
            if (!entry.second.duplicate_of && entry.second.path == path)
                return entry.first;
        }
        return std::nullopt;
    }

    bool isAlbumItemPath(const std::string &path) const
    {
        for (const auto &album : items_)
        {
            for (const auto &item : album.second)
            {
                if (item.path == path)
                    return true;
            }
        }
        return false;
    }

    std::mutex mutex_;
    int64_t next_media_id_ = 1;
    int64_t next_tag_id_ = 1;
    std::map<int64_t, MediaRecord> media_;
    std::map<int64_t, std::vector<AlbumItem>> items_;
    std::map<int64_t, Tag> tags_;
    std::set<std::pair<int64_t, int64_t>> meme_tags_;
    std::map<std::string, std::string> leases_;
    std::map<std::string, JobRecord> jobs_;
};
