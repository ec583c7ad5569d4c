#pragma once

#include "core/media_types.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Persistent repository of media records, album items, tags, tag
 * associations, workspace leases and job status.
 *
 * Every pipeline component receives a reference at construction. Each method
 * is atomic on its own; conditional updates report whether they applied.
 */
class CatalogStore
{
public:
    virtual ~CatalogStore() = default;

    // Media records

    /**
     * @brief Insert a single-file record
     * @return DBOpResult and the new record id (0 on failure)
     */
    virtual std::pair<DBOpResult, int64_t> insertMedia(const MediaRecord &record) = 0;

    /**
     * @brief Insert an album record together with its items in one transaction
     * @return DBOpResult and the new album id (0 on failure)
     */
    virtual std::pair<DBOpResult, int64_t> insertAlbum(const MediaRecord &album, const std::vector<AlbumItem> &items) = 0;

    virtual std::optional<MediaRecord> getMedia(int64_t id) = 0;

    // Non-duplicate record owning this path
    virtual std::optional<MediaRecord> findMediaByPath(const std::string &path) = 0;

    // Oldest non-duplicate record with this content hash
    virtual std::optional<MediaRecord> findOriginalByContentHash(const std::string &content_hash) = 0;

    virtual std::vector<MediaRecord> listMedia() = 0;
    virtual std::vector<MediaRecord> listMediaByStatus(MediaStatus status) = 0;

    /**
     * @brief Whether any record (duplicates included) or album item already uses this path
     */
    virtual bool isPathCatalogued(const std::string &path) = 0;

    /**
     * @brief Whether a non-duplicate record or an album item owns this path.
     * Relocation never moves a record onto a claimed path.
     */
    virtual bool isPathClaimed(const std::string &path) = 0;

    virtual DBOpResult updateContentHash(int64_t id, const std::string &content_hash, uint64_t size) = 0;
    virtual DBOpResult relocateMedia(int64_t id, const std::string &new_path, uint64_t size) = 0;
    virtual DBOpResult updateMediaPath(int64_t id, const std::string &new_path) = 0;

    // Unconditional error, used for identity failures
    virtual DBOpResult markError(int64_t id, const std::string &message) = 0;

    // Status transitions; false when the record was not in an eligible state

    // new|error -> processing
    virtual bool transitionToProcessing(int64_t id) = 0;
    // processing -> done, all descriptive fields written and error_message cleared in one statement
    virtual bool completeAnalysis(int64_t id, const AnalysisFields &fields) = 0;
    // processing -> error, descriptive fields untouched
    virtual bool failAnalysis(int64_t id, const std::string &message) = 0;

    /**
     * @brief Move records stuck in processing without a live workspace lease to error
     * @return Number of records reset
     */
    virtual int resetInterruptedProcessing(const std::string &message) = 0;

    // Album items

    virtual std::vector<AlbumItem> getAlbumItems(int64_t album_id) = 0;
    // Keyed by (album_id, display_order)
    virtual DBOpResult updateAlbumItem(const AlbumItem &item) = 0;

    // Tags

    virtual std::pair<DBOpResult, int64_t> insertTag(const Tag &tag) = 0;
    virtual std::vector<Tag> listTags() = 0;

    /**
     * @brief Insert the (media, tag) association if absent
     * @return true only when a new association was created
     */
    virtual bool addMemeTagIfAbsent(int64_t media_id, int64_t tag_id) = 0;
    virtual std::vector<int64_t> getTagIdsForMedia(int64_t media_id) = 0;

    // Workspace leases

    /**
     * @brief Reserve a named workspace
     * @param stale_after Leases older than this are considered abandoned and may be taken over
     * @return true if the caller now holds the lease
     */
    virtual bool tryAcquireWorkspace(const std::string &name, const std::string &owner,
                                     std::chrono::seconds stale_after) = 0;
    virtual void releaseWorkspace(const std::string &name, const std::string &owner) = 0;

    // Jobs

    virtual DBOpResult createJob(const JobRecord &job) = 0;
    virtual DBOpResult completeJob(const std::string &job_id, bool applied) = 0;
    virtual std::optional<JobRecord> getJob(const std::string &job_id) = 0;

    virtual std::map<MediaStatus, int> countByStatus() = 0;
};
