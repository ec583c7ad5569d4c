#pragma once

#include "database/catalog_store.hpp"
#include "database/database_access_queue.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <sqlite3.h>

/**
 * @brief CatalogStore on a single SQLite connection.
 *
 * All statements run on the DatabaseAccessQueue thread; public methods block
 * until their operation completes. Workspace leases are named
 * "record-<id>" by the pipeline, which resetInterruptedProcessing relies on.
 */
class SqliteCatalogStore : public CatalogStore
{
public:
    explicit SqliteCatalogStore(const std::string &db_path);
    ~SqliteCatalogStore() override;

    SqliteCatalogStore(const SqliteCatalogStore &) = delete;
    SqliteCatalogStore &operator=(const SqliteCatalogStore &) = delete;

    bool isOpen() const { return open_; }
    const std::string &getPath() const { return db_path_; }

    std::pair<DBOpResult, int64_t> insertMedia(const MediaRecord &record) override;
    std::pair<DBOpResult, int64_t> insertAlbum(const MediaRecord &album, const std::vector<AlbumItem> &items) override;
    std::optional<MediaRecord> getMedia(int64_t id) override;
    std::optional<MediaRecord> findMediaByPath(const std::string &path) override;
    std::optional<MediaRecord> findOriginalByContentHash(const std::string &content_hash) override;
    std::vector<MediaRecord> listMedia() override;
    std::vector<MediaRecord> listMediaByStatus(MediaStatus status) override;
    bool isPathCatalogued(const std::string &path) override;
    bool isPathClaimed(const std::string &path) override;
    DBOpResult updateContentHash(int64_t id, const std::string &content_hash, uint64_t size) override;
    DBOpResult relocateMedia(int64_t id, const std::string &new_path, uint64_t size) override;
    DBOpResult updateMediaPath(int64_t id, const std::string &new_path) override;
    DBOpResult markError(int64_t id, const std::string &message) override;

    bool transitionToProcessing(int64_t id) override;
    bool completeAnalysis(int64_t id, const AnalysisFields &fields) override;
    bool failAnalysis(int64_t id, const std::string &message) override;
    int resetInterruptedProcessing(const std::string &message) override;

    std::vector<AlbumItem> getAlbumItems(int64_t album_id) override;
    DBOpResult updateAlbumItem(const AlbumItem &item) override;

    std::pair<DBOpResult, int64_t> insertTag(const Tag &tag) override;
    std::vector<Tag> listTags() override;
    bool addMemeTagIfAbsent(int64_t media_id, int64_t tag_id) override;
    std::vector<int64_t> getTagIdsForMedia(int64_t media_id) override;

    bool tryAcquireWorkspace(const std::string &name, const std::string &owner,
                             std::chrono::seconds stale_after) override;
    void releaseWorkspace(const std::string &name, const std::string &owner) override;

    DBOpResult createJob(const JobRecord &job) override;
    DBOpResult completeJob(const std::string &job_id, bool applied) override;
    std::optional<JobRecord> getJob(const std::string &job_id) override;

    std::map<MediaStatus, int> countByStatus() override;

private:
    // Binds statement parameters; returns false if binding failed
    using Binder = std::function<void(sqlite3_stmt *)>;

    void initialize();
    bool createMediaTable();
    bool createAlbumItemsTable();
    bool createTagsTables();
    bool createWorkspaceLeasesTable();
    bool createJobsTable();

    // Run on the access thread only
    DBOpResult executeStatement(const std::string &sql);

    DBOpResult runWrite(WriteOperation operation);
    std::vector<MediaRecord> queryMedia(const std::string &where_clause, Binder bind);

    /**
     * @brief Run a single UPDATE/INSERT and report the number of changed rows
     * @return -1 on SQL failure, otherwise sqlite3_changes()
     */
    int executeCounted(const std::string &sql, Binder bind);

    sqlite3 *db_;
    std::string db_path_;
    bool open_;
    std::unique_ptr<DatabaseAccessQueue> access_queue_;
};
