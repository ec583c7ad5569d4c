#include "database/sqlite_catalog_store.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>

namespace
{
    const char *MEDIA_COLUMNS =
        "id, file_path, media_type, status, content_hash, file_size, title, duplicate_of, "
        "refs, template, caption, description, meaning, error_message, created_at, updated_at";

    std::string columnText(sqlite3_stmt *stmt, int col)
    {
        const unsigned char *text = sqlite3_column_text(stmt, col);
        return text ? reinterpret_cast<const char *>(text) : "";
    }

    std::optional<std::string> columnOptionalText(sqlite3_stmt *stmt, int col)
    {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL)
            return std::nullopt;
        return columnText(stmt, col);
    }

    void bindText(sqlite3_stmt *stmt, int idx, const std::string &value)
    {
        sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
    }

    void bindOptionalText(sqlite3_stmt *stmt, int idx, const std::optional<std::string> &value)
    {
        if (value)
            sqlite3_bind_text(stmt, idx, value->c_str(), -1, SQLITE_TRANSIENT);
        else
            sqlite3_bind_null(stmt, idx);
    }

    MediaRecord readMediaRow(sqlite3_stmt *stmt)
    {
        MediaRecord record;
        record.id = sqlite3_column_int64(stmt, 0);
        record.path = columnText(stmt, 1);
        record.media_type = MediaTypes::typeFromString(columnText(stmt, 2)).value_or(MediaType::IMAGE);
        record.status = MediaTypes::statusFromString(columnText(stmt, 3)).value_or(MediaStatus::ERROR);
        record.content_hash = columnOptionalText(stmt, 4);
        record.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
        record.title = columnOptionalText(stmt, 6);
        if (sqlite3_column_type(stmt, 7) != SQLITE_NULL)
            record.duplicate_of = sqlite3_column_int64(stmt, 7);
        record.fields.references = columnOptionalText(stmt, 8);
        record.fields.template_text = columnOptionalText(stmt, 9);
        record.fields.caption = columnOptionalText(stmt, 10);
        record.fields.description = columnOptionalText(stmt, 11);
        record.fields.meaning = columnOptionalText(stmt, 12);
        record.error_message = columnOptionalText(stmt, 13);
        record.created_at = columnText(stmt, 14);
        record.updated_at = columnText(stmt, 15);
        return record;
    }

    template <typename T>
    T awaitValue(std::future<std::any> &future, T fallback, const std::string &what)
    {
        try
        {
            return std::any_cast<T>(future.get());
        }
        catch (const std::bad_any_cast &e)
        {
            Logger::error(what + ": unexpected result type: " + e.what());
        }
        catch (const std::exception &e)
        {
            Logger::error(what + " failed: " + e.what());
        }
        return fallback;
    }
}

SqliteCatalogStore::SqliteCatalogStore(const std::string &db_path)
    : db_(nullptr), db_path_(db_path), open_(false)
{
    Logger::info("Opening catalog database: " + db_path);
    access_queue_ = std::make_unique<DatabaseAccessQueue>(*this);

    auto open_future = access_queue_->enqueueValueWrite([db_path](SqliteCatalogStore &store)
                                                        {
        int rc = sqlite3_open(db_path.c_str(), &store.db_);
        if (rc != SQLITE_OK)
        {
            Logger::error("Failed to open database: " + std::string(sqlite3_errmsg(store.db_)));
            sqlite3_close(store.db_);
            store.db_ = nullptr;
            return std::any(false);
        }
        rc = sqlite3_exec(store.db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(store.db_)));
        }
        sqlite3_exec(store.db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
        sqlite3_busy_timeout(store.db_, 5000);
        rc = sqlite3_exec(store.db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);
        if (rc != SQLITE_OK)
        {
            Logger::warn("Failed to enable foreign keys: " + std::string(sqlite3_errmsg(store.db_)));
        }
        return std::any(true); });

    open_ = awaitValue<bool>(open_future, false, "Database open");
    if (!open_)
    {
        Logger::error("Database open failed in access queue");
        return;
    }
    initialize();
}

SqliteCatalogStore::~SqliteCatalogStore()
{
    if (access_queue_)
    {
        auto close_future = access_queue_->enqueueValueWrite([](SqliteCatalogStore &store)
                                                             {
            if (store.db_)
            {
                sqlite3_close(store.db_);
                store.db_ = nullptr;
                Logger::debug("Catalog database connection closed");
            }
            return std::any(true); });
        awaitValue<bool>(close_future, false, "Database close");
        access_queue_->stop();
        access_queue_.reset();
    }
}

void SqliteCatalogStore::initialize()
{
    auto init_future = access_queue_->enqueueValueWrite([](SqliteCatalogStore &store)
                                                        {
        bool ok = true;
        if (!store.createMediaTable())
        {
            Logger::error("Failed to create media table");
            ok = false;
        }
        if (!store.createAlbumItemsTable())
        {
            Logger::error("Failed to create album_items table");
            ok = false;
        }
        if (!store.createTagsTables())
        {
            Logger::error("Failed to create tags tables");
            ok = false;
        }
        if (!store.createWorkspaceLeasesTable())
        {
            Logger::error("Failed to create workspace_leases table");
            ok = false;
        }
        if (!store.createJobsTable())
        {
            Logger::error("Failed to create jobs table");
            ok = false;
        }
        return std::any(ok); });
    open_ = awaitValue<bool>(init_future, false, "Schema initialization");
    if (open_)
        Logger::info("Catalog tables initialization completed");
}

bool SqliteCatalogStore::createMediaTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS media (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_path TEXT NOT NULL,
            media_type TEXT NOT NULL,
            status TEXT NOT NULL DEFAULT 'new',
            content_hash TEXT,            -- SHA-256 hex, never set for albums
            file_size INTEGER DEFAULT 0,
            title TEXT,                   -- album folder name
            duplicate_of INTEGER REFERENCES media(id),
            refs TEXT,
            template TEXT,
            caption TEXT,
            description TEXT,
            meaning TEXT,
            error_message TEXT,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP
        );
        CREATE UNIQUE INDEX IF NOT EXISTS idx_media_original_path ON media(file_path) WHERE duplicate_of IS NULL;
        CREATE INDEX IF NOT EXISTS idx_media_status ON media(status);
        CREATE INDEX IF NOT EXISTS idx_media_content_hash ON media(content_hash);
    )";
    return executeStatement(sql).success;
}

bool SqliteCatalogStore::createAlbumItemsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS album_items (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            album_id INTEGER NOT NULL REFERENCES media(id) ON DELETE CASCADE,
            file_path TEXT NOT NULL,
            display_order INTEGER NOT NULL,
            content_hash TEXT,
            file_size INTEGER DEFAULT 0,
            UNIQUE(album_id, display_order)
        );
        CREATE INDEX IF NOT EXISTS idx_album_items_path ON album_items(file_path);
    )";
    return executeStatement(sql).success;
}

bool SqliteCatalogStore::createTagsTables()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS tags (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE COLLATE NOCASE,
            description TEXT NOT NULL DEFAULT '',
            color TEXT NOT NULL DEFAULT '',
            parse_from_filename BOOLEAN NOT NULL DEFAULT 0,
            ai_can_suggest BOOLEAN NOT NULL DEFAULT 0
        );
        CREATE TABLE IF NOT EXISTS meme_tags (
            media_id INTEGER NOT NULL REFERENCES media(id) ON DELETE CASCADE,
            tag_id INTEGER NOT NULL REFERENCES tags(id) ON DELETE CASCADE,
            created_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            PRIMARY KEY(media_id, tag_id)
        );
    )";
    return executeStatement(sql).success;
}

bool SqliteCatalogStore::createWorkspaceLeasesTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS workspace_leases (
            name TEXT PRIMARY KEY,
            owner TEXT NOT NULL,
            acquired_at INTEGER NOT NULL  -- unix seconds
        )
    )";
    return executeStatement(sql).success;
}

bool SqliteCatalogStore::createJobsTable()
{
    const std::string sql = R"(
        CREATE TABLE IF NOT EXISTS jobs (
            job_id TEXT PRIMARY KEY,
            kind TEXT NOT NULL,
            target TEXT NOT NULL DEFAULT '',
            state TEXT NOT NULL DEFAULT 'pending',
            applied BOOLEAN NOT NULL DEFAULT 0,
            started_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            completed_at TIMESTAMP
        )
    )";
    return executeStatement(sql).success;
}

DBOpResult SqliteCatalogStore::executeStatement(const std::string &sql)
{
    if (!db_)
        return DBOpResult(false, "Database not initialized");
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string error = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        Logger::error("SQL error: " + error);
        return DBOpResult(false, error);
    }
    return DBOpResult(true, "");
}

int SqliteCatalogStore::executeCounted(const std::string &sql, Binder bind)
{
    if (!db_)
    {
        Logger::error("Database not initialized");
        return -1;
    }
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));
        return -1;
    }
    if (bind)
        bind(stmt);
    rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE)
    {
        Logger::error("Statement failed: " + std::string(sqlite3_errmsg(db_)));
        return -1;
    }
    return sqlite3_changes(db_);
}

DBOpResult SqliteCatalogStore::runWrite(WriteOperation operation)
{
    if (!open_)
        return DBOpResult(false, "Database not initialized");
    auto future = access_queue_->enqueueWrite(std::move(operation));
    WriteOperationResult result = future.get();
    return DBOpResult(result.success, result.error_message);
}

std::vector<MediaRecord> SqliteCatalogStore::queryMedia(const std::string &where_clause, Binder bind)
{
    if (!open_)
        return {};
    std::string sql = std::string("SELECT ") + MEDIA_COLUMNS + " FROM media " + where_clause;
    auto future = access_queue_->enqueueRead([sql, bind](SqliteCatalogStore &store)
                                             {
        std::vector<MediaRecord> records;
        if (!store.db_)
            return std::any(records);
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare media query: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(records);
        }
        if (bind)
            bind(stmt);
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            records.push_back(readMediaRow(stmt));
        }
        sqlite3_finalize(stmt);
        return std::any(records); });
    return awaitValue<std::vector<MediaRecord>>(future, {}, "Media query");
}

std::pair<DBOpResult, int64_t> SqliteCatalogStore::insertMedia(const MediaRecord &record)
{
    if (!open_)
        return {DBOpResult(false, "Database not initialized"), 0};
    MediaRecord captured = record;
    auto future = access_queue_->enqueueValueWrite([captured](SqliteCatalogStore &store)
                                                   {
        const std::string sql = R"(
            INSERT INTO media (file_path, media_type, status, content_hash, file_size, title, duplicate_of, error_message)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?)
        )";
        int changes = store.executeCounted(sql, [&captured](sqlite3_stmt *stmt)
                                           {
            bindText(stmt, 1, captured.path);
            bindText(stmt, 2, MediaTypes::getTypeName(captured.media_type));
            bindText(stmt, 3, MediaTypes::getStatusName(captured.status));
            bindOptionalText(stmt, 4, captured.content_hash);
            sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(captured.size));
            bindOptionalText(stmt, 6, captured.title);
            if (captured.duplicate_of)
                sqlite3_bind_int64(stmt, 7, *captured.duplicate_of);
            else
                sqlite3_bind_null(stmt, 7);
            bindOptionalText(stmt, 8, captured.error_message); });
        if (changes != 1)
        {
            return std::any(std::make_pair(DBOpResult(false, "Failed to insert media: " + captured.path), int64_t{0}));
        }
        int64_t id = sqlite3_last_insert_rowid(store.db_);
        Logger::debug("Inserted media record #" + std::to_string(id) + ": " + captured.path);
        return std::any(std::make_pair(DBOpResult(true, ""), id)); });
    return awaitValue<std::pair<DBOpResult, int64_t>>(future, {DBOpResult(false, "Insert failed"), 0}, "insertMedia");
}

std::pair<DBOpResult, int64_t> SqliteCatalogStore::insertAlbum(const MediaRecord &album, const std::vector<AlbumItem> &items)
{
    if (!open_)
        return {DBOpResult(false, "Database not initialized"), 0};
    MediaRecord captured_album = album;
    std::vector<AlbumItem> captured_items = items;
    auto future = access_queue_->enqueueValueWrite([captured_album, captured_items](SqliteCatalogStore &store)
                                                   {
        using Result = std::pair<DBOpResult, int64_t>;
        auto begin = store.executeStatement("BEGIN IMMEDIATE TRANSACTION");
        if (!begin.success)
            return std::any(Result(begin, 0));

        auto rollback = [&store](const std::string &msg)
        {
            store.executeStatement("ROLLBACK");
            Logger::error(msg);
            return std::any(Result(DBOpResult(false, msg), 0));
        };

        int changes = store.executeCounted(
            "INSERT INTO media (file_path, media_type, status, file_size, title) VALUES (?, 'album', 'new', ?, ?)",
            [&captured_album](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, captured_album.path);
                sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(captured_album.size));
                bindOptionalText(stmt, 3, captured_album.title);
            });
        if (changes != 1)
            return rollback("Failed to insert album: " + captured_album.path);
        int64_t album_id = sqlite3_last_insert_rowid(store.db_);

        for (const auto &item : captured_items)
        {
            changes = store.executeCounted(
                "INSERT INTO album_items (album_id, file_path, display_order, content_hash, file_size) VALUES (?, ?, ?, ?, ?)",
                [&item, album_id](sqlite3_stmt *stmt)
                {
                    sqlite3_bind_int64(stmt, 1, album_id);
                    bindText(stmt, 2, item.path);
                    sqlite3_bind_int(stmt, 3, item.display_order);
                    bindOptionalText(stmt, 4, item.content_hash);
                    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(item.size));
                });
            if (changes != 1)
                return rollback("Failed to insert album item: " + item.path);
        }

        auto commit = store.executeStatement("COMMIT");
        if (!commit.success)
            return rollback("Failed to commit album: " + commit.error_message);
        Logger::debug("Inserted album #" + std::to_string(album_id) + " with " +
                      std::to_string(captured_items.size()) + " items");
        return std::any(Result(DBOpResult(true, ""), album_id)); });
    return awaitValue<std::pair<DBOpResult, int64_t>>(future, {DBOpResult(false, "Insert failed"), 0}, "insertAlbum");
}

std::optional<MediaRecord> SqliteCatalogStore::getMedia(int64_t id)
{
    auto records = queryMedia("WHERE id = ?", [id](sqlite3_stmt *stmt)
                              { sqlite3_bind_int64(stmt, 1, id); });
    if (records.empty())
        return std::nullopt;
    return records.front();
}

std::optional<MediaRecord> SqliteCatalogStore::findMediaByPath(const std::string &path)
{
    auto records = queryMedia("WHERE file_path = ? AND duplicate_of IS NULL", [path](sqlite3_stmt *stmt)
                              { bindText(stmt, 1, path); });
    if (records.empty())
        return std::nullopt;
    return records.front();
}

std::optional<MediaRecord> SqliteCatalogStore::findOriginalByContentHash(const std::string &content_hash)
{
    auto records = queryMedia("WHERE content_hash = ? AND duplicate_of IS NULL ORDER BY id LIMIT 1",
                              [content_hash](sqlite3_stmt *stmt)
                              { bindText(stmt, 1, content_hash); });
    if (records.empty())
        return std::nullopt;
    return records.front();
}

std::vector<MediaRecord> SqliteCatalogStore::listMedia()
{
    return queryMedia("ORDER BY id", nullptr);
}

std::vector<MediaRecord> SqliteCatalogStore::listMediaByStatus(MediaStatus status)
{
    std::string status_name = MediaTypes::getStatusName(status);
    return queryMedia("WHERE status = ? ORDER BY id", [status_name](sqlite3_stmt *stmt)
                      { bindText(stmt, 1, status_name); });
}

bool SqliteCatalogStore::isPathCatalogued(const std::string &path)
{
    if (!open_)
        return false;
    auto future = access_queue_->enqueueRead([path](SqliteCatalogStore &store)
                                             {
        const std::string sql =
            "SELECT EXISTS(SELECT 1 FROM media WHERE file_path = ?) OR "
            "EXISTS(SELECT 1 FROM album_items WHERE file_path = ?)";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare path lookup: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(false);
        }
        bindText(stmt, 1, path);
        bindText(stmt, 2, path);
        bool found = sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_int(stmt, 0) != 0;
        sqlite3_finalize(stmt);
        return std::any(found); });
    return awaitValue<bool>(future, false, "isPathCatalogued");
}

bool SqliteCatalogStore::isPathClaimed(const std::string &path)
{
    if (!open_)
        return false;
    auto future = access_queue_->enqueueRead([path](SqliteCatalogStore &store)
                                             {
        const std::string sql =
            "SELECT EXISTS(SELECT 1 FROM media WHERE file_path = ? AND duplicate_of IS NULL) OR "
            "EXISTS(SELECT 1 FROM album_items WHERE file_path = ?)";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare path lookup: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(false);
        }
        bindText(stmt, 1, path);
        bindText(stmt, 2, path);
        bool found = sqlite3_step(stmt) == SQLITE_ROW && sqlite3_column_int(stmt, 0) != 0;
        sqlite3_finalize(stmt);
        return std::any(found); });
    return awaitValue<bool>(future, false, "isPathClaimed");
}

DBOpResult SqliteCatalogStore::updateContentHash(int64_t id, const std::string &content_hash, uint64_t size)
{
    return runWrite([id, content_hash, size](SqliteCatalogStore &store)
                    {
        int changes = store.executeCounted(
            "UPDATE media SET content_hash = ?, file_size = ?, updated_at = CURRENT_TIMESTAMP WHERE id = ?",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, content_hash);
                sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(size));
                sqlite3_bind_int64(stmt, 3, id);
            });
        if (changes != 1)
            return WriteOperationResult::Failure("No media record #" + std::to_string(id));
        return WriteOperationResult(); });
}

DBOpResult SqliteCatalogStore::relocateMedia(int64_t id, const std::string &new_path, uint64_t size)
{
    return runWrite([id, new_path, size](SqliteCatalogStore &store)
                    {
        int changes = store.executeCounted(
            "UPDATE media SET file_path = ?, file_size = ?, updated_at = CURRENT_TIMESTAMP WHERE id = ?",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, new_path);
                sqlite3_bind_int64(stmt, 2, static_cast<sqlite3_int64>(size));
                sqlite3_bind_int64(stmt, 3, id);
            });
        if (changes != 1)
            return WriteOperationResult::Failure("Failed to relocate media #" + std::to_string(id) + " to " + new_path);
        Logger::debug("Relocated media #" + std::to_string(id) + " to " + new_path);
        return WriteOperationResult(); });
}

DBOpResult SqliteCatalogStore::updateMediaPath(int64_t id, const std::string &new_path)
{
    return runWrite([id, new_path](SqliteCatalogStore &store)
                    {
        int changes = store.executeCounted(
            "UPDATE media SET file_path = ?, title = COALESCE(?, title), updated_at = CURRENT_TIMESTAMP WHERE id = ?",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, new_path);
                std::string folder_name = std::filesystem::path(new_path).filename().string();
                if (folder_name.empty())
                    sqlite3_bind_null(stmt, 2);
                else
                    bindText(stmt, 2, folder_name);
                sqlite3_bind_int64(stmt, 3, id);
            });
        if (changes != 1)
            return WriteOperationResult::Failure("Failed to update path of media #" + std::to_string(id));
        return WriteOperationResult(); });
}

DBOpResult SqliteCatalogStore::markError(int64_t id, const std::string &message)
{
    return runWrite([id, message](SqliteCatalogStore &store)
                    {
        int changes = store.executeCounted(
            "UPDATE media SET status = 'error', error_message = ?, updated_at = CURRENT_TIMESTAMP WHERE id = ?",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, message);
                sqlite3_bind_int64(stmt, 2, id);
            });
        if (changes != 1)
            return WriteOperationResult::Failure("No media record #" + std::to_string(id));
        return WriteOperationResult(); });
}

bool SqliteCatalogStore::transitionToProcessing(int64_t id)
{
    if (!open_)
        return false;
    auto future = access_queue_->enqueueValueWrite([id](SqliteCatalogStore &store)
                                                   {
        int changes = store.executeCounted(
            "UPDATE media SET status = 'processing', updated_at = CURRENT_TIMESTAMP "
            "WHERE id = ? AND status IN ('new', 'error') AND duplicate_of IS NULL",
            [id](sqlite3_stmt *stmt)
            { sqlite3_bind_int64(stmt, 1, id); });
        return std::any(changes == 1); });
    return awaitValue<bool>(future, false, "transitionToProcessing");
}

bool SqliteCatalogStore::completeAnalysis(int64_t id, const AnalysisFields &fields)
{
    if (!open_)
        return false;
    auto future = access_queue_->enqueueValueWrite([id, fields](SqliteCatalogStore &store)
                                                   {
        int changes = store.executeCounted(
            "UPDATE media SET status = 'done', refs = ?, template = ?, caption = ?, description = ?, meaning = ?, "
            "error_message = NULL, updated_at = CURRENT_TIMESTAMP WHERE id = ? AND status = 'processing'",
            [&](sqlite3_stmt *stmt)
            {
                bindOptionalText(stmt, 1, fields.references);
                bindOptionalText(stmt, 2, fields.template_text);
                bindOptionalText(stmt, 3, fields.caption);
                bindOptionalText(stmt, 4, fields.description);
                bindOptionalText(stmt, 5, fields.meaning);
                sqlite3_bind_int64(stmt, 6, id);
            });
        return std::any(changes == 1); });
    return awaitValue<bool>(future, false, "completeAnalysis");
}

bool SqliteCatalogStore::failAnalysis(int64_t id, const std::string &message)
{
    if (!open_)
        return false;
    auto future = access_queue_->enqueueValueWrite([id, message](SqliteCatalogStore &store)
                                                   {
        int changes = store.executeCounted(
            "UPDATE media SET status = 'error', error_message = ?, updated_at = CURRENT_TIMESTAMP "
            "WHERE id = ? AND status = 'processing'",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, message);
                sqlite3_bind_int64(stmt, 2, id);
            });
        return std::any(changes == 1); });
    return awaitValue<bool>(future, false, "failAnalysis");
}

int SqliteCatalogStore::resetInterruptedProcessing(const std::string &message)
{
    if (!open_)
        return 0;
    auto future = access_queue_->enqueueValueWrite([message](SqliteCatalogStore &store)
                                                   {
        int changes = store.executeCounted(
            "UPDATE media SET status = 'error', error_message = ?, updated_at = CURRENT_TIMESTAMP "
            "WHERE status = 'processing' AND ('record-' || id) NOT IN (SELECT name FROM workspace_leases)",
            [&](sqlite3_stmt *stmt)
            { bindText(stmt, 1, message); });
        return std::any(changes < 0 ? 0 : changes); });
    return awaitValue<int>(future, 0, "resetInterruptedProcessing");
}

std::vector<AlbumItem> SqliteCatalogStore::getAlbumItems(int64_t album_id)
{
    if (!open_)
        return {};
    auto future = access_queue_->enqueueRead([album_id](SqliteCatalogStore &store)
                                             {
        std::vector<AlbumItem> items;
        const std::string sql =
            "SELECT album_id, file_path, display_order, content_hash, file_size FROM album_items "
            "WHERE album_id = ? ORDER BY display_order";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare album items query: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(items);
        }
        sqlite3_bind_int64(stmt, 1, album_id);
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            AlbumItem item;
            item.album_id = sqlite3_column_int64(stmt, 0);
            item.path = columnText(stmt, 1);
            item.display_order = sqlite3_column_int(stmt, 2);
            item.content_hash = columnOptionalText(stmt, 3);
            item.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
            items.push_back(item);
        }
        sqlite3_finalize(stmt);
        return std::any(items); });
    return awaitValue<std::vector<AlbumItem>>(future, {}, "getAlbumItems");
}

DBOpResult SqliteCatalogStore::updateAlbumItem(const AlbumItem &item)
{
    AlbumItem captured = item;
    return runWrite([captured](SqliteCatalogStore &store)
                    {
        int changes = store.executeCounted(
            "UPDATE album_items SET file_path = ?, content_hash = ?, file_size = ? WHERE album_id = ? AND display_order = ?",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, captured.path);
                bindOptionalText(stmt, 2, captured.content_hash);
                sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(captured.size));
                sqlite3_bind_int64(stmt, 4, captured.album_id);
                sqlite3_bind_int(stmt, 5, captured.display_order);
            });
        if (changes != 1)
            return WriteOperationResult::Failure("No album item " + std::to_string(captured.album_id) + "/" +
                                                 std::to_string(captured.display_order));
        return WriteOperationResult(); });
}

std::pair<DBOpResult, int64_t> SqliteCatalogStore::insertTag(const Tag &tag)
{
    if (!open_)
        return {DBOpResult(false, "Database not initialized"), 0};
    Tag captured = tag;
    auto future = access_queue_->enqueueValueWrite([captured](SqliteCatalogStore &store)
                                                   {
        int changes = store.executeCounted(
            "INSERT INTO tags (name, description, color, parse_from_filename, ai_can_suggest) VALUES (?, ?, ?, ?, ?)",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, captured.name);
                bindText(stmt, 2, captured.description);
                bindText(stmt, 3, captured.color);
                sqlite3_bind_int(stmt, 4, captured.parse_from_filename ? 1 : 0);
                sqlite3_bind_int(stmt, 5, captured.ai_can_suggest ? 1 : 0);
            });
        if (changes != 1)
            return std::any(std::make_pair(DBOpResult(false, "Failed to insert tag: " + captured.name), int64_t{0}));
        return std::any(std::make_pair(DBOpResult(true, ""), static_cast<int64_t>(sqlite3_last_insert_rowid(store.db_)))); });
    return awaitValue<std::pair<DBOpResult, int64_t>>(future, {DBOpResult(false, "Insert failed"), 0}, "insertTag");
}

std::vector<Tag> SqliteCatalogStore::listTags()
{
    if (!open_)
        return {};
    auto future = access_queue_->enqueueRead([](SqliteCatalogStore &store)
                                             {
        std::vector<Tag> tags;
        const std::string sql =
            "SELECT id, name, description, color, parse_from_filename, ai_can_suggest FROM tags ORDER BY name COLLATE NOCASE";
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare tags query: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(tags);
        }
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            Tag tag;
            tag.id = sqlite3_column_int64(stmt, 0);
            tag.name = columnText(stmt, 1);
            tag.description = columnText(stmt, 2);
            tag.color = columnText(stmt, 3);
            tag.parse_from_filename = sqlite3_column_int(stmt, 4) != 0;
            tag.ai_can_suggest = sqlite3_column_int(stmt, 5) != 0;
            tags.push_back(tag);
        }
        sqlite3_finalize(stmt);
        return std::any(tags); });
    return awaitValue<std::vector<Tag>>(future, {}, "listTags");
}

bool SqliteCatalogStore::addMemeTagIfAbsent(int64_t media_id, int64_t tag_id)
{
    if (!open_)
        return false;
    auto future = access_queue_->enqueueValueWrite([media_id, tag_id](SqliteCatalogStore &store)
                                                   {
        int changes = store.executeCounted(
            "INSERT OR IGNORE INTO meme_tags (media_id, tag_id) VALUES (?, ?)",
            [&](sqlite3_stmt *stmt)
            {
                sqlite3_bind_int64(stmt, 1, media_id);
                sqlite3_bind_int64(stmt, 2, tag_id);
            });
        return std::any(changes == 1); });
    return awaitValue<bool>(future, false, "addMemeTagIfAbsent");
}

std::vector<int64_t> SqliteCatalogStore::getTagIdsForMedia(int64_t media_id)
{
    if (!open_)
        return {};
    auto future = access_queue_->enqueueRead([media_id](SqliteCatalogStore &store)
                                             {
        std::vector<int64_t> ids;
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, "SELECT tag_id FROM meme_tags WHERE media_id = ? ORDER BY tag_id", -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare meme_tags query: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(ids);
        }
        sqlite3_bind_int64(stmt, 1, media_id);
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            ids.push_back(sqlite3_column_int64(stmt, 0));
        }
        sqlite3_finalize(stmt);
        return std::any(ids); });
    return awaitValue<std::vector<int64_t>>(future, {}, "getTagIdsForMedia");
}

bool SqliteCatalogStore::tryAcquireWorkspace(const std::string &name, const std::string &owner,
                                             std::chrono::seconds stale_after)
{
    if (!open_)
        return false;
    int64_t now = std::chrono::duration_cast<std::chrono::seconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
    int64_t stale_before = now - stale_after.count();
    auto future = access_queue_->enqueueValueWrite([name, owner, now, stale_before](SqliteCatalogStore &store)
                                                   {
        auto begin = store.executeStatement("BEGIN IMMEDIATE TRANSACTION");
        if (!begin.success)
            return std::any(false);
        int removed = store.executeCounted(
            "DELETE FROM workspace_leases WHERE name = ? AND acquired_at < ?",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, name);
                sqlite3_bind_int64(stmt, 2, stale_before);
            });
        if (removed > 0)
            Logger::warn("Taking over stale workspace lease: " + name);
        int inserted = store.executeCounted(
            "INSERT OR IGNORE INTO workspace_leases (name, owner, acquired_at) VALUES (?, ?, ?)",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, name);
                bindText(stmt, 2, owner);
                sqlite3_bind_int64(stmt, 3, now);
            });
        if (removed < 0 || inserted < 0)
        {
            store.executeStatement("ROLLBACK");
            return std::any(false);
        }
        if (!store.executeStatement("COMMIT").success)
        {
            store.executeStatement("ROLLBACK");
            return std::any(false);
        }
        return std::any(inserted == 1); });
    return awaitValue<bool>(future, false, "tryAcquireWorkspace");
}

void SqliteCatalogStore::releaseWorkspace(const std::string &name, const std::string &owner)
{
    auto result = runWrite([name, owner](SqliteCatalogStore &store)
                           {
        int changes = store.executeCounted(
            "DELETE FROM workspace_leases WHERE name = ? AND owner = ?",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, name);
                bindText(stmt, 2, owner);
            });
        if (changes < 0)
            return WriteOperationResult::Failure("Failed to release workspace " + name);
        if (changes == 0)
            Logger::warn("Workspace lease " + name + " was not held by " + owner);
        return WriteOperationResult(); });
    if (!result.success)
        Logger::error(result.error_message);
}

DBOpResult SqliteCatalogStore::createJob(const JobRecord &job)
{
    JobRecord captured = job;
    return runWrite([captured](SqliteCatalogStore &store)
                    {
        int changes = store.executeCounted(
            "INSERT INTO jobs (job_id, kind, target, state, applied) VALUES (?, ?, ?, 'pending', 0)",
            [&](sqlite3_stmt *stmt)
            {
                bindText(stmt, 1, captured.job_id);
                bindText(stmt, 2, MediaTypes::getJobKindName(captured.kind));
                bindText(stmt, 3, captured.target);
            });
        if (changes != 1)
            return WriteOperationResult::Failure("Failed to create job " + captured.job_id);
        return WriteOperationResult(); });
}

DBOpResult SqliteCatalogStore::completeJob(const std::string &job_id, bool applied)
{
    return runWrite([job_id, applied](SqliteCatalogStore &store)
                    {
        int changes = store.executeCounted(
            "UPDATE jobs SET state = 'completed', applied = ?, completed_at = CURRENT_TIMESTAMP WHERE job_id = ?",
            [&](sqlite3_stmt *stmt)
            {
                sqlite3_bind_int(stmt, 1, applied ? 1 : 0);
                bindText(stmt, 2, job_id);
            });
        if (changes != 1)
            return WriteOperationResult::Failure("Unknown job " + job_id);
        return WriteOperationResult(); });
}

std::optional<JobRecord> SqliteCatalogStore::getJob(const std::string &job_id)
{
    if (!open_)
        return std::nullopt;
    auto future = access_queue_->enqueueRead([job_id](SqliteCatalogStore &store)
                                             {
        std::optional<JobRecord> job;
        sqlite3_stmt *stmt = nullptr;
        const std::string sql =
            "SELECT job_id, kind, target, state, applied, started_at, completed_at FROM jobs WHERE job_id = ?";
        if (sqlite3_prepare_v2(store.db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare job query: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(job);
        }
        bindText(stmt, 1, job_id);
        if (sqlite3_step(stmt) == SQLITE_ROW)
        {
            JobRecord record;
            record.job_id = columnText(stmt, 0);
            record.kind = MediaTypes::jobKindFromString(columnText(stmt, 1));
            record.target = columnText(stmt, 2);
            record.state = columnText(stmt, 3) == "completed" ? JobState::COMPLETED : JobState::PENDING;
            record.applied = sqlite3_column_int(stmt, 4) != 0;
            record.started_at = columnText(stmt, 5);
            record.completed_at = columnText(stmt, 6);
            job = record;
        }
        sqlite3_finalize(stmt);
        return std::any(job); });
    return awaitValue<std::optional<JobRecord>>(future, std::nullopt, "getJob");
}

std::map<MediaStatus, int> SqliteCatalogStore::countByStatus()
{
    if (!open_)
        return {};
    auto future = access_queue_->enqueueRead([](SqliteCatalogStore &store)
                                             {
        std::map<MediaStatus, int> counts;
        sqlite3_stmt *stmt = nullptr;
        if (sqlite3_prepare_v2(store.db_, "SELECT status, COUNT(*) FROM media GROUP BY status", -1, &stmt, nullptr) != SQLITE_OK)
        {
            Logger::error("Failed to prepare stats query: " + std::string(sqlite3_errmsg(store.db_)));
            return std::any(counts);
        }
        while (sqlite3_step(stmt) == SQLITE_ROW)
        {
            auto status = MediaTypes::statusFromString(columnText(stmt, 0));
            if (status)
                counts[*status] = sqlite3_column_int(stmt, 1);
        }
        sqlite3_finalize(stmt);
        return std::any(counts); });
    return awaitValue<std::map<MediaStatus, int>>(future, {}, "countByStatus");
}
