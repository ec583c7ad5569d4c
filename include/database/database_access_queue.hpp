#pragma once

#include <any>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <queue>
#include <string>
#include <thread>
#include <utility>
#include <variant>

class SqliteCatalogStore;

struct WriteOperationResult
{
    bool success;
    std::string error_message;

    WriteOperationResult(bool s = true, const std::string &msg = "")
        : success(s), error_message(msg) {}

    static WriteOperationResult Failure(const std::string &msg = "")
    {
        return WriteOperationResult(false, msg);
    }
};

using WriteOperation = std::function<WriteOperationResult(SqliteCatalogStore &)>;
using ReadOperation = std::function<std::any(SqliteCatalogStore &)>;
// A mutating operation that hands back a value (inserted row id, affected row count)
using ValueWriteOperation = std::function<std::any(SqliteCatalogStore &)>;

/**
 * @brief Serializes every statement against the catalog connection on one thread.
 *
 * The sqlite3 handle is opened, used and closed only from the access thread.
 */
class DatabaseAccessQueue
{
public:
    /**
     * @brief Constructor
     * @param store Store whose connection the queued operations use
     */
    explicit DatabaseAccessQueue(SqliteCatalogStore &store);
    ~DatabaseAccessQueue();

    std::future<WriteOperationResult> enqueueWrite(WriteOperation operation);
    std::future<std::any> enqueueRead(ReadOperation operation);
    std::future<std::any> enqueueValueWrite(ValueWriteOperation operation);

    // Wait for all pending operations to complete
    void wait_for_completion(std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    // Stop the access queue; already queued operations still run
    void stop();

private:
    using QueuedWrite = std::pair<WriteOperation, std::promise<WriteOperationResult>>;
    struct QueuedValue
    {
        std::function<std::any(SqliteCatalogStore &)> operation;
        std::promise<std::any> promise;
        bool is_write;
    };

    std::future<std::any> enqueueValue(std::function<std::any(SqliteCatalogStore &)> operation, bool is_write);
    void access_thread_worker();

    SqliteCatalogStore &store_;
    std::queue<std::variant<QueuedWrite, QueuedValue>> operation_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::thread access_thread_;
    std::atomic<bool> should_stop_;
    std::atomic<size_t> in_flight_;
};
