#include "database/database_access_queue.hpp"
#include "database/sqlite_catalog_store.hpp"
#include "logging/logger.hpp"
#include <stdexcept>

DatabaseAccessQueue::DatabaseAccessQueue(SqliteCatalogStore &store)
    : store_(store), should_stop_(false), in_flight_(0)
{
    access_thread_ = std::thread(&DatabaseAccessQueue::access_thread_worker, this);
}

DatabaseAccessQueue::~DatabaseAccessQueue()
{
    stop();
    if (access_thread_.joinable())
    {
        access_thread_.join();
    }
}

std::future<WriteOperationResult> DatabaseAccessQueue::enqueueWrite(WriteOperation operation)
{
    std::promise<WriteOperationResult> promise;
    std::future<WriteOperationResult> future = promise.get_future();
    if (should_stop_)
    {
        promise.set_value(WriteOperationResult::Failure("Database access queue is stopped"));
        return future;
    }
    in_flight_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(std::make_pair(std::move(operation), std::move(promise)));
    }
    queue_cv_.notify_one();
    return future;
}

std::future<std::any> DatabaseAccessQueue::enqueueRead(ReadOperation operation)
{
    return enqueueValue(std::move(operation), false);
}

std::future<std::any> DatabaseAccessQueue::enqueueValueWrite(ValueWriteOperation operation)
{
    return enqueueValue(std::move(operation), true);
}

std::future<std::any> DatabaseAccessQueue::enqueueValue(std::function<std::any(SqliteCatalogStore &)> operation, bool is_write)
{
    std::promise<std::any> promise;
    std::future<std::any> future = promise.get_future();
    if (should_stop_)
    {
        promise.set_exception(std::make_exception_ptr(std::runtime_error("Database access queue is stopped")));
        return future;
    }
    in_flight_.fetch_add(1);
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        operation_queue_.push(QueuedValue{std::move(operation), std::move(promise), is_write});
    }
    queue_cv_.notify_one();
    return future;
}

void DatabaseAccessQueue::wait_for_completion(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(queue_mutex_);
    bool drained = queue_cv_.wait_for(lock, timeout, [this]
                                      { return operation_queue_.empty() && in_flight_.load() == 0; });
    if (!drained)
    {
        Logger::warn("Database access queue wait_for_completion timed out after " +
                     std::to_string(timeout.count()) + "ms - continuing to wait for operations to complete");
        queue_cv_.wait(lock, [this]
                       { return operation_queue_.empty() && in_flight_.load() == 0; });
    }
}

void DatabaseAccessQueue::stop()
{
    should_stop_ = true;
    queue_cv_.notify_all();
}

void DatabaseAccessQueue::access_thread_worker()
{
    while (true)
    {
        std::variant<QueuedWrite, QueuedValue> operation;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]
                           { return !operation_queue_.empty() || should_stop_; });

            if (should_stop_ && operation_queue_.empty())
            {
                break;
            }
            operation = std::move(operation_queue_.front());
            operation_queue_.pop();
        }

        if (std::holds_alternative<QueuedWrite>(operation))
        {
            auto [write_op, promise] = std::get<QueuedWrite>(std::move(operation));
            try
            {
                promise.set_value(write_op(store_));
            }
            catch (const std::exception &e)
            {
                Logger::error("Database write operation failed: " + std::string(e.what()));
                promise.set_value(WriteOperationResult::Failure(e.what()));
            }
        }
        else
        {
            QueuedValue queued = std::get<QueuedValue>(std::move(operation));
            try
            {
                queued.promise.set_value(queued.operation(store_));
            }
            catch (const std::exception &e)
            {
                Logger::error(std::string(queued.is_write ? "Database write" : "Database read") +
                              " operation failed: " + e.what());
                queued.promise.set_exception(std::current_exception());
            }
        }

        in_flight_.fetch_sub(1);
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            queue_cv_.notify_all();
        }
    }
}
