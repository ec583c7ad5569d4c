#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace fs = std::filesystem;

// Simple custom observable implementation
template <typename T>
class SimpleObservable
{
public:
    using Observer = std::function<void(const T &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;

    SimpleObservable(std::function<void(Observer, ErrorHandler, CompleteHandler)> source)
        : source_(std::move(source)) {}

    void subscribe(Observer onNext, ErrorHandler onError = nullptr, CompleteHandler onComplete = nullptr)
    {
        if (source_)
        {
            source_(onNext, onError, onComplete);
        }
    }

    void subscribe(Observer onNext, CompleteHandler onComplete)
    {
        subscribe(onNext, nullptr, onComplete);
    }

private:
    std::function<void(Observer, ErrorHandler, CompleteHandler)> source_;
};

/**
 * @brief Filesystem helpers shared by the scanner and the identity verifier
 */
class FileUtils
{
public:
    // Returns true for directories whose whole subtree must not be visited
    using DirectoryFilter = std::function<bool(const fs::path &)>;

    // Returns false to stop the walk
    using FileVisitor = std::function<bool(const std::string &)>;

    /**
     * Lists all files in a directory as a simple observable stream
     * @param dir_path Directory path to scan
     * @param recursive Whether to scan recursively
     * @param skip_dir Optional filter for subtrees to leave out
     * @return SimpleObservable that emits file paths
     */
    static SimpleObservable<std::string> listFilesAsObservable(const std::string &dir_path, bool recursive = false,
                                                               DirectoryFilter skip_dir = nullptr);

    /**
     * Walks a directory tree depth-first and calls the visitor for each regular file.
     * Permission errors on single entries are logged and skipped.
     * @return false if the visitor stopped the walk early
     */
    static bool walkFiles(const std::string &dir_path, const FileVisitor &visitor, DirectoryFilter skip_dir = nullptr);

    static bool isValidDirectory(const std::string &path);
    static bool isRegularFile(const std::string &path);
    static std::optional<uint64_t> getFileSize(const std::string &path);

    // Lower-cased extension without the dot, empty if none
    static std::string getFileExtension(const std::string &file_path);

    static std::string toLower(std::string value);
    static std::string trim(const std::string &value);

    // Orders names with digit runs compared by value, so "2.jpg" sorts before "10.jpg"
    static bool naturalLess(const std::string &a, const std::string &b);

    // Path of `path` relative to `root`; `path` itself if it lies outside `root`
    static std::string relativePath(const std::string &path, const std::string &root);

    static bool isWithin(const fs::path &path, const fs::path &root);
};
