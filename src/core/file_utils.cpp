#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

SimpleObservable<std::string> FileUtils::listFilesAsObservable(const std::string &dir_path, bool recursive,
                                                               DirectoryFilter skip_dir)
{
    using Observer = std::function<void(const std::string &)>;
    using ErrorHandler = std::function<void(const std::exception &)>;
    using CompleteHandler = std::function<void()>;
    return SimpleObservable<std::string>(
        std::function<void(Observer, ErrorHandler, CompleteHandler)>(
            [dir_path, recursive, skip_dir](Observer onNext, ErrorHandler onError, CompleteHandler onComplete)
            {
                try
                {
                    if (!isValidDirectory(dir_path))
                    {
                        std::string msg = "Invalid directory path: " + dir_path;
                        Logger::warn(msg);
                        if (onError)
                        {
                            onError(std::runtime_error(msg));
                        }
                        return;
                    }
                    if (recursive)
                    {
                        walkFiles(
                            dir_path,
                            [&onNext](const std::string &file_path)
                            {
                                onNext(file_path);
                                return true;
                            },
                            skip_dir);
                    }
                    else
                    {
                        for (const auto &entry : fs::directory_iterator(dir_path))
                        {
                            if (entry.is_regular_file())
                            {
                                onNext(entry.path().string());
                            }
                        }
                    }
                    if (onComplete)
                    {
                        onComplete();
                    }
                }
                catch (const std::exception &e)
                {
                    std::string msg = "Error listing files in directory: " + dir_path + ": " + e.what();
                    Logger::warn(msg);
                    if (onError)
                    {
                        onError(std::runtime_error(msg));
                    }
                }
            }));
}

bool FileUtils::walkFiles(const std::string &dir_path, const FileVisitor &visitor, DirectoryFilter skip_dir)
{
    std::function<bool(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        if (!visitor(entry.path().string()))
                        {
                            return false;
                        }
                    }
                    else if (entry.is_directory())
                    {
                        if (skip_dir && skip_dir(entry.path()))
                        {
                            Logger::trace("Skipping reserved directory: " + entry.path().string());
                            continue;
                        }
                        if (!scanDirectory(entry.path()))
                        {
                            return false;
                        }
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to filesystem error: " + entry.path().string() + " - " + e.what());
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
        return true;
    };
    return scanDirectory(fs::path(dir_path));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::is_directory(fs::path(path), ec);
}

bool FileUtils::isRegularFile(const std::string &path)
{
    std::error_code ec;
    return fs::is_regular_file(fs::path(path), ec);
}

std::optional<uint64_t> FileUtils::getFileSize(const std::string &path)
{
    std::error_code ec;
    auto size = fs::file_size(fs::path(path), ec);
    if (ec)
    {
        return std::nullopt;
    }
    return static_cast<uint64_t>(size);
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string extension = fs::path(file_path).extension().string();
    if (extension.empty())
    {
        return "";
    }
    return toLower(extension.substr(1));
}

std::string FileUtils::toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string FileUtils::trim(const std::string &value)
{
    auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c)
                                  { return std::isspace(c); });
    auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c)
                                { return std::isspace(c); })
                   .base();
    if (begin >= end)
    {
        return "";
    }
    return std::string(begin, end);
}

bool FileUtils::naturalLess(const std::string &a, const std::string &b)
{
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size())
    {
        bool a_digit = std::isdigit(static_cast<unsigned char>(a[i])) != 0;
        bool b_digit = std::isdigit(static_cast<unsigned char>(b[j])) != 0;
        if (a_digit && b_digit)
        {
            size_t a_end = i;
            while (a_end < a.size() && std::isdigit(static_cast<unsigned char>(a[a_end])))
                ++a_end;
            size_t b_end = j;
            while (b_end < b.size() && std::isdigit(static_cast<unsigned char>(b[b_end])))
                ++b_end;

            size_t a_start = i;
            while (a_start + 1 < a_end && a[a_start] == '0')
                ++a_start;
            size_t b_start = j;
            while (b_start + 1 < b_end && b[b_start] == '0')
                ++b_start;

            size_t a_len = a_end - a_start;
            size_t b_len = b_end - b_start;
            if (a_len != b_len)
                return a_len < b_len;
            int cmp = a.compare(a_start, a_len, b, b_start, b_len);
            if (cmp != 0)
                return cmp < 0;
            i = a_end;
            j = b_end;
            continue;
        }
        if (a[i] != b[j])
            return static_cast<unsigned char>(a[i]) < static_cast<unsigned char>(b[j]);
        ++i;
        ++j;
    }
    if ((a.size() - i) != (b.size() - j))
        return (a.size() - i) < (b.size() - j);
    // "01" and "1" are equal by value; byte order breaks the tie
    return a < b;
}

std::string FileUtils::relativePath(const std::string &path, const std::string &root)
{
    fs::path p = fs::path(path).lexically_normal();
    fs::path r = fs::path(root).lexically_normal();
    if (!isWithin(p, r))
    {
        return p.string();
    }
    return p.lexically_relative(r).string();
}

bool FileUtils::isWithin(const fs::path &path, const fs::path &root)
{
    auto p = path.lexically_normal();
    auto r = root.lexically_normal();
    // a trailing separator leaves an empty final element
    if (!r.empty() && r.filename().empty())
    {
        r = r.parent_path();
    }
    auto mismatch = std::mismatch(r.begin(), r.end(), p.begin(), p.end());
    return mismatch.first == r.end();
}
