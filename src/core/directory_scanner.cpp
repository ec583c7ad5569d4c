#include "core/directory_scanner.hpp"
#include "core/content_hasher.hpp"
#include "core/pipeline_errors.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace
{
    bool contains(const std::vector<std::string> &values, const std::string &value)
    {
        return std::find(values.begin(), values.end(), value) != values.end();
    }

    bool endsWith(const std::string &value, const std::string &suffix)
    {
        return value.size() >= suffix.size() &&
               value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
    }
}

DirectoryScanner::DirectoryScanner(CatalogStore &store, const PipelineSettings &settings)
    : store_(store), settings_(settings)
{
}

ScanSummary DirectoryScanner::scan()
{
    ScanSummary summary;
    const fs::path root = settings_.getMediaRoot();
    if (!FileUtils::isValidDirectory(root.string()))
    {
        Logger::error("Media root is not a directory: " + root.string());
        return summary;
    }
    Logger::info("Scanning media root: " + root.string());

    std::vector<std::string> files;
    FileUtils::walkFiles(
        root.string(),
        [&files](const std::string &file_path)
        {
            files.push_back(file_path);
            return true;
        },
        [this](const fs::path &dir)
        { return isReservedDirectory(dir) || isAlbumFolder(dir); });
    std::sort(files.begin(), files.end());

    for (const auto &file_path : files)
    {
        if (isReservedFile(file_path))
        {
            summary.skipped++;
            continue;
        }
        auto type = classify(file_path);
        if (!type)
        {
            Logger::trace("Unsupported file type, skipping: " + file_path);
            summary.skipped++;
            continue;
        }
        registerFile(file_path, *type, summary);
    }

    const fs::path albums_root = settings_.getAlbumsRoot();
    if (FileUtils::isValidDirectory(albums_root.string()))
    {
        std::vector<std::string> folders;
        std::error_code ec;
        for (const auto &entry : fs::directory_iterator(albums_root, ec))
        {
            if (entry.is_directory(ec))
                folders.push_back(entry.path().string());
        }
        if (ec)
        {
            Logger::warn("Error listing albums in " + albums_root.string() + ": " + ec.message());
        }
        std::sort(folders.begin(), folders.end());
        for (const auto &folder : folders)
        {
            registerAlbum(folder, summary);
        }
    }

    Logger::info("Scan complete: added=" + std::to_string(summary.added) +
                 " duplicates=" + std::to_string(summary.duplicates) +
                 " skipped=" + std::to_string(summary.skipped) +
                 " failed=" + std::to_string(summary.failed));
    return summary;
}

std::optional<MediaType> DirectoryScanner::classify(const std::string &file_path) const
{
    std::string ext = FileUtils::getFileExtension(file_path);
    if (ext.empty())
        return std::nullopt;
    if (contains(settings_.gif_extensions, ext))
        return MediaType::GIF;
    if (contains(settings_.image_extensions, ext))
        return MediaType::IMAGE;
    if (contains(settings_.video_extensions, ext))
        return MediaType::VIDEO;
    return std::nullopt;
}

bool DirectoryScanner::isReservedFile(const std::string &file_path) const
{
    std::string name = FileUtils::toLower(fs::path(file_path).filename().string());
    for (const auto &suffix : settings_.reserved_suffixes)
    {
        if (endsWith(name, FileUtils::toLower(suffix)))
            return true;
    }
    return FileUtils::isWithin(fs::path(file_path), settings_.getSystemRoot());
}

std::vector<std::string> DirectoryScanner::listAlbumImages(const std::string &folder) const
{
    std::vector<std::string> images;
    FileUtils::listFilesAsObservable(folder, false)
        .subscribe(
            [this, &images](const std::string &path)
            {
                if (!isReservedFile(path) && classify(path) == MediaType::IMAGE)
                    images.push_back(path);
            },
            [&folder](const std::exception &e)
            { Logger::warn("Album folder " + folder + " not listed: " + e.what()); });
    std::sort(images.begin(), images.end(), [](const std::string &a, const std::string &b)
              { return FileUtils::naturalLess(fs::path(a).filename().string(), fs::path(b).filename().string()); });
    return images;
}

bool DirectoryScanner::isReservedDirectory(const fs::path &dir) const
{
    return dir.lexically_normal() == settings_.getSystemRoot().lexically_normal();
}

bool DirectoryScanner::isAlbumFolder(const fs::path &dir) const
{
    return dir.lexically_normal().parent_path() == settings_.getAlbumsRoot().lexically_normal();
}

void DirectoryScanner::registerFile(const std::string &file_path, MediaType type, ScanSummary &summary)
{
    if (store_.isPathCatalogued(file_path))
        return;

    MediaRecord record;
    record.path = file_path;
    record.media_type = type;
    record.status = MediaStatus::NEW;
    record.size = FileUtils::getFileSize(file_path).value_or(0);
    record.content_hash = ContentHasher::hash(file_path);

    if (!record.content_hash)
    {
        Logger::warn("Content hash unavailable, registering without identity: " + file_path);
    }
    else if (auto original = store_.findOriginalByContentHash(*record.content_hash))
    {
        record.status = MediaStatus::ERROR;
        record.duplicate_of = original->id;
        record.error_message = PipelineErrors::format(
            PipelineErrorKind::DUPLICATE,
            "duplicate of record #" + std::to_string(original->id) + " (" + original->path + ")");
    }

    auto [result, id] = store_.insertMedia(record);
    if (!result.success)
    {
        Logger::error("Failed to register " + file_path + ": " + result.error_message);
        summary.failed++;
        return;
    }
    if (record.duplicate_of)
    {
        Logger::warn("Duplicate content: " + file_path + " (#" + std::to_string(id) + ") duplicates #" +
                     std::to_string(*record.duplicate_of));
        summary.duplicates++;
        return;
    }
    Logger::info("Added " + MediaTypes::getTypeName(type) + " #" + std::to_string(id) + ": " + file_path);
    summary.added++;
}

void DirectoryScanner::registerAlbum(const std::string &folder, ScanSummary &summary)
{
    if (store_.findMediaByPath(folder))
        return;

    auto images = listAlbumImages(folder);
    if (images.empty())
    {
        Logger::debug("Album folder has no images yet, skipping: " + folder);
        return;
    }

    MediaRecord album;
    album.path = folder;
    album.media_type = MediaType::ALBUM;
    album.status = MediaStatus::NEW;
    album.title = fs::path(folder).filename().string();

    std::vector<AlbumItem> items;
    int order = 1;
    for (const auto &image : images)
    {
        AlbumItem item;
        item.path = image;
        item.display_order = order++;
        item.size = FileUtils::getFileSize(image).value_or(0);
        item.content_hash = ContentHasher::hash(image);
        album.size += item.size;
        items.push_back(item);
    }

    auto [result, id] = store_.insertAlbum(album, items);
    if (!result.success)
    {
        Logger::error("Failed to register album " + folder + ": " + result.error_message);
        summary.failed++;
        return;
    }
    Logger::info("Added album #" + std::to_string(id) + " with " + std::to_string(items.size()) + " items: " + folder);
    summary.added++;
}
