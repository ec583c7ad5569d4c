#pragma once

#include "core/file_utils.hpp"
#include "core/pipeline_settings.hpp"
#include "database/catalog_store.hpp"
#include <optional>
#include <string>
#include <vector>

struct ScanSummary
{
    int added = 0;      // new non-duplicate records (albums included)
    int duplicates = 0; // duplicate audit records created
    int skipped = 0;    // unsupported or reserved files
    int failed = 0;     // catalog writes that did not go through
};

/**
 * @brief Registers files under the media root that the catalog has not seen.
 *
 * The reserved system subtree and artifact suffixes are never catalogued.
 * Every top-level folder of the albums location becomes one album record;
 * its images are the items, ordered by file name.
 */
class DirectoryScanner
{
public:
    DirectoryScanner(CatalogStore &store, const PipelineSettings &settings);

    ScanSummary scan();

    // Media type by extension, nullopt for unsupported files
    std::optional<MediaType> classify(const std::string &file_path) const;
    bool isReservedFile(const std::string &file_path) const;

    // Image files of an album folder, sorted by name
    std::vector<std::string> listAlbumImages(const std::string &folder) const;

private:
    bool isReservedDirectory(const fs::path &dir) const;
    bool isAlbumFolder(const fs::path &dir) const;
    void registerFile(const std::string &file_path, MediaType type, ScanSummary &summary);
    void registerAlbum(const std::string &folder, ScanSummary &summary);

    CatalogStore &store_;
    PipelineSettings settings_;
};
