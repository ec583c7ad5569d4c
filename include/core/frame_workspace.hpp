#pragma once

#include "core/file_utils.hpp"
#include "core/pipeline_settings.hpp"
#include "database/catalog_store.hpp"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Exclusive temporary directory for the sampled frames of one record.
 *
 * Holding an instance means holding the catalog lease "record-<id>". The
 * directory and the lease are released when the instance is destroyed, on
 * every exit path.
 */
class FrameWorkspace
{
public:
    static constexpr std::chrono::seconds DEFAULT_STALE_AFTER{3600};

    /**
     * @brief Reserve the workspace of a record
     * @return nullptr if another worker holds it or the directory cannot be created
     */
    static std::unique_ptr<FrameWorkspace> acquire(CatalogStore &store, const PipelineSettings &settings,
                                                   int64_t record_id,
                                                   std::chrono::seconds stale_after = DEFAULT_STALE_AFTER);

    static std::string leaseName(int64_t record_id);

    ~FrameWorkspace();

    FrameWorkspace(const FrameWorkspace &) = delete;
    FrameWorkspace &operator=(const FrameWorkspace &) = delete;

    const fs::path &directory() const { return directory_; }
    int64_t recordId() const { return record_id_; }

    /**
     * @brief Encode a frame as JPEG and store it under the SHA-256 of the encoded bytes
     * @return Path of the stored frame, nullopt if encoding or writing failed
     */
    std::optional<std::string> writeFrame(const cv::Mat &frame, int jpeg_quality);

private:
    FrameWorkspace(CatalogStore &store, int64_t record_id, std::string owner, fs::path directory);

    CatalogStore &store_;
    int64_t record_id_;
    std::string owner_;
    fs::path directory_;
};
