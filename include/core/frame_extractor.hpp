#pragma once

#include "core/external_library_wrappers.hpp"
#include "core/file_utils.hpp"
#include "core/frame_workspace.hpp"
#include "core/media_types.hpp"
#include "core/pipeline_settings.hpp"
#include "core/processing_result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct ExtractionResult
{
    ProcessingResult status;
    std::vector<std::string> sample_paths;   // files handed to the AI capability, in order
    std::vector<int64_t> frame_indices;      // decoded frame indices behind sample_paths (gif/video)
    std::optional<std::string> thumbnail_path;
    std::optional<std::string> preview_path;
};

/**
 * @brief Turns a media record into the ordered still images sent for analysis.
 *
 * Static images and album items pass through unchanged. GIF and video frames
 * are decoded with FFmpeg and written as JPEGs into the record's workspace.
 * Video additionally keeps a thumbnail and a short preview loop under the
 * thumbnails directory; both are written only when missing.
 */
class FrameExtractor
{
public:
    explicit FrameExtractor(const PipelineSettings &settings);

    ExtractionResult extract(const MediaKind &kind, FrameWorkspace &workspace, const DecodeDeadline &deadline) const;

    ExtractionResult extractImage(const ImageMedia &media) const;
    ExtractionResult extractGif(const GifMedia &media, FrameWorkspace &workspace, const DecodeDeadline &deadline) const;
    ExtractionResult extractVideo(const VideoMedia &media, FrameWorkspace &workspace, const DecodeDeadline &deadline) const;
    ExtractionResult extractAlbum(const AlbumMedia &media) const;

    /**
     * @brief Indices floor(i * frame_count / max_frames) for i in [0, max_frames),
     * or every index when frame_count <= max_frames
     */
    static std::vector<int64_t> evenlySpacedIndices(int64_t frame_count, int max_frames);

    fs::path thumbnailPath(int64_t record_id) const;
    fs::path previewPath(int64_t record_id) const;

private:
    bool writeThumbnail(const cv::Mat &frame, const fs::path &target) const;
    bool writePreview(const std::vector<cv::Mat> &frames, const fs::path &target) const;
    cv::Mat scaleToMaxWidth(const cv::Mat &frame) const;

    PipelineSettings settings_;
};
