#include "core/frame_extractor.hpp"
#include "core/decoder/media_decoder.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <set>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>

namespace
{
    // Tolerance for comparing frame timestamps against the sampling grid
    constexpr double TIMESTAMP_EPSILON = 1e-6;

    struct ExtractVisitor
    {
        const FrameExtractor &extractor;
        FrameWorkspace &workspace;
        const DecodeDeadline &deadline;

        ExtractionResult operator()(const ImageMedia &media) const { return extractor.extractImage(media); }
        ExtractionResult operator()(const GifMedia &media) const { return extractor.extractGif(media, workspace, deadline); }
        ExtractionResult operator()(const VideoMedia &media) const { return extractor.extractVideo(media, workspace, deadline); }
        ExtractionResult operator()(const AlbumMedia &media) const { return extractor.extractAlbum(media); }
    };

    ExtractionResult extractionFailure(PipelineErrorKind kind, const std::string &message)
    {
        ExtractionResult result;
        result.status = ProcessingResult::Failure(kind, message);
        return result;
    }

    ExtractionResult extractionFailure(const ProcessingResult &status)
    {
        ExtractionResult result;
        result.status = status;
        return result;
    }
}

FrameExtractor::FrameExtractor(const PipelineSettings &settings)
    : settings_(settings)
{
}

ExtractionResult FrameExtractor::extract(const MediaKind &kind, FrameWorkspace &workspace, const DecodeDeadline &deadline) const
{
    return std::visit(ExtractVisitor{*this, workspace, deadline}, kind);
}

std::vector<int64_t> FrameExtractor::evenlySpacedIndices(int64_t frame_count, int max_frames)
{
    std::vector<int64_t> indices;
    if (frame_count <= 0 || max_frames <= 0)
        return indices;
    if (frame_count <= max_frames)
    {
        for (int64_t i = 0; i < frame_count; ++i)
            indices.push_back(i);
        return indices;
    }
    for (int64_t i = 0; i < max_frames; ++i)
        indices.push_back(i * frame_count / max_frames);
    return indices;
}

fs::path FrameExtractor::thumbnailPath(int64_t record_id) const
{
    return settings_.getThumbnailsRoot() / (std::to_string(record_id) + "_thumb.jpg");
}

fs::path FrameExtractor::previewPath(int64_t record_id) const
{
    return settings_.getThumbnailsRoot() / (std::to_string(record_id) + "_preview.mp4");
}

ExtractionResult FrameExtractor::extractImage(const ImageMedia &media) const
{
    if (!FileUtils::isRegularFile(media.path))
    {
        return extractionFailure(PipelineErrorKind::EXTRACTION, "image file missing: " + media.path);
    }
    ExtractionResult result;
    result.status = ProcessingResult(true);
    result.sample_paths.push_back(media.path);
    return result;
}

ExtractionResult FrameExtractor::extractAlbum(const AlbumMedia &media) const
{
    if (media.items.empty())
    {
        return extractionFailure(PipelineErrorKind::EXTRACTION, "album has no items: " + media.folder);
    }
    ExtractionResult result;
    for (const auto &item : media.items)
    {
        if (!FileUtils::isRegularFile(item.path))
        {
            return extractionFailure(PipelineErrorKind::EXTRACTION,
                                     "album item " + std::to_string(item.display_order) + " unreachable: " + item.path);
        }
        result.sample_paths.push_back(item.path);
    }
    result.status = ProcessingResult(true);
    return result;
}

ExtractionResult FrameExtractor::extractGif(const GifMedia &media, FrameWorkspace &workspace, const DecodeDeadline &deadline) const
{
    if (!FileUtils::isRegularFile(media.path))
    {
        return extractionFailure(PipelineErrorKind::EXTRACTION, "gif file missing: " + media.path);
    }

    int64_t frame_count = 0;
    {
        MediaDecoder counter(deadline);
        auto status = counter.open(media.path);
        if (!status.success)
            return extractionFailure(status);
        status = counter.countFrames(frame_count);
        if (!status.success)
            return extractionFailure(status);
    }
    if (frame_count == 0)
    {
        return extractionFailure(PipelineErrorKind::EXTRACTION, "gif has no frames: " + media.path);
    }

    auto indices = evenlySpacedIndices(frame_count, settings_.gif_max_frames);
    std::set<int64_t> wanted(indices.begin(), indices.end());
    const int64_t last_wanted = indices.back();
    Logger::debug("GIF " + media.path + ": " + std::to_string(frame_count) + " frames, sampling " +
                  std::to_string(indices.size()));

    ExtractionResult result;
    bool write_failed = false;
    MediaDecoder decoder(deadline);
    auto status = decoder.open(media.path);
    if (!status.success)
        return extractionFailure(status);
    status = decoder.decode(
        [&wanted](int64_t index, double)
        { return wanted.count(index) > 0; },
        [&](int64_t index, double, const cv::Mat &bgr)
        {
            auto path = workspace.writeFrame(bgr, settings_.jpeg_quality);
            if (!path)
            {
                write_failed = true;
                return false;
            }
            result.sample_paths.push_back(*path);
            result.frame_indices.push_back(index);
            return index < last_wanted;
        });
    if (!status.success)
        return extractionFailure(status);
    if (write_failed)
        return extractionFailure(PipelineErrorKind::EXTRACTION, "could not store sampled frame for " + media.path);
    if (result.sample_paths.size() < indices.size())
    {
        Logger::warn("GIF " + media.path + " decoded fewer frames than demuxed; sampled " +
                     std::to_string(result.sample_paths.size()) + " of " + std::to_string(indices.size()));
    }
    result.status = ProcessingResult(true);
    return result;
}

ExtractionResult FrameExtractor::extractVideo(const VideoMedia &media, FrameWorkspace &workspace, const DecodeDeadline &deadline) const
{
    if (!FileUtils::isRegularFile(media.path))
    {
        return extractionFailure(PipelineErrorKind::EXTRACTION, "video file missing: " + media.path);
    }

    MediaDecoder decoder(deadline);
    auto status = decoder.open(media.path);
    if (!status.success)
        return extractionFailure(status);

    const fs::path thumb_path = thumbnailPath(media.record_id);
    const fs::path preview_path = previewPath(media.record_id);
    const bool want_thumbnail = !FileUtils::isRegularFile(thumb_path.string());
    const bool want_preview = !FileUtils::isRegularFile(preview_path.string());

    const double sample_interval = 1.0 / settings_.video_fps;
    const double preview_interval = 1.0 / settings_.preview_fps;
    double next_sample = 0.0;
    double next_preview = 0.0;
    int sampled = 0;
    bool write_failed = false;
    cv::Mat first_sample;
    std::vector<cv::Mat> preview_frames;
    ExtractionResult result;

    auto sampleDue = [&](double ts)
    { return sampled < settings_.video_max_frames && ts + TIMESTAMP_EPSILON >= next_sample; };
    auto previewDue = [&](double ts)
    { return want_preview && ts < settings_.preview_seconds && ts + TIMESTAMP_EPSILON >= next_preview; };

    status = decoder.decode(
        [&](int64_t, double ts)
        { return sampleDue(ts) || previewDue(ts); },
        [&](int64_t index, double ts, const cv::Mat &bgr)
        {
            if (sampleDue(ts))
            {
                auto path = workspace.writeFrame(bgr, settings_.jpeg_quality);
                if (!path)
                {
                    write_failed = true;
                    return false;
                }
                if (first_sample.empty())
                    first_sample = bgr.clone();
                result.sample_paths.push_back(*path);
                result.frame_indices.push_back(index);
                sampled++;
                while (next_sample <= ts + TIMESTAMP_EPSILON)
                    next_sample += sample_interval;
            }
            if (previewDue(ts))
            {
                preview_frames.push_back(scaleToMaxWidth(bgr));
                while (next_preview <= ts + TIMESTAMP_EPSILON)
                    next_preview += preview_interval;
            }
            bool need_samples = sampled < settings_.video_max_frames;
            bool need_preview = want_preview && ts < settings_.preview_seconds;
            return need_samples || need_preview;
        });
    if (!status.success)
        return extractionFailure(status);
    if (write_failed)
        return extractionFailure(PipelineErrorKind::EXTRACTION, "could not store sampled frame for " + media.path);
    if (result.sample_paths.empty())
        return extractionFailure(PipelineErrorKind::EXTRACTION, "no frames sampled from " + media.path);

    if (want_thumbnail && writeThumbnail(first_sample, thumb_path))
        result.thumbnail_path = thumb_path.string();
    else if (!want_thumbnail)
        result.thumbnail_path = thumb_path.string();

    if (want_preview && !preview_frames.empty() && writePreview(preview_frames, preview_path))
        result.preview_path = preview_path.string();
    else if (!want_preview)
        result.preview_path = preview_path.string();

    Logger::debug("Video " + media.path + ": sampled " + std::to_string(sampled) + " frames, preview " +
                  std::to_string(preview_frames.size()) + " frames");
    result.status = ProcessingResult(true);
    return result;
}

cv::Mat FrameExtractor::scaleToMaxWidth(const cv::Mat &frame) const
{
    if (frame.cols <= settings_.thumbnail_max_width || settings_.thumbnail_max_width <= 0)
        return frame.clone();
    double scale = static_cast<double>(settings_.thumbnail_max_width) / frame.cols;
    int height = std::max(1, static_cast<int>(frame.rows * scale + 0.5));
    cv::Mat scaled;
    cv::resize(frame, scaled, cv::Size(settings_.thumbnail_max_width, height), 0, 0, cv::INTER_AREA);
    return scaled;
}

bool FrameExtractor::writeThumbnail(const cv::Mat &frame, const fs::path &target) const
{
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
    {
        Logger::warn("Could not create thumbnails directory " + target.parent_path().string() + ": " + ec.message());
        return false;
    }
    fs::path partial = target.parent_path() / (target.stem().string() + ".partial.jpg");
    try
    {
        if (!cv::imwrite(partial.string(), scaleToMaxWidth(frame), {cv::IMWRITE_JPEG_QUALITY, settings_.jpeg_quality}))
        {
            Logger::warn("Could not write thumbnail " + target.string());
            return false;
        }
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Could not write thumbnail " + target.string() + ": " + e.what());
        return false;
    }
    fs::rename(partial, target, ec);
    if (ec)
    {
        Logger::warn("Could not move thumbnail into place " + target.string() + ": " + ec.message());
        fs::remove(partial, ec);
        return false;
    }
    return true;
}

bool FrameExtractor::writePreview(const std::vector<cv::Mat> &frames, const fs::path &target) const
{
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec)
    {
        Logger::warn("Could not create thumbnails directory " + target.parent_path().string() + ": " + ec.message());
        return false;
    }
    fs::path partial = target.parent_path() / (target.stem().string() + ".partial.mp4");
    try
    {
        cv::VideoWriter writer(partial.string(), cv::VideoWriter::fourcc('m', 'p', '4', 'v'),
                               settings_.preview_fps, frames.front().size());
        if (!writer.isOpened())
        {
            Logger::warn("Preview writer unavailable for " + target.string());
            return false;
        }
        for (const auto &frame : frames)
        {
            writer.write(frame);
        }
        writer.release();
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Could not write preview " + target.string() + ": " + e.what());
        fs::remove(partial, ec);
        return false;
    }
    fs::rename(partial, target, ec);
    if (ec)
    {
        Logger::warn("Could not move preview into place " + target.string() + ": " + ec.message());
        fs::remove(partial, ec);
        return false;
    }
    return true;
}
