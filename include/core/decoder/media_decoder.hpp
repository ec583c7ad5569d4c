#ifndef MEDIA_DECODER_HPP
#define MEDIA_DECODER_HPP

#include "core/external_library_wrappers.hpp"
#include "core/processing_result.hpp"
#include <cstdint>
#include <functional>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Properties of the decoded video stream
 */
struct StreamInfo
{
    int width = 0;
    int height = 0;
    double fps = 0.0;              // native frame rate, 0 when unknown
    double duration_seconds = 0.0; // 0 when unknown
};

/**
 * @brief Sequential FFmpeg decode of the first video stream of a file.
 *
 * Frames are converted to BGR cv::Mat only when selected. Every blocking call
 * is bounded by the deadline given at construction; running out of time
 * yields a TIMEOUT failure.
 */
class MediaDecoder
{
public:
    // Return true to convert and hand the frame to the sink
    using FrameSelector = std::function<bool(int64_t index, double timestamp_seconds)>;
    // Return false to stop decoding
    using FrameSink = std::function<bool(int64_t index, double timestamp_seconds, const cv::Mat &bgr)>;

    explicit MediaDecoder(const DecodeDeadline &deadline);

    MediaDecoder(const MediaDecoder &) = delete;
    MediaDecoder &operator=(const MediaDecoder &) = delete;

    /**
     * @brief Open the file and prepare a decoder for its first video stream
     * @param file_path Media file
     * @return EXTRACTION failure for unreadable or streamless files
     */
    ProcessingResult open(const std::string &file_path);

    const StreamInfo &info() const { return info_; }

    /**
     * @brief Count frames by demuxing packets of the video stream, without decoding.
     * Consumes the stream; open a fresh decoder to decode afterwards.
     */
    ProcessingResult countFrames(int64_t &frame_count);

    /**
     * @brief Decode all frames in presentation order
     * @param select Called for every decoded frame
     * @param sink Receives the selected frames as BGR images
     */
    ProcessingResult decode(const FrameSelector &select, const FrameSink &sink);

private:
    ProcessingResult failure(const std::string &what, int errnum) const;
    bool toBgr(const AVFrame *frame, cv::Mat &out);
    double timestampOf(const AVFrame *frame, int64_t index) const;

    std::string path_;
    DecodeDeadline deadline_; // address handed to FFmpeg as interrupt opaque
    AVFormatContextRAII format_ctx_;
    AVCodecContextRAII codec_ctx_;
    SwsContextRAII sws_ctx_;
    int stream_index_;
    double time_base_;
    int64_t start_pts_;
    StreamInfo info_;
};

#endif // MEDIA_DECODER_HPP
