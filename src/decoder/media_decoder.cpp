#include "core/decoder/media_decoder.hpp"
#include "logging/logger.hpp"

MediaDecoder::MediaDecoder(const DecodeDeadline &deadline)
    : deadline_(deadline), stream_index_(-1), time_base_(0.0), start_pts_(0)
{
}

ProcessingResult MediaDecoder::failure(const std::string &what, int errnum) const
{
    if (errnum == AVERROR_EXIT || deadline_.expired())
    {
        return ProcessingResult::Failure(PipelineErrorKind::TIMEOUT, "decode deadline exceeded during " + what + ": " + path_);
    }
    return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION,
                                     what + " failed for " + path_ + ": " + ffmpegErrorString(errnum));
}

ProcessingResult MediaDecoder::open(const std::string &file_path)
{
    path_ = file_path;

    AVFormatContext *ctx = avformat_alloc_context();
    if (!ctx)
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "Could not allocate format context");
    }
    ctx->interrupt_callback.callback = &DecodeDeadline::interruptCallback;
    ctx->interrupt_callback.opaque = &deadline_;
    format_ctx_.set(ctx);

    int rc = avformat_open_input(format_ctx_.address(), file_path.c_str(), nullptr, nullptr);
    if (rc < 0)
    {
        // avformat_open_input freed the context and nulled our pointer
        return failure("avformat_open_input", rc);
    }
    rc = avformat_find_stream_info(format_ctx_.get(), nullptr);
    if (rc < 0)
    {
        return failure("avformat_find_stream_info", rc);
    }

    const AVCodec *codec = nullptr;
    stream_index_ = av_find_best_stream(format_ctx_.get(), AVMEDIA_TYPE_VIDEO, -1, -1, &codec, 0);
    if (stream_index_ < 0 || !codec)
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "No decodable video stream in " + file_path);
    }
    AVStream *stream = format_ctx_.get()->streams[stream_index_];

    AVCodecContext *codec_ctx = avcodec_alloc_context3(codec);
    if (!codec_ctx)
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "Could not allocate decoder context");
    }
    codec_ctx_.set(codec_ctx);
    rc = avcodec_parameters_to_context(codec_ctx_.get(), stream->codecpar);
    if (rc < 0)
    {
        return failure("avcodec_parameters_to_context", rc);
    }
    rc = avcodec_open2(codec_ctx_.get(), codec, nullptr);
    if (rc < 0)
    {
        return failure("avcodec_open2", rc);
    }

    time_base_ = av_q2d(stream->time_base);
    start_pts_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    info_.width = codec_ctx_.get()->width;
    info_.height = codec_ctx_.get()->height;
    AVRational rate = stream->avg_frame_rate.num > 0 ? stream->avg_frame_rate : stream->r_frame_rate;
    info_.fps = rate.den > 0 ? av_q2d(rate) : 0.0;
    if (stream->duration != AV_NOPTS_VALUE && stream->duration > 0)
    {
        info_.duration_seconds = stream->duration * av_q2d(stream->time_base);
    }
    else if (format_ctx_.get()->duration > 0)
    {
        info_.duration_seconds = static_cast<double>(format_ctx_.get()->duration) / AV_TIME_BASE;
    }

    Logger::debug("Opened " + file_path + ": " + std::to_string(info_.width) + "x" + std::to_string(info_.height) +
                  " fps=" + std::to_string(info_.fps) + " duration=" + std::to_string(info_.duration_seconds) + "s");
    return ProcessingResult(true);
}

ProcessingResult MediaDecoder::countFrames(int64_t &frame_count)
{
    frame_count = 0;
    if (!format_ctx_.get())
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "Decoder not opened");
    }
    AVPacketRAII packet;
    if (!packet.get())
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "Could not allocate packet");
    }
    int rc = 0;
    while ((rc = av_read_frame(format_ctx_.get(), packet.get())) >= 0)
    {
        if (packet.get()->stream_index == stream_index_)
            frame_count++;
        av_packet_unref(packet.get());
        if (deadline_.expired())
            return failure("frame count", AVERROR_EXIT);
    }
    if (rc != AVERROR_EOF)
    {
        return failure("av_read_frame", rc);
    }
    return ProcessingResult(true);
}

ProcessingResult MediaDecoder::decode(const FrameSelector &select, const FrameSink &sink)
{
    if (!format_ctx_.get() || !codec_ctx_.get())
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "Decoder not opened");
    }
    AVPacketRAII packet;
    AVFrameRAII frame;
    if (!packet.get() || !frame.get())
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "Could not allocate frame or packet");
    }

    int64_t index = 0;
    bool stopped = false;

    // Drains decoded frames; false on a hard decoder error
    auto drain = [&](int &error) -> bool
    {
        while (!stopped)
        {
            int response = avcodec_receive_frame(codec_ctx_.get(), frame.get());
            if (response == AVERROR(EAGAIN) || response == AVERROR_EOF)
                return true;
            if (response < 0)
            {
                error = response;
                return false;
            }
            double timestamp = timestampOf(frame.get(), index);
            if (select(index, timestamp))
            {
                cv::Mat bgr;
                if (!toBgr(frame.get(), bgr))
                {
                    error = AVERROR(EINVAL);
                    av_frame_unref(frame.get());
                    return false;
                }
                if (!sink(index, timestamp, bgr))
                    stopped = true;
            }
            av_frame_unref(frame.get());
            index++;
        }
        return true;
    };

    int rc = 0;
    while (!stopped && (rc = av_read_frame(format_ctx_.get(), packet.get())) >= 0)
    {
        if (packet.get()->stream_index != stream_index_)
        {
            av_packet_unref(packet.get());
            continue;
        }
        int response = avcodec_send_packet(codec_ctx_.get(), packet.get());
        av_packet_unref(packet.get());
        if (response < 0 && response != AVERROR(EAGAIN))
        {
            // Corrupt packets are skipped, the decoder resynchronizes
            Logger::debug("Skipping undecodable packet in " + path_ + ": " + ffmpegErrorString(response));
            continue;
        }
        int error = 0;
        if (!drain(error))
            return failure("avcodec_receive_frame", error);
        if (deadline_.expired())
            return failure("decode", AVERROR_EXIT);
    }
    if (!stopped && rc != AVERROR_EOF)
    {
        return failure("av_read_frame", rc);
    }

    if (!stopped)
    {
        // Flush frames buffered inside the decoder
        avcodec_send_packet(codec_ctx_.get(), nullptr);
        int error = 0;
        if (!drain(error))
            return failure("decoder flush", error);
    }

    if (index == 0)
    {
        return ProcessingResult::Failure(PipelineErrorKind::EXTRACTION, "No frames could be decoded from " + path_);
    }
    return ProcessingResult(true);
}

bool MediaDecoder::toBgr(const AVFrame *frame, cv::Mat &out)
{
    if (frame->width <= 0 || frame->height <= 0)
        return false;
    sws_ctx_.set(sws_getCachedContext(sws_ctx_.get(),
                                      frame->width, frame->height, static_cast<AVPixelFormat>(frame->format),
                                      frame->width, frame->height, AV_PIX_FMT_BGR24,
                                      SWS_BILINEAR, nullptr, nullptr, nullptr));
    if (!sws_ctx_.get())
    {
        Logger::error("Could not create scaler context for " + path_);
        return false;
    }
    out.create(frame->height, frame->width, CV_8UC3);
    uint8_t *dst_data[4] = {out.data, nullptr, nullptr, nullptr};
    int dst_linesize[4] = {static_cast<int>(out.step[0]), 0, 0, 0};
    sws_scale(sws_ctx_.get(), frame->data, frame->linesize, 0, frame->height, dst_data, dst_linesize);
    return true;
}

double MediaDecoder::timestampOf(const AVFrame *frame, int64_t index) const
{
    if (frame->best_effort_timestamp != AV_NOPTS_VALUE && time_base_ > 0.0)
    {
        return (frame->best_effort_timestamp - start_pts_) * time_base_;
    }
    return info_.fps > 0 ? static_cast<double>(index) / info_.fps : static_cast<double>(index);
}
