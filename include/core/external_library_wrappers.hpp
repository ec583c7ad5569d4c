#pragma once
#include <chrono>
#include <string>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/error.h>
#include <libswscale/swscale.h>
}

// RAII wrapper for FFmpeg AVFormatContext opened with avformat_open_input
class AVFormatContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVFormatContextRAII() : ctx_(nullptr) {}
    ~AVFormatContextRAII()
    {
        if (ctx_)
            avformat_close_input(&ctx_);
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    // Context pre-allocated with avformat_alloc_context (for interrupt callbacks);
    // avformat_open_input frees it on failure
    void set(AVFormatContext *ctx) { ctx_ = ctx; }

    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}
    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }

    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVFrame
class AVFrameRAII
{
private:
    AVFrame *frame_;

public:
    AVFrameRAII() : frame_(av_frame_alloc()) {}
    ~AVFrameRAII()
    {
        if (frame_)
            av_frame_free(&frame_);
    }

    AVFrame *get() { return frame_; }

    AVFrameRAII(const AVFrameRAII &) = delete;
    AVFrameRAII &operator=(const AVFrameRAII &) = delete;
};

// RAII wrapper for FFmpeg AVPacket
class AVPacketRAII
{
private:
    AVPacket *packet_;

public:
    AVPacketRAII() : packet_(av_packet_alloc()) {}
    ~AVPacketRAII()
    {
        if (packet_)
            av_packet_free(&packet_);
    }

    AVPacket *get() { return packet_; }

    AVPacketRAII(const AVPacketRAII &) = delete;
    AVPacketRAII &operator=(const AVPacketRAII &) = delete;
};

// RAII wrapper for FFmpeg SwsContext, meant for sws_getCachedContext which frees
// the context it is handed when it cannot reuse it
class SwsContextRAII
{
private:
    SwsContext *ctx_;

public:
    SwsContextRAII() : ctx_(nullptr) {}
    ~SwsContextRAII()
    {
        if (ctx_)
            sws_freeContext(ctx_);
    }

    SwsContext *get() { return ctx_; }
    void set(SwsContext *c) { ctx_ = c; }

    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;
};

/**
 * @brief Wall-clock budget for a decode, installed as the demuxer interrupt callback.
 *
 * FFmpeg polls interruptCallback during blocking I/O; a non-zero return aborts
 * the operation with AVERROR_EXIT.
 */
struct DecodeDeadline
{
    std::chrono::steady_clock::time_point expires_at;

    static DecodeDeadline after(std::chrono::milliseconds budget)
    {
        return DecodeDeadline{std::chrono::steady_clock::now() + budget};
    }

    static DecodeDeadline unbounded()
    {
        return DecodeDeadline{std::chrono::steady_clock::time_point::max()};
    }

    bool expired() const { return std::chrono::steady_clock::now() >= expires_at; }

    std::chrono::milliseconds remaining() const
    {
        if (expires_at == std::chrono::steady_clock::time_point::max())
            return std::chrono::milliseconds::max();
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(expires_at - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    }

    static int interruptCallback(void *opaque)
    {
        auto *deadline = static_cast<const DecodeDeadline *>(opaque);
        return deadline && deadline->expired() ? 1 : 0;
    }
};

inline std::string ffmpegErrorString(int errnum)
{
    char err_buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(errnum, err_buf, AV_ERROR_MAX_STRING_SIZE);
    return std::string(err_buf);
}
