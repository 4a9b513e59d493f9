#pragma once
#include <memory>

extern "C"
{
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/audio_fifo.h>
#include <libswresample/swresample.h>
#include <libswscale/swscale.h>
}

// RAII wrapper for a demuxing AVFormatContext (avformat_open_input)
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

    // Disable copy
    AVFormatContextRAII(const AVFormatContextRAII &) = delete;
    AVFormatContextRAII &operator=(const AVFormatContextRAII &) = delete;

    // Allow move
    AVFormatContextRAII(AVFormatContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }

    AVFormatContextRAII &operator=(AVFormatContextRAII &&other) noexcept
    {
        if (this != &other)
        {
            if (ctx_)
                avformat_close_input(&ctx_);
            ctx_ = other.ctx_;
            other.ctx_ = nullptr;
        }
        return *this;
    }
};

// RAII wrapper for a muxing AVFormatContext; closes the AVIO handle it opened
class AVOutputContextRAII
{
private:
    AVFormatContext *ctx_;

public:
    AVOutputContextRAII() : ctx_(nullptr) {}
    ~AVOutputContextRAII()
    {
        if (ctx_)
        {
            if (ctx_->pb && !(ctx_->oformat->flags & AVFMT_NOFILE))
                avio_closep(&ctx_->pb);
            avformat_free_context(ctx_);
        }
    }

    AVFormatContext *get() { return ctx_; }
    AVFormatContext **address() { return &ctx_; }

    AVOutputContextRAII(const AVOutputContextRAII &) = delete;
    AVOutputContextRAII &operator=(const AVOutputContextRAII &) = delete;
};

// RAII wrapper for FFmpeg AVCodecContext
class AVCodecContextRAII
{
private:
    AVCodecContext *ctx_;

public:
    AVCodecContextRAII() : ctx_(nullptr) {}

    explicit AVCodecContextRAII(AVCodecContext *existing_ctx) : ctx_(existing_ctx) {}

    ~AVCodecContextRAII()
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
    }

    AVCodecContext *get() { return ctx_; }
    AVCodecContext **address() { return &ctx_; }

    void set(AVCodecContext *new_ctx)
    {
        if (ctx_)
            avcodec_free_context(&ctx_);
        ctx_ = new_ctx;
    }

    // Disable copy
    AVCodecContextRAII(const AVCodecContextRAII &) = delete;
    AVCodecContextRAII &operator=(const AVCodecContextRAII &) = delete;

    // Allow move
    AVCodecContextRAII(AVCodecContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
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

    AVFrameRAII(AVFrameRAII &&other) noexcept : frame_(other.frame_)
    {
        other.frame_ = nullptr;
    }
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

    AVPacketRAII(AVPacketRAII &&other) noexcept : packet_(other.packet_)
    {
        other.packet_ = nullptr;
    }
};

// RAII wrapper for FFmpeg SwsContext
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
    void set(SwsContext *c)
    {
        if (ctx_ && ctx_ != c)
            sws_freeContext(ctx_);
        ctx_ = c;
    }

    // Hand ownership back, e.g. to sws_getCachedContext
    SwsContext *release()
    {
        SwsContext *c = ctx_;
        ctx_ = nullptr;
        return c;
    }

    // Disable copy
    SwsContextRAII(const SwsContextRAII &) = delete;
    SwsContextRAII &operator=(const SwsContextRAII &) = delete;

    // Allow move
    SwsContextRAII(SwsContextRAII &&other) noexcept : ctx_(other.ctx_)
    {
        other.ctx_ = nullptr;
    }
};

// RAII wrapper for libswresample SwrContext
class SwrContextRAII
{
private:
    SwrContext *ctx_;

public:
    SwrContextRAII() : ctx_(nullptr) {}
    ~SwrContextRAII()
    {
        if (ctx_)
            swr_free(&ctx_);
    }

    SwrContext *get() { return ctx_; }
    SwrContext **address() { return &ctx_; }

    SwrContextRAII(const SwrContextRAII &) = delete;
    SwrContextRAII &operator=(const SwrContextRAII &) = delete;
};

// RAII wrapper for AVAudioFifo
class AVAudioFifoRAII
{
private:
    AVAudioFifo *fifo_;

public:
    AVAudioFifoRAII() : fifo_(nullptr) {}
    ~AVAudioFifoRAII()
    {
        if (fifo_)
            av_audio_fifo_free(fifo_);
    }

    AVAudioFifo *get() { return fifo_; }
    void set(AVAudioFifo *f)
    {
        if (fifo_)
            av_audio_fifo_free(fifo_);
        fifo_ = f;
    }

    AVAudioFifoRAII(const AVAudioFifoRAII &) = delete;
    AVAudioFifoRAII &operator=(const AVAudioFifoRAII &) = delete;
};
