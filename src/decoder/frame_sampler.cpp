#include "core/decoder/frame_sampler.hpp"
#include "core/decoder/media_input.hpp"
#include "core/error_recovery.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

FrameSampler::FrameSampler(const SourceVideo &source, const SamplingOptions &options,
                           const CancellationToken *token)
    : source_(source), options_(options), token_(token)
{
    const double fps = source_.frame_rate > 0.0 ? source_.frame_rate : 25.0;
    step_ = options_.stride_seconds > 0.0 ? options_.stride_seconds
                                          : std::max(1, options_.stride_frames) / fps;

    MediaInput::open(source_.path, format_ctx_);
    stream_index_ = MediaInput::findStream(format_ctx_.get(), AVMEDIA_TYPE_VIDEO);
    if (stream_index_ < 0)
    {
        throw ResourceError("No video stream found in: " + source_.path);
    }
    MediaInput::openDecoder(format_ctx_.get(), stream_index_, codec_ctx_);

    if (!frame_.get() || !packet_.get())
    {
        throw ResourceError("Could not allocate frame or packet");
    }

    Logger::debug("Sampling " + source_.path + " every " + std::to_string(step_) + "s");
}

bool FrameSampler::decodeNextFrame()
{
    while (true)
    {
        int response = avcodec_receive_frame(codec_ctx_.get(), frame_.get());
        if (response == 0)
        {
            return true;
        }
        if (response == AVERROR_EOF)
        {
            return false;
        }
        if (response != AVERROR(EAGAIN))
        {
            ++skipped_frames_;
            Logger::warn("Skipping undecodable frame in " + source_.path + ": " +
                         ErrorRecovery::ffmpegErrorString(response));
            if (draining_)
                return false;
            continue;
        }
        if (draining_)
        {
            return false;
        }

        // Feed the decoder one packet of the sampled stream
        while (true)
        {
            int read_result = av_read_frame(format_ctx_.get(), packet_.get());
            if (read_result < 0)
            {
                if (read_result != AVERROR_EOF)
                {
                    Logger::warn("Read error in " + source_.path + ", treating as end of stream: " +
                                 ErrorRecovery::ffmpegErrorString(read_result));
                }
                avcodec_send_packet(codec_ctx_.get(), nullptr);
                draining_ = true;
                break;
            }
            if (packet_.get()->stream_index != stream_index_)
            {
                av_packet_unref(packet_.get());
                continue;
            }
            int send_result = avcodec_send_packet(codec_ctx_.get(), packet_.get());
            av_packet_unref(packet_.get());
            if (send_result < 0 && send_result != AVERROR(EAGAIN))
            {
                ++skipped_frames_;
                Logger::warn("Skipping corrupt packet in " + source_.path + ": " +
                             ErrorRecovery::ffmpegErrorString(send_result));
                continue;
            }
            break;
        }
    }
}

cv::Mat FrameSampler::toRgb(const AVFrame *frame)
{
    int out_width = frame->width;
    int out_height = frame->height;
    const int short_side = std::min(frame->width, frame->height);
    if (options_.max_frame_side > 0 && short_side > options_.max_frame_side)
    {
        const double scale = static_cast<double>(options_.max_frame_side) / short_side;
        out_width = std::max(1, static_cast<int>(std::lround(frame->width * scale)));
        out_height = std::max(1, static_cast<int>(std::lround(frame->height * scale)));
    }

    SwsContext *scaler = sws_getCachedContext(sws_ctx_.release(), frame->width, frame->height,
                                              static_cast<AVPixelFormat>(frame->format), out_width, out_height,
                                              AV_PIX_FMT_RGB24, SWS_BILINEAR, nullptr, nullptr, nullptr);
    if (!scaler)
    {
        throw ResourceError("Could not create scaler context");
    }
    sws_ctx_.set(scaler);

    cv::Mat image(out_height, out_width, CV_8UC3);
    uint8_t *dst_data[4] = {image.data, nullptr, nullptr, nullptr};
    int dst_linesize[4] = {static_cast<int>(image.step[0]), 0, 0, 0};
    sws_scale(scaler, frame->data, frame->linesize, 0, frame->height, dst_data, dst_linesize);
    return image;
}

bool FrameSampler::next(DecodedFrame &out)
{
    const double half_frame = source_.frame_rate > 0.0 ? 0.5 / source_.frame_rate : 0.0;

    while (!finished_)
    {
        if (token_ && token_->isCancelled())
        {
            finished_ = true;
            return false;
        }
        if (!decodeNextFrame())
        {
            finished_ = true;
            break;
        }
        ++decoded_frames_;

        AVFrame *frame = frame_.get();
        if (frame->flags & AV_FRAME_FLAG_CORRUPT)
        {
            ++skipped_frames_;
            Logger::warn("Skipping corrupt frame in " + source_.path);
            av_frame_unref(frame);
            continue;
        }

        double timestamp = MediaInput::frameSeconds(format_ctx_.get()->streams[stream_index_], frame);
        if (timestamp < 0.0)
        {
            // No timestamp at all: position from the decode count
            timestamp = (decoded_frames_ - 1) / (source_.frame_rate > 0.0 ? source_.frame_rate : 25.0);
        }
        if (source_.duration_seconds > 0.0 && timestamp >= source_.duration_seconds)
        {
            av_frame_unref(frame);
            finished_ = true;
            break;
        }
        if (timestamp + half_frame < next_target_)
        {
            av_frame_unref(frame);
            continue;
        }

        out.timestamp = std::max(0.0, timestamp);
        out.image = toRgb(frame);
        av_frame_unref(frame);

        while (next_target_ <= timestamp + half_frame)
        {
            next_target_ += step_;
        }
        ++sampled_frames_;
        return true;
    }

    if (sampled_frames_ == 0 && !(token_ && token_->isCancelled()))
    {
        throw ResourceError("No decodable video frames in: " + source_.path);
    }
    if (skipped_frames_ > 0)
    {
        Logger::warn("Skipped " + std::to_string(skipped_frames_) + " undecodable frames in " + source_.path);
    }
    return false;
}

void FrameSampler::reset()
{
    AVStream *stream = format_ctx_.get()->streams[stream_index_];
    int64_t start = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;
    int seek_result = av_seek_frame(format_ctx_.get(), stream_index_, start, AVSEEK_FLAG_BACKWARD);
    if (seek_result < 0)
    {
        // Some demuxers cannot seek; reopen from scratch
        Logger::debug("Seek failed, reopening " + source_.path);
        AVFormatContextRAII reopened;
        MediaInput::open(source_.path, reopened);
        format_ctx_ = std::move(reopened);
        stream_index_ = MediaInput::findStream(format_ctx_.get(), AVMEDIA_TYPE_VIDEO);
        MediaInput::openDecoder(format_ctx_.get(), stream_index_, codec_ctx_);
    }
    else
    {
        avcodec_flush_buffers(codec_ctx_.get());
    }

    next_target_ = 0.0;
    draining_ = false;
    finished_ = false;
    decoded_frames_ = 0;
    sampled_frames_ = 0;
    skipped_frames_ = 0;
}
