#include "core/decoder/media_input.hpp"
#include "core/error_recovery.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"
#include <filesystem>

void MediaInput::open(const std::string &path, AVFormatContextRAII &format_ctx)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
    {
        throw ResourceError("Source video does not exist or is not accessible: " + path);
    }

    int open_result = avformat_open_input(format_ctx.address(), path.c_str(), nullptr, nullptr);
    if (open_result < 0)
    {
        throw ResourceError("Could not open source video (possibly corrupted or unsupported format): " + path +
                            " - " + ErrorRecovery::ffmpegErrorString(open_result));
    }

    int stream_info_result = avformat_find_stream_info(format_ctx.get(), nullptr);
    if (stream_info_result < 0)
    {
        throw ResourceError("Could not find stream information (file may be corrupted): " + path + " - " +
                            ErrorRecovery::ffmpegErrorString(stream_info_result));
    }
}

int MediaInput::findStream(AVFormatContext *format_ctx, AVMediaType type)
{
    int index = av_find_best_stream(format_ctx, type, -1, -1, nullptr, 0);
    return index < 0 ? -1 : index;
}

void MediaInput::openDecoder(AVFormatContext *format_ctx, int stream_index, AVCodecContextRAII &codec_ctx,
                             int threads)
{
    AVCodecParameters *codec_params = format_ctx->streams[stream_index]->codecpar;
    const AVCodec *codec = avcodec_find_decoder(codec_params->codec_id);
    if (!codec)
    {
        throw ResourceError(std::string("Unsupported codec: ") + avcodec_get_name(codec_params->codec_id));
    }

    AVCodecContext *temp_codec_ctx = avcodec_alloc_context3(codec);
    if (!temp_codec_ctx)
    {
        throw ResourceError("Could not allocate decoder context");
    }
    codec_ctx.set(temp_codec_ctx);

    if (avcodec_parameters_to_context(codec_ctx.get(), codec_params) < 0)
    {
        throw ResourceError("Could not copy codec parameters");
    }
    codec_ctx.get()->pkt_timebase = format_ctx->streams[stream_index]->time_base;
    codec_ctx.get()->thread_count = threads;

    int open_result = avcodec_open2(codec_ctx.get(), codec, nullptr);
    if (open_result < 0)
    {
        throw ResourceError(std::string("Could not open decoder ") + codec->name + " - " +
                            ErrorRecovery::ffmpegErrorString(open_result));
    }
}

double MediaInput::startSeconds(const AVStream *stream)
{
    if (stream->start_time == AV_NOPTS_VALUE)
        return 0.0;
    return stream->start_time * av_q2d(stream->time_base);
}

double MediaInput::frameSeconds(const AVStream *stream, const AVFrame *frame)
{
    int64_t pts = frame->best_effort_timestamp;
    if (pts == AV_NOPTS_VALUE)
        pts = frame->pts;
    if (pts == AV_NOPTS_VALUE)
        return -1.0;
    return pts * av_q2d(stream->time_base) - startSeconds(stream);
}

double MediaInput::frameRate(AVFormatContext *format_ctx, AVStream *stream)
{
    AVRational rate = av_guess_frame_rate(format_ctx, stream, nullptr);
    if (rate.num <= 0 || rate.den <= 0)
    {
        Logger::warn("Frame rate unknown, assuming 25 fps");
        return 25.0;
    }
    return av_q2d(rate);
}
