#include "core/decoder/video_probe.hpp"
#include "core/decoder/media_input.hpp"
#include "core/error_types.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <algorithm>

namespace
{
    // Packets read while looking for the first decodable frame
    constexpr int kMaxProbePackets = 600;

    bool decodesAFrame(AVFormatContext *format_ctx, int stream_index, AVCodecContext *codec_ctx)
    {
        AVPacketRAII packet;
        AVFrameRAII frame;
        if (!packet.get() || !frame.get())
        {
            throw ResourceError("Could not allocate frame or packet");
        }

        int packets_read = 0;
        while (packets_read < kMaxProbePackets && av_read_frame(format_ctx, packet.get()) >= 0)
        {
            if (packet.get()->stream_index != stream_index)
            {
                av_packet_unref(packet.get());
                continue;
            }
            ++packets_read;
            int response = avcodec_send_packet(codec_ctx, packet.get());
            av_packet_unref(packet.get());
            if (response < 0)
            {
                continue;
            }
            while (avcodec_receive_frame(codec_ctx, frame.get()) == 0)
            {
                bool corrupt = (frame.get()->flags & AV_FRAME_FLAG_CORRUPT) != 0;
                av_frame_unref(frame.get());
                if (!corrupt)
                    return true;
            }
        }

        // Flush frames buffered in the decoder
        avcodec_send_packet(codec_ctx, nullptr);
        while (avcodec_receive_frame(codec_ctx, frame.get()) == 0)
        {
            bool corrupt = (frame.get()->flags & AV_FRAME_FLAG_CORRUPT) != 0;
            av_frame_unref(frame.get());
            if (!corrupt)
                return true;
        }
        return false;
    }
}

SourceVideo VideoProbe::probe(const std::string &path)
{
    AVFormatContextRAII format_ctx;
    MediaInput::open(path, format_ctx);

    int video_stream_index = MediaInput::findStream(format_ctx.get(), AVMEDIA_TYPE_VIDEO);
    if (video_stream_index < 0)
    {
        throw ResourceError("No video stream found in: " + path);
    }
    AVStream *video_stream = format_ctx.get()->streams[video_stream_index];

    SourceVideo source;
    source.path = path;
    if (format_ctx.get()->duration > 0)
    {
        source.duration_seconds = static_cast<double>(format_ctx.get()->duration) / AV_TIME_BASE;
    }
    else if (video_stream->duration > 0)
    {
        source.duration_seconds = video_stream->duration * av_q2d(video_stream->time_base);
    }
    if (source.duration_seconds <= 0.0)
    {
        throw ResourceError("Source video has invalid or zero duration (possibly corrupted): " + path);
    }

    source.frame_rate = MediaInput::frameRate(format_ctx.get(), video_stream);
    source.width = video_stream->codecpar->width;
    source.height = video_stream->codecpar->height;
    source.container_format = format_ctx.get()->iformat->name;
    source.video_codec = avcodec_get_name(video_stream->codecpar->codec_id);
    source.has_audio = MediaInput::findStream(format_ctx.get(), AVMEDIA_TYPE_AUDIO) >= 0;

    AVCodecContextRAII codec_ctx;
    MediaInput::openDecoder(format_ctx.get(), video_stream_index, codec_ctx);
    if (!decodesAFrame(format_ctx.get(), video_stream_index, codec_ctx.get()))
    {
        throw ResourceError("No frame of the video stream could be decoded: " + path);
    }

    Logger::info("Probed " + path + " - duration: " + std::to_string(source.duration_seconds) +
                 "s, fps: " + std::to_string(source.frame_rate) + ", " + std::to_string(source.width) + "x" +
                 std::to_string(source.height) + ", " + source.container_format + "/" + source.video_codec +
                 (source.has_audio ? ", with audio" : ", no audio"));
    return source;
}

std::vector<double> VideoProbe::keyframeTimes(const std::string &path)
{
    AVFormatContextRAII format_ctx;
    MediaInput::open(path, format_ctx);

    int video_stream_index = MediaInput::findStream(format_ctx.get(), AVMEDIA_TYPE_VIDEO);
    if (video_stream_index < 0)
    {
        throw ResourceError("No video stream found in: " + path);
    }
    AVStream *video_stream = format_ctx.get()->streams[video_stream_index];
    const double start = MediaInput::startSeconds(video_stream);
    const double time_base = av_q2d(video_stream->time_base);

    std::vector<double> times;
    AVPacketRAII packet;
    while (av_read_frame(format_ctx.get(), packet.get()) >= 0)
    {
        const AVPacket *pkt = packet.get();
        if (pkt->stream_index == video_stream_index && (pkt->flags & AV_PKT_FLAG_KEY))
        {
            int64_t ts = pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts;
            if (ts != AV_NOPTS_VALUE)
                times.push_back(ts * time_base - start);
        }
        av_packet_unref(packet.get());
    }
    std::sort(times.begin(), times.end());
    return times;
}
