#include "core/composer/video_composer.hpp"
#include "core/decoder/media_input.hpp"
#include "core/decoder/video_probe.hpp"
#include "core/error_recovery.hpp"
#include "core/error_types.hpp"
#include "core/external_library_wrappers.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <climits>
#include <cmath>
#include <map>

extern "C"
{
#include <libavutil/channel_layout.h>
#include <libavutil/opt.h>
}

namespace
{
    // Timestamp slack when comparing frame times against interval bounds
    constexpr double kTimeEpsilon = 1e-6;

    void throwCompose(const std::string &what, int error_code)
    {
        throw ComposeError(what + ": " + ErrorRecovery::ffmpegErrorString(error_code),
                           ErrorRecovery::isTransientFFmpegError(error_code));
    }

    void openSource(const std::string &path, AVFormatContextRAII &input)
    {
        try
        {
            MediaInput::open(path, input);
        }
        catch (const ResourceError &e)
        {
            // The source was readable when probed; losing it now is an I/O problem
            throw ComposeError(e.what(), true);
        }
    }

    void allocateOutput(const std::string &path, const std::string &format_name, AVOutputContextRAII &output)
    {
        int result = avformat_alloc_output_context2(output.address(), nullptr, format_name.c_str(), path.c_str());
        if (result < 0 || !output.get())
        {
            throw ComposeError("Could not create " + format_name + " output for " + path);
        }
        output.get()->avoid_negative_ts = AVFMT_AVOID_NEG_TS_MAKE_ZERO;
    }

    void writeHeader(AVOutputContextRAII &output, const std::string &path)
    {
        AVFormatContext *ctx = output.get();
        if (!(ctx->oformat->flags & AVFMT_NOFILE))
        {
            int open_result = avio_open(&ctx->pb, path.c_str(), AVIO_FLAG_WRITE);
            if (open_result < 0)
            {
                throwCompose("Could not open output file " + path, open_result);
            }
        }
        int header_result = avformat_write_header(ctx, nullptr);
        if (header_result < 0)
        {
            throwCompose("Could not write header of " + path, header_result);
        }
    }

    void writeTrailer(AVOutputContextRAII &output, const std::string &path)
    {
        int result = av_write_trailer(output.get());
        if (result < 0)
        {
            throwCompose("Could not finalize " + path, result);
        }
    }

    void writePacket(AVFormatContext *output, AVPacket *packet, const std::string &path)
    {
        int result = av_interleaved_write_frame(output, packet);
        if (result < 0)
        {
            throwCompose("Could not write packet to " + path, result);
        }
    }

    int64_t packetTimestamp(const AVPacket *packet)
    {
        return packet->pts != AV_NOPTS_VALUE ? packet->pts : packet->dts;
    }

    int64_t shiftAndRescale(int64_t ts, int64_t shift, AVRational from, AVRational to)
    {
        if (ts == AV_NOPTS_VALUE)
            return AV_NOPTS_VALUE;
        return av_rescale_q_rnd(ts - shift, from, to, static_cast<AVRounding>(AV_ROUND_NEAR_INF | AV_ROUND_PASS_MINMAX));
    }

    /**
     * @brief Decodes one interval of the source and encodes it into a fresh file
     *
     * Video frames are re-timed to a constant frame rate starting at 0, audio
     * is resampled to AAC and trimmed to the interval's sample count.
     */
    class IntervalReencoder
    {
    public:
        IntervalReencoder(const SourceVideo &source, const SceneCandidate &interval, const std::string &output_path,
                          const std::string &format_name)
            : source_(source), interval_(interval), output_path_(output_path)
        {
            openSource(source_.path, input_);
            video_index_ = MediaInput::findStream(input_.get(), AVMEDIA_TYPE_VIDEO);
            if (video_index_ < 0)
            {
                throw ComposeError("No video stream in " + source_.path);
            }
            audio_index_ = MediaInput::findStream(input_.get(), AVMEDIA_TYPE_AUDIO);

            try
            {
                MediaInput::openDecoder(input_.get(), video_index_, video_dec_);
                if (audio_index_ >= 0)
                    MediaInput::openDecoder(input_.get(), audio_index_, audio_dec_);
            }
            catch (const ResourceError &e)
            {
                throw ComposeError(e.what());
            }

            if (!frame_.get() || !packet_.get() || !enc_packet_.get() || !yuv_frame_.get() ||
                !converted_frame_.get())
            {
                throw ComposeError("Could not allocate frames or packets");
            }

            allocateOutput(output_path_, format_name, output_);
            setupVideoEncoder();
            if (audio_index_ >= 0)
                setupAudioEncoder();
            writeHeader(output_, output_path_);
        }

        void run()
        {
            const double start_offset = input_.get()->start_time != AV_NOPTS_VALUE
                                            ? static_cast<double>(input_.get()->start_time) / AV_TIME_BASE
                                            : 0.0;
            const int64_t seek_target = static_cast<int64_t>((interval_.start + start_offset) * AV_TIME_BASE);
            int seek_result = av_seek_frame(input_.get(), -1, seek_target, AVSEEK_FLAG_BACKWARD);
            if (seek_result < 0)
            {
                Logger::debug("Seek failed in " + source_.path + ", decoding from the start");
            }

            video_done_ = false;
            audio_done_ = audio_index_ < 0;
            while (!(video_done_ && audio_done_))
            {
                int read_result = av_read_frame(input_.get(), packet_.get());
                if (read_result < 0)
                {
                    if (read_result != AVERROR_EOF && ErrorRecovery::isTransientFFmpegError(read_result))
                    {
                        throwCompose("Read error in " + source_.path, read_result);
                    }
                    break;
                }

                const int stream_index = packet_.get()->stream_index;
                if (stream_index == video_index_ && !video_done_)
                {
                    feedDecoder(video_dec_.get(), packet_.get(), true);
                }
                else if (stream_index == audio_index_ && !audio_done_)
                {
                    feedDecoder(audio_dec_.get(), packet_.get(), false);
                }
                av_packet_unref(packet_.get());
            }

            if (!video_done_)
                feedDecoder(video_dec_.get(), nullptr, true);
            if (!audio_done_ && audio_index_ >= 0)
                feedDecoder(audio_dec_.get(), nullptr, false);

            if (audio_enc_.get())
            {
                while (av_audio_fifo_size(fifo_.get()) > 0 && audio_samples_written_ < audio_target_samples_)
                {
                    encodeAudioFromFifo(std::min(av_audio_fifo_size(fifo_.get()), audio_frame_size_));
                }
                drainEncoder(audio_enc_.get(), out_audio_, nullptr);
            }
            drainEncoder(video_enc_.get(), out_video_, nullptr);

            if (video_frames_written_ == 0)
            {
                throw ComposeError("No video frame decoded in interval of " + source_.path);
            }
            writeTrailer(output_, output_path_);
        }

    private:
        void setupVideoEncoder()
        {
            const AVCodec *encoder = avcodec_find_encoder_by_name("libx264");
            const bool is_x264 = encoder != nullptr;
            if (!encoder)
                encoder = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
            if (!encoder)
            {
                throw ComposeError("No H.264 or MPEG-4 encoder available");
            }

            AVCodecContext *dec = video_dec_.get();
            video_enc_.set(avcodec_alloc_context3(encoder));
            AVCodecContext *enc = video_enc_.get();
            if (!enc)
            {
                throw ComposeError("Could not allocate video encoder");
            }

            AVRational rate = av_d2q(source_.frame_rate > 0.0 ? source_.frame_rate : 25.0, 65535);
            if (rate.num <= 0 || rate.den <= 0)
                rate = AVRational{25, 1};
            frame_seconds_ = av_q2d(av_inv_q(rate));

            enc->width = std::max(2, dec->width & ~1);
            enc->height = std::max(2, dec->height & ~1);
            enc->pix_fmt = AV_PIX_FMT_YUV420P;
            enc->time_base = av_inv_q(rate);
            enc->framerate = rate;
            enc->sample_aspect_ratio = dec->sample_aspect_ratio;
            enc->gop_size = 12;
            enc->max_b_frames = 0;
            if (!is_x264)
                enc->bit_rate = 4000000;
            if (output_.get()->oformat->flags & AVFMT_GLOBALHEADER)
                enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

            AVDictionary *enc_opts = nullptr;
            if (is_x264)
            {
                av_dict_set(&enc_opts, "preset", "veryfast", 0);
                av_dict_set(&enc_opts, "crf", "23", 0);
            }
            int open_result = avcodec_open2(enc, encoder, &enc_opts);
            av_dict_free(&enc_opts);
            if (open_result < 0)
            {
                throwCompose(std::string("Could not open video encoder ") + encoder->name, open_result);
            }

            out_video_ = avformat_new_stream(output_.get(), nullptr);
            if (!out_video_)
            {
                throw ComposeError("Could not add video stream to " + output_path_);
            }
            if (avcodec_parameters_from_context(out_video_->codecpar, enc) < 0)
            {
                throw ComposeError("Could not copy video encoder parameters");
            }
            out_video_->time_base = enc->time_base;
        }

        void setupAudioEncoder()
        {
            const AVCodec *encoder = avcodec_find_encoder(AV_CODEC_ID_AAC);
            if (!encoder)
            {
                Logger::warn("AAC encoder unavailable, summary of " + source_.path + " will have no audio");
                audio_index_ = -1;
                return;
            }

            AVCodecContext *dec = audio_dec_.get();
            audio_enc_.set(avcodec_alloc_context3(encoder));
            AVCodecContext *enc = audio_enc_.get();
            if (!enc)
            {
                throw ComposeError("Could not allocate audio encoder");
            }

            enc->sample_rate = dec->sample_rate > 0 ? dec->sample_rate : 44100;
            av_channel_layout_default(&enc->ch_layout, std::max(1, std::min(2, dec->ch_layout.nb_channels)));
            enc->sample_fmt = AV_SAMPLE_FMT_FLTP;
            enc->bit_rate = 128000;
            enc->time_base = AVRational{1, enc->sample_rate};
            if (output_.get()->oformat->flags & AVFMT_GLOBALHEADER)
                enc->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;

            int open_result = avcodec_open2(enc, encoder, nullptr);
            if (open_result < 0)
            {
                throwCompose("Could not open AAC encoder", open_result);
            }
            audio_frame_size_ = enc->frame_size > 0 ? enc->frame_size : 1024;

            AVChannelLayout in_layout;
            if (dec->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC || dec->ch_layout.nb_channels <= 0)
                av_channel_layout_default(&in_layout, std::max(1, dec->ch_layout.nb_channels));
            else
                av_channel_layout_copy(&in_layout, &dec->ch_layout);
            int swr_result = swr_alloc_set_opts2(swr_.address(), &enc->ch_layout, enc->sample_fmt, enc->sample_rate,
                                                 &in_layout, dec->sample_fmt, dec->sample_rate, 0, nullptr);
            av_channel_layout_uninit(&in_layout);
            if (swr_result < 0 || swr_init(swr_.get()) < 0)
            {
                throw ComposeError("Could not initialize audio resampler");
            }

            fifo_.set(av_audio_fifo_alloc(enc->sample_fmt, enc->ch_layout.nb_channels, audio_frame_size_));
            if (!fifo_.get())
            {
                throw ComposeError("Could not allocate audio FIFO");
            }
            audio_target_samples_ =
                static_cast<int64_t>(std::llround((interval_.end - interval_.start) * enc->sample_rate));

            out_audio_ = avformat_new_stream(output_.get(), nullptr);
            if (!out_audio_)
            {
                throw ComposeError("Could not add audio stream to " + output_path_);
            }
            if (avcodec_parameters_from_context(out_audio_->codecpar, enc) < 0)
            {
                throw ComposeError("Could not copy audio encoder parameters");
            }
            out_audio_->time_base = enc->time_base;
        }

        // Send one packet (nullptr flushes) and consume every frame it yields
        void feedDecoder(AVCodecContext *decoder, AVPacket *packet, bool is_video)
        {
            int send_result = avcodec_send_packet(decoder, packet);
            if (send_result < 0 && send_result != AVERROR(EAGAIN) && send_result != AVERROR_EOF)
            {
                Logger::warn("Skipping corrupt packet while composing " + source_.path + ": " +
                             ErrorRecovery::ffmpegErrorString(send_result));
                return;
            }

            while (true)
            {
                int receive_result = avcodec_receive_frame(decoder, frame_.get());
                if (receive_result == AVERROR(EAGAIN) || receive_result == AVERROR_EOF)
                    break;
                if (receive_result < 0)
                {
                    Logger::warn("Skipping undecodable frame while composing " + source_.path + ": " +
                                 ErrorRecovery::ffmpegErrorString(receive_result));
                    break;
                }

                bool keep_going = is_video ? handleVideoFrame(frame_.get()) : handleAudioFrame(frame_.get());
                av_frame_unref(frame_.get());
                if (!keep_going)
                {
                    (is_video ? video_done_ : audio_done_) = true;
                    break;
                }
            }
        }

        bool handleVideoFrame(AVFrame *frame)
        {
            double t = MediaInput::frameSeconds(input_.get()->streams[video_index_], frame);
            if (t < 0.0 || (frame->flags & AV_FRAME_FLAG_CORRUPT))
                return true;

            const double half_frame = frame_seconds_ / 2.0;
            if (t + half_frame < interval_.start)
                return true;
            if (t + half_frame >= interval_.end - kTimeEpsilon)
                return false;

            AVCodecContext *enc = video_enc_.get();
            SwsContext *scaler = sws_getCachedContext(sws_.release(), frame->width, frame->height,
                                                      static_cast<AVPixelFormat>(frame->format), enc->width,
                                                      enc->height, enc->pix_fmt, SWS_BILINEAR, nullptr, nullptr,
                                                      nullptr);
            if (!scaler)
            {
                throw ComposeError("Could not create scaler for re-encoding");
            }
            sws_.set(scaler);

            AVFrame *yuv = yuv_frame_.get();
            if (!yuv->data[0])
            {
                yuv->format = enc->pix_fmt;
                yuv->width = enc->width;
                yuv->height = enc->height;
                if (av_frame_get_buffer(yuv, 0) < 0)
                {
                    throw ComposeError("Could not allocate re-encode frame");
                }
            }
            if (av_frame_make_writable(yuv) < 0)
            {
                throw ComposeError("Could not make re-encode frame writable");
            }
            sws_scale(scaler, frame->data, frame->linesize, 0, frame->height, yuv->data, yuv->linesize);
            yuv->pts = video_frames_written_++;

            drainEncoder(enc, out_video_, yuv);
            return true;
        }

        bool handleAudioFrame(AVFrame *frame)
        {
            if (!audio_enc_.get())
                return false;

            double t = MediaInput::frameSeconds(input_.get()->streams[audio_index_], frame);
            if (t < 0.0)
                return true;
            const int in_rate = audio_dec_.get()->sample_rate > 0 ? audio_dec_.get()->sample_rate : 44100;
            const double frame_end = t + static_cast<double>(frame->nb_samples) / in_rate;
            if (t >= interval_.end - kTimeEpsilon || audio_samples_written_ >= audio_target_samples_)
                return false;
            if (frame_end <= interval_.start)
                return true;

            AVCodecContext *enc = audio_enc_.get();
            AVFrame *converted = converted_frame_.get();
            av_frame_unref(converted);
            converted->format = enc->sample_fmt;
            converted->sample_rate = enc->sample_rate;
            av_channel_layout_copy(&converted->ch_layout, &enc->ch_layout);
            converted->nb_samples = swr_get_out_samples(swr_.get(), frame->nb_samples);
            if (converted->nb_samples <= 0 || av_frame_get_buffer(converted, 0) < 0)
            {
                throw ComposeError("Could not allocate resampled audio frame");
            }

            int samples = swr_convert(swr_.get(), converted->data, converted->nb_samples,
                                      const_cast<const uint8_t **>(frame->extended_data), frame->nb_samples);
            if (samples < 0)
            {
                throwCompose("Audio resampling failed", samples);
            }
            if (av_audio_fifo_write(fifo_.get(), reinterpret_cast<void **>(converted->data), samples) < samples)
            {
                throw ComposeError("Could not buffer resampled audio");
            }

            if (!audio_started_)
            {
                audio_started_ = true;
                if (t < interval_.start)
                {
                    int lead = static_cast<int>(std::llround((interval_.start - t) * enc->sample_rate));
                    av_audio_fifo_drain(fifo_.get(), std::min(lead, av_audio_fifo_size(fifo_.get())));
                }
            }

            while (av_audio_fifo_size(fifo_.get()) >= audio_frame_size_ &&
                   audio_samples_written_ < audio_target_samples_)
            {
                encodeAudioFromFifo(audio_frame_size_);
            }
            return audio_samples_written_ < audio_target_samples_;
        }

        void encodeAudioFromFifo(int requested)
        {
            AVCodecContext *enc = audio_enc_.get();
            int samples = static_cast<int>(std::min<int64_t>(requested, audio_target_samples_ - audio_samples_written_));
            if (samples <= 0)
                return;

            AVFrameRAII out;
            AVFrame *frame = out.get();
            frame->nb_samples = samples;
            frame->format = enc->sample_fmt;
            frame->sample_rate = enc->sample_rate;
            av_channel_layout_copy(&frame->ch_layout, &enc->ch_layout);
            if (av_frame_get_buffer(frame, 0) < 0)
            {
                throw ComposeError("Could not allocate audio frame");
            }
            if (av_audio_fifo_read(fifo_.get(), reinterpret_cast<void **>(frame->data), samples) < samples)
            {
                throw ComposeError("Could not read buffered audio");
            }
            frame->pts = audio_samples_written_;
            audio_samples_written_ += samples;

            drainEncoder(enc, out_audio_, frame);
        }

        // Send a frame (nullptr flushes) and write every packet the encoder has ready
        void drainEncoder(AVCodecContext *encoder, AVStream *stream, AVFrame *frame)
        {
            int send_result = avcodec_send_frame(encoder, frame);
            if (send_result < 0 && send_result != AVERROR_EOF)
            {
                throwCompose("Encoder rejected a frame", send_result);
            }

            AVPacket *packet = enc_packet_.get();
            while (true)
            {
                int receive_result = avcodec_receive_packet(encoder, packet);
                if (receive_result == AVERROR(EAGAIN) || receive_result == AVERROR_EOF)
                    break;
                if (receive_result < 0)
                {
                    throwCompose("Encoding failed", receive_result);
                }
                packet->stream_index = stream->index;
                av_packet_rescale_ts(packet, encoder->time_base, stream->time_base);
                writePacket(output_.get(), packet, output_path_);
                av_packet_unref(packet);
            }
        }

        const SourceVideo &source_;
        SceneCandidate interval_;
        std::string output_path_;

        AVFormatContextRAII input_;
        int video_index_ = -1;
        int audio_index_ = -1;
        AVCodecContextRAII video_dec_;
        AVCodecContextRAII audio_dec_;

        AVOutputContextRAII output_;
        AVCodecContextRAII video_enc_;
        AVCodecContextRAII audio_enc_;
        AVStream *out_video_ = nullptr;
        AVStream *out_audio_ = nullptr;
        SwsContextRAII sws_;
        SwrContextRAII swr_;
        AVAudioFifoRAII fifo_;

        AVFrameRAII frame_;
        AVFrameRAII yuv_frame_;
        AVFrameRAII converted_frame_;
        AVPacketRAII packet_;
        AVPacketRAII enc_packet_;

        double frame_seconds_ = 0.04;
        int audio_frame_size_ = 1024;
        int64_t video_frames_written_ = 0;
        int64_t audio_samples_written_ = 0;
        int64_t audio_target_samples_ = 0;
        bool audio_started_ = false;
        bool video_done_ = false;
        bool audio_done_ = false;
    };
}

ComposerOptions ComposerOptions::fromSettings(const PipelineSettings &settings)
{
    ComposerOptions options;
    options.output_format = settings.output_format;
    options.prefer_stream_copy = settings.prefer_stream_copy;
    options.max_retries = settings.max_retries;
    options.retry_backoff_ms = settings.retry_backoff_ms;
    return options;
}

std::string ComposerOptions::fileExtension() const
{
    static const std::map<std::string, std::string> extensions = {
        {"matroska", "mkv"}, {"mpegts", "ts"}, {"mp4", "mp4"}, {"mov", "mov"}, {"avi", "avi"}, {"webm", "webm"}};
    auto it = extensions.find(output_format);
    return it != extensions.end() ? it->second : output_format;
}

VideoComposer::VideoComposer(const ComposerOptions &options) : options_(options)
{
    if (!av_guess_format(options_.output_format.c_str(), nullptr, nullptr))
    {
        throw ComposeError("Unknown output container format: " + options_.output_format);
    }
}

std::string VideoComposer::getModeName(ComposeMode mode)
{
    return mode == ComposeMode::STREAM_COPY ? "stream-copy" : "re-encode";
}

void VideoComposer::checkIntervals(const SourceVideo &source, const std::vector<SceneCandidate> &intervals) const
{
    if (intervals.empty())
    {
        throw ComposeError("Nothing to compose: no intervals selected");
    }
    for (size_t i = 0; i < intervals.size(); ++i)
    {
        const auto &interval = intervals[i];
        if (!(interval.start < interval.end) || interval.start < 0.0 ||
            interval.start >= source.duration_seconds)
        {
            throw ComposeError("Interval outside the source: " + std::to_string(interval.start) + "-" +
                               std::to_string(interval.end));
        }
        if (i > 0 && intervals[i - 1].end > interval.start + kTimeEpsilon)
        {
            throw ComposeError("Intervals overlap or are out of order at " + std::to_string(interval.start));
        }
    }
}

ComposeMode VideoComposer::chooseMode(const SourceVideo &source, const std::vector<SceneCandidate> &intervals) const
{
    if (!options_.prefer_stream_copy)
        return ComposeMode::REENCODE;

    const AVOutputFormat *format = av_guess_format(options_.output_format.c_str(), nullptr, nullptr);
    AVFormatContextRAII input;
    openSource(source.path, input);

    for (AVMediaType type : {AVMEDIA_TYPE_VIDEO, AVMEDIA_TYPE_AUDIO})
    {
        int index = MediaInput::findStream(input.get(), type);
        if (index < 0)
            continue;
        AVCodecID codec_id = input.get()->streams[index]->codecpar->codec_id;
        if (avformat_query_codec(format, codec_id, FF_COMPLIANCE_NORMAL) != 1)
        {
            Logger::debug(std::string("Codec ") + avcodec_get_name(codec_id) + " cannot be copied into " +
                          options_.output_format + ", re-encoding");
            return ComposeMode::REENCODE;
        }
    }

    std::vector<double> keyframes;
    try
    {
        keyframes = VideoProbe::keyframeTimes(source.path);
    }
    catch (const ResourceError &e)
    {
        throw ComposeError(e.what(), true);
    }

    const double frame_seconds = source.frame_rate > 0.0 ? 1.0 / source.frame_rate : 0.04;
    for (const auto &interval : intervals)
    {
        auto it = std::lower_bound(keyframes.begin(), keyframes.end(), interval.start - frame_seconds - kTimeEpsilon);
        if (it == keyframes.end() || *it > interval.start + frame_seconds + kTimeEpsilon)
        {
            Logger::debug("No key frame near " + std::to_string(interval.start) + "s, re-encoding");
            return ComposeMode::REENCODE;
        }
    }
    return ComposeMode::STREAM_COPY;
}

void VideoComposer::extractStreamCopy(const SourceVideo &source, const SceneCandidate &interval,
                                      const std::string &segment_path) const
{
    AVFormatContextRAII input;
    openSource(source.path, input);

    const int video_index = MediaInput::findStream(input.get(), AVMEDIA_TYPE_VIDEO);
    const int audio_index = MediaInput::findStream(input.get(), AVMEDIA_TYPE_AUDIO);
    if (video_index < 0)
    {
        throw ComposeError("No video stream in " + source.path);
    }

    AVOutputContextRAII output;
    allocateOutput(segment_path, options_.output_format, output);

    std::map<int, AVStream *> stream_map;
    for (int index : {video_index, audio_index})
    {
        if (index < 0)
            continue;
        AVStream *in_stream = input.get()->streams[index];
        AVStream *out_stream = avformat_new_stream(output.get(), nullptr);
        if (!out_stream || avcodec_parameters_copy(out_stream->codecpar, in_stream->codecpar) < 0)
        {
            throw ComposeError("Could not add stream to " + segment_path);
        }
        out_stream->codecpar->codec_tag = 0;
        out_stream->time_base = in_stream->time_base;
        stream_map[index] = out_stream;
    }
    writeHeader(output, segment_path);

    const double frame_seconds = source.frame_rate > 0.0 ? 1.0 / source.frame_rate : 0.04;
    const double start_offset = input.get()->start_time != AV_NOPTS_VALUE
                                    ? static_cast<double>(input.get()->start_time) / AV_TIME_BASE
                                    : 0.0;
    const int64_t seek_target =
        static_cast<int64_t>((std::max(0.0, interval.start - frame_seconds) + start_offset) * AV_TIME_BASE);
    if (av_seek_frame(input.get(), -1, seek_target, AVSEEK_FLAG_BACKWARD) < 0)
    {
        Logger::debug("Seek failed in " + source.path + ", reading from the start");
    }

    bool started = false;
    bool video_done = false;
    bool audio_done = audio_index < 0;
    AVPacketRAII packet;
    while (!(video_done && audio_done))
    {
        int read_result = av_read_frame(input.get(), packet.get());
        if (read_result < 0)
        {
            if (read_result != AVERROR_EOF && ErrorRecovery::isTransientFFmpegError(read_result))
            {
                throwCompose("Read error in " + source.path, read_result);
            }
            break;
        }

        AVPacket *pkt = packet.get();
        auto mapped = stream_map.find(pkt->stream_index);
        int64_t ts = packetTimestamp(pkt);
        if (mapped == stream_map.end() || ts == AV_NOPTS_VALUE)
        {
            av_packet_unref(pkt);
            continue;
        }

        AVStream *in_stream = input.get()->streams[pkt->stream_index];
        const double t = ts * av_q2d(in_stream->time_base) - MediaInput::startSeconds(in_stream);
        bool keep = true;
        if (pkt->stream_index == video_index)
        {
            if (!started)
            {
                if (!(pkt->flags & AV_PKT_FLAG_KEY) || t < interval.start - frame_seconds - kTimeEpsilon)
                    keep = false;
                else
                    started = true;
            }
            if (keep && t >= interval.end - kTimeEpsilon)
            {
                keep = false;
                int64_t dts = pkt->dts != AV_NOPTS_VALUE ? pkt->dts : ts;
                if (dts * av_q2d(in_stream->time_base) - MediaInput::startSeconds(in_stream) >=
                    interval.end - kTimeEpsilon)
                    video_done = true;
            }
        }
        else
        {
            if (t < interval.start - kTimeEpsilon)
                keep = false;
            else if (t >= interval.end - kTimeEpsilon)
            {
                keep = false;
                audio_done = true;
            }
        }

        if (keep)
        {
            AVStream *out_stream = mapped->second;
            const int64_t stream_start = in_stream->start_time != AV_NOPTS_VALUE ? in_stream->start_time : 0;
            const int64_t shift = stream_start + static_cast<int64_t>(std::llround(interval.start / av_q2d(in_stream->time_base)));
            pkt->pts = shiftAndRescale(pkt->pts, shift, in_stream->time_base, out_stream->time_base);
            pkt->dts = shiftAndRescale(pkt->dts, shift, in_stream->time_base, out_stream->time_base);
            pkt->duration = av_rescale_q(pkt->duration, in_stream->time_base, out_stream->time_base);
            pkt->stream_index = out_stream->index;
            pkt->pos = -1;
            writePacket(output.get(), pkt, segment_path);
        }
        av_packet_unref(pkt);
    }

    if (!started)
    {
        throw ComposeError("No key frame found for interval at " + std::to_string(interval.start) + "s");
    }
    writeTrailer(output, segment_path);
}

void VideoComposer::extractReencode(const SourceVideo &source, const SceneCandidate &interval,
                                    const std::string &segment_path) const
{
    IntervalReencoder reencoder(source, interval, segment_path, options_.output_format);
    reencoder.run();
}

void VideoComposer::concatenate(const std::vector<std::string> &segment_paths, const std::string &output_path) const
{
    AVOutputContextRAII output;
    allocateOutput(output_path, options_.output_format, output);

    // Output streams follow the first extract; every extract shares its parameters
    std::map<AVMediaType, AVStream *> out_streams;
    {
        AVFormatContextRAII first;
        openSource(segment_paths.front(), first);
        for (AVMediaType type : {AVMEDIA_TYPE_VIDEO, AVMEDIA_TYPE_AUDIO})
        {
            int index = MediaInput::findStream(first.get(), type);
            if (index < 0)
                continue;
            AVStream *in_stream = first.get()->streams[index];
            AVStream *out_stream = avformat_new_stream(output.get(), nullptr);
            if (!out_stream || avcodec_parameters_copy(out_stream->codecpar, in_stream->codecpar) < 0)
            {
                throw ComposeError("Could not add stream to " + output_path);
            }
            out_stream->codecpar->codec_tag = 0;
            out_stream->time_base = in_stream->time_base;
            out_streams[type] = out_stream;
        }
    }
    if (out_streams.find(AVMEDIA_TYPE_VIDEO) == out_streams.end())
    {
        throw ComposeError("Extract has no video stream: " + segment_paths.front());
    }
    writeHeader(output, output_path);

    std::map<int, int64_t> last_dts;
    int64_t offset_us = 0;
    AVPacketRAII packet;

    for (const auto &segment_path : segment_paths)
    {
        AVFormatContextRAII segment;
        openSource(segment_path, segment);

        std::map<int, AVStream *> stream_map;
        for (const auto &entry : out_streams)
        {
            int index = MediaInput::findStream(segment.get(), entry.first);
            if (index >= 0)
                stream_map[index] = entry.second;
        }

        int64_t segment_end_us = offset_us;
        while (true)
        {
            int read_result = av_read_frame(segment.get(), packet.get());
            if (read_result < 0)
            {
                if (read_result != AVERROR_EOF)
                {
                    throwCompose("Could not read extract " + segment_path, read_result);
                }
                break;
            }

            AVPacket *pkt = packet.get();
            auto mapped = stream_map.find(pkt->stream_index);
            if (mapped == stream_map.end())
            {
                av_packet_unref(pkt);
                continue;
            }

            AVStream *in_stream = segment.get()->streams[pkt->stream_index];
            AVStream *out_stream = mapped->second;
            const int64_t shift = in_stream->start_time != AV_NOPTS_VALUE ? in_stream->start_time : 0;
            const int64_t offset = av_rescale_q(offset_us, AV_TIME_BASE_Q, out_stream->time_base);

            pkt->pts = shiftAndRescale(pkt->pts, shift, in_stream->time_base, out_stream->time_base);
            pkt->dts = shiftAndRescale(pkt->dts, shift, in_stream->time_base, out_stream->time_base);
            if (pkt->pts != AV_NOPTS_VALUE)
                pkt->pts += offset;
            if (pkt->dts != AV_NOPTS_VALUE)
                pkt->dts += offset;
            pkt->duration = av_rescale_q(pkt->duration, in_stream->time_base, out_stream->time_base);

            // Keep dts strictly increasing across extract boundaries
            auto last = last_dts.find(out_stream->index);
            if (pkt->dts != AV_NOPTS_VALUE)
            {
                if (last != last_dts.end() && pkt->dts <= last->second)
                    pkt->dts = last->second + 1;
                if (pkt->pts != AV_NOPTS_VALUE && pkt->pts < pkt->dts)
                    pkt->pts = pkt->dts;
                last_dts[out_stream->index] = pkt->dts;
            }

            int64_t end_ts = pkt->pts != AV_NOPTS_VALUE ? pkt->pts : pkt->dts;
            if (end_ts != AV_NOPTS_VALUE)
            {
                end_ts += pkt->duration;
                segment_end_us = std::max(segment_end_us, av_rescale_q(end_ts, out_stream->time_base, AV_TIME_BASE_Q));
            }

            pkt->stream_index = out_stream->index;
            pkt->pos = -1;
            writePacket(output.get(), pkt, output_path);
            av_packet_unref(pkt);
        }
        offset_us = segment_end_us;
    }

    writeTrailer(output, output_path);
}

CompositionResult VideoComposer::compose(const SourceVideo &source, const std::vector<SceneCandidate> &intervals,
                                         const ScratchDirectory &scratch, const CancellationToken *token) const
{
    checkIntervals(source, intervals);

    std::vector<SceneCandidate> clamped = intervals;
    for (auto &interval : clamped)
        interval.end = std::min(interval.end, source.duration_seconds);

    CompositionResult result;
    result.mode = chooseMode(source, clamped);
    result.output_path = scratch.filePath("summary." + options_.fileExtension());
    Logger::info("Composing " + std::to_string(clamped.size()) + " intervals of " + source.path + " (" +
                 getModeName(result.mode) + ")");

    std::vector<std::string> segment_paths;
    for (size_t i = 0; i < clamped.size(); ++i)
    {
        if (token)
            token->throwIfCancelled("composing interval " + std::to_string(i + 1));

        const SceneCandidate &interval = clamped[i];
        const std::string segment_path =
            scratch.filePath("segment_" + std::to_string(i) + "." + options_.fileExtension());
        ErrorRecovery::retryTransientCompose(
            [&]()
            {
                if (result.mode == ComposeMode::STREAM_COPY)
                    extractStreamCopy(source, interval, segment_path);
                else
                    extractReencode(source, interval, segment_path);
            },
            options_.max_retries, "extract interval " + std::to_string(i + 1), options_.retry_backoff_ms);
        segment_paths.push_back(segment_path);
    }

    if (token)
        token->throwIfCancelled("concatenating extracts");
    ErrorRecovery::retryTransientCompose([&]()
                                         { concatenate(segment_paths, result.output_path); },
                                         options_.max_retries, "concatenate extracts", options_.retry_backoff_ms);
    result.segments = segment_paths.size();

    try
    {
        result.duration_seconds = VideoProbe::probe(result.output_path).duration_seconds;
    }
    catch (const ResourceError &e)
    {
        throw ComposeError(std::string("Composed output is not playable: ") + e.what());
    }

    Logger::info("Composed " + result.output_path + " - " + std::to_string(result.duration_seconds) + "s from " +
                 std::to_string(result.segments) + " extracts");
    return result;
}
