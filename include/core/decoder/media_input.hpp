#ifndef MEDIA_INPUT_HPP
#define MEDIA_INPUT_HPP

#include <string>
#include "core/external_library_wrappers.hpp"

/**
 * @brief libavformat/libavcodec opening steps shared by probing, sampling and composing
 *
 * Failures are reported as ResourceError with the libav error text.
 */
class MediaInput
{
public:
    // avformat_open_input + avformat_find_stream_info
    static void open(const std::string &path, AVFormatContextRAII &format_ctx);

    /**
     * @brief Index of the best stream of the given type
     * @return The index, or -1 when the file has none
     */
    static int findStream(AVFormatContext *format_ctx, AVMediaType type);

    /**
     * @brief Allocate and open a decoder for one stream
     * @param threads Decoder thread count, 0 lets libavcodec choose
     */
    static void openDecoder(AVFormatContext *format_ctx, int stream_index, AVCodecContextRAII &codec_ctx,
                            int threads = 0);

    // Stream start time in seconds, 0 when unknown
    static double startSeconds(const AVStream *stream);

    /**
     * @brief Seconds from the stream start of a frame, AV_NOPTS_VALUE mapped to -1
     */
    static double frameSeconds(const AVStream *stream, const AVFrame *frame);

    static double frameRate(AVFormatContext *format_ctx, AVStream *stream);
};

#endif // MEDIA_INPUT_HPP
