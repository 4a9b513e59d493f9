#pragma once

#include <cstddef>
#include <string>
#include <opencv2/core.hpp>
#include "core/cancellation_token.hpp"
#include "core/external_library_wrappers.hpp"
#include "core/summary_types.hpp"

/**
 * @brief A decoded RGB frame and its time from the start of the video
 */
struct DecodedFrame
{
    double timestamp = 0.0;
    cv::Mat image; // CV_8UC3, RGB order
};

struct SamplingOptions
{
    int stride_frames = 30;
    double stride_seconds = 0.0; // takes precedence when positive
    int max_frame_side = 448;    // shorter image side is scaled down to this, 0 disables
};

/**
 * @brief Lazy, finite, restartable sequence of frames sampled at a fixed stride
 *
 * Frames are decoded sequentially; the first decoded frame at or after each
 * multiple of the step is yielded. Individual undecodable or corrupt frames
 * are skipped with a warning.
 */
class FrameSampler
{
public:
    /**
     * @param source Probed source video
     * @param options Stride and output size
     * @param token Checked between frames; a cancelled token ends the sequence
     * @throws ResourceError when the source cannot be opened for decoding
     */
    FrameSampler(const SourceVideo &source, const SamplingOptions &options,
                 const CancellationToken *token = nullptr);

    FrameSampler(const FrameSampler &) = delete;
    FrameSampler &operator=(const FrameSampler &) = delete;

    /**
     * @brief Produce the next sampled frame
     * @param frame Receives the frame
     * @return false at the end of the sequence
     * @throws ResourceError if the stream ends without a single decodable frame
     */
    bool next(DecodedFrame &frame);

    /**
     * @brief Rewind to the start of the video
     */
    void reset();

    // Seconds between consecutive samples
    double step() const { return step_; }

    size_t sampledFrames() const { return sampled_frames_; }
    size_t skippedFrames() const { return skipped_frames_; }

private:
    bool decodeNextFrame();
    cv::Mat toRgb(const AVFrame *frame);

    SourceVideo source_;
    SamplingOptions options_;
    const CancellationToken *token_;
    double step_;

    AVFormatContextRAII format_ctx_;
    AVCodecContextRAII codec_ctx_;
    AVFrameRAII frame_;
    AVPacketRAII packet_;
    SwsContextRAII sws_ctx_;
    int stream_index_ = -1;

    double next_target_ = 0.0;
    bool draining_ = false;
    bool finished_ = false;
    size_t decoded_frames_ = 0;
    size_t sampled_frames_ = 0;
    size_t skipped_frames_ = 0;
};
