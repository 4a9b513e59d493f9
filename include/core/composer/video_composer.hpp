#pragma once

#include "core/cancellation_token.hpp"
#include "core/file_utils.hpp"
#include "core/pipeline_settings.hpp"
#include "core/summary_types.hpp"
#include <string>
#include <vector>

struct ComposerOptions
{
    std::string output_format = "mp4"; // libavformat muxer name
    bool prefer_stream_copy = true;
    int max_retries = 3;
    int retry_backoff_ms = 100;

    static ComposerOptions fromSettings(const PipelineSettings &settings);

    // File extension for the muxer, e.g. "mkv" for matroska
    std::string fileExtension() const;
};

enum class ComposeMode
{
    STREAM_COPY,
    REENCODE
};

struct CompositionResult
{
    std::string output_path;
    double duration_seconds = 0.0;
    ComposeMode mode = ComposeMode::REENCODE;
    std::size_t segments = 0;
};

/**
 * @brief Cuts intervals out of a source video and joins them into one file
 *
 * Each interval is extracted into the scratch directory, either by copying
 * packets from the key frame at its start or by decoding and re-encoding it,
 * and the extracts are then remuxed into one output with continuous timestamps.
 */
class VideoComposer
{
public:
    explicit VideoComposer(const ComposerOptions &options);

    /**
     * @brief Compose the summary video
     * @param source Probed source video
     * @param intervals Sorted, non-overlapping intervals in seconds
     * @param scratch Job scratch directory receiving extracts and the output
     * @param token Checked between intervals
     * @return Output path (inside scratch) and its measured duration
     * @throws ComposeError when extraction or concatenation fails
     * @throws CancelledError when the token is set between intervals
     */
    CompositionResult compose(const SourceVideo &source, const std::vector<SceneCandidate> &intervals,
                              const ScratchDirectory &scratch, const CancellationToken *token = nullptr) const;

    /**
     * @brief Stream copy when allowed, codecs fit the container and every interval starts on a key frame
     */
    ComposeMode chooseMode(const SourceVideo &source, const std::vector<SceneCandidate> &intervals) const;

    static std::string getModeName(ComposeMode mode);

private:
    void checkIntervals(const SourceVideo &source, const std::vector<SceneCandidate> &intervals) const;
    void extractStreamCopy(const SourceVideo &source, const SceneCandidate &interval,
                           const std::string &segment_path) const;
    void extractReencode(const SourceVideo &source, const SceneCandidate &interval,
                         const std::string &segment_path) const;
    void concatenate(const std::vector<std::string> &segment_paths, const std::string &output_path) const;

    ComposerOptions options_;
};
