#include "core/jobs/summarization_pipeline.hpp"
#include "core/composer/video_composer.hpp"
#include "core/decoder/video_probe.hpp"
#include "core/embedding/embedding_engine.hpp"
#include "core/error_types.hpp"
#include "core/file_utils.hpp"
#include "core/scenes/scene_aggregator.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace
{
    std::string formatSeconds(double seconds)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(2) << seconds << "s";
        return out.str();
    }
}

SummarizationPipeline::SummarizationPipeline(const PipelineSettings &settings,
                                             std::shared_ptr<EmbeddingModelProvider> models,
                                             std::shared_ptr<ArtifactStore> artifacts)
    : settings_(settings), models_(std::move(models)), artifacts_(std::move(artifacts))
{
    if (!artifacts_)
    {
        throw SummarizerError(ErrorKind::INTERNAL, "Summarization pipeline needs an artifact store");
    }
}

SamplingOptions SummarizationPipeline::samplingOptions(const PipelineSettings &settings)
{
    SamplingOptions options;
    options.stride_frames = settings.stride_frames;
    options.stride_seconds = settings.stride_seconds;
    options.max_frame_side = settings.max_frame_side;
    return options;
}

PipelineOutcome SummarizationPipeline::run(const std::string &job_id, const std::string &source_path,
                                           const SelectionRequest &selection, const CancellationToken &token,
                                           const ProgressCallback &on_progress) const
{
    auto report = [&on_progress](int percent)
    {
        if (on_progress)
            on_progress(percent);
    };

    auto selector = SceneSelectorFactory::create(selection, SelectionOptions::fromSettings(settings_));
    const bool semantic = selector->usesEmbeddings();

    token.throwIfCancelled("opening the source");
    SourceVideo source = VideoProbe::probe(source_path);
    Logger::info("Job " + job_id + ": source " + source.path + " is " + formatSeconds(source.duration_seconds) +
                 " " + std::to_string(source.width) + "x" + std::to_string(source.height) + " " +
                 source.video_codec);
    report(ProgressCheckpoints::kSourceOpened);

    PipelineOutcome outcome;
    if (semantic)
    {
        auto candidates = matchScenes(source, *selector, token, report);
        report(ProgressCheckpoints::kScenesMatched);

        token.throwIfCancelled("scene selection");
        SelectionInput input;
        input.candidates = std::move(candidates);
        input.source_duration = source.duration_seconds;
        outcome.selected_scenes = selector->select(input);
        report(ProgressCheckpoints::kScenesSelected);
    }
    else
    {
        SelectionInput input;
        input.source_duration = source.duration_seconds;
        outcome.selected_scenes = selector->select(input);
        report(ProgressCheckpoints::kRangesMapped);
    }

    double selected_total = 0.0;
    for (const auto &scene : outcome.selected_scenes)
        selected_total += scene.duration();
    Logger::info("Job " + job_id + ": selected " + std::to_string(outcome.selected_scenes.size()) +
                 " scenes, " + formatSeconds(selected_total));

    token.throwIfCancelled("composition");
    if (!semantic)
        report(ProgressCheckpoints::kRangesComposing);

    ScratchDirectory scratch(settings_.scratch_dir, job_id);
    VideoComposer composer(ComposerOptions::fromSettings(settings_));
    CompositionResult composed = composer.compose(source, outcome.selected_scenes, scratch, &token);

    token.throwIfCancelled("artifact upload");
    outcome.artifact = artifacts_->store(job_id, composed.output_path, composed.duration_seconds);
    scratch.release();
    report(semantic ? ProgressCheckpoints::kArtifactStored : ProgressCheckpoints::kRangesStored);

    Logger::info("Job " + job_id + ": stored " + outcome.artifact.uri + " (" +
                 formatSeconds(outcome.artifact.duration_seconds) + ", " +
                 VideoComposer::getModeName(composed.mode) + ")");
    return outcome;
}

std::vector<SceneCandidate> SummarizationPipeline::matchScenes(const SourceVideo &source,
                                                               const SceneSelectionStrategy &selector,
                                                               const CancellationToken &token,
                                                               const ProgressCallback &on_progress) const
{
    if (!models_)
    {
        throw ResourceError("No embedding model is configured");
    }

    token.throwIfCancelled("frame sampling");
    EmbeddingEngine engine(models_->get(), settings_.embedding_batch_size);
    const std::vector<float> query = engine.embedPrompts(selector.prompts());

    FrameSampler sampler(source, samplingOptions(settings_), &token);
    std::vector<ScoredFrame> scores;
    std::vector<DecodedFrame> batch;
    batch.reserve(static_cast<size_t>(engine.batchSize()));

    // Sampling and embedding are interleaved batch by batch; progress moves
    // through the sampled..embedded span with the position in the video.
    int last_reported = ProgressCheckpoints::kSourceOpened;
    auto flush = [&]()
    {
        if (batch.empty())
            return;
        auto samples = engine.embedFrames(batch);
        auto scored = engine.scoreFrames(samples, query);
        scores.insert(scores.end(), scored.begin(), scored.end());

        const double position = std::min(1.0, batch.back().timestamp / source.duration_seconds);
        const int span = ProgressCheckpoints::kFramesEmbedded - ProgressCheckpoints::kFramesSampled;
        const int percent = ProgressCheckpoints::kFramesSampled + static_cast<int>(std::floor(position * (span - 1)));
        if (percent > last_reported && on_progress)
        {
            on_progress(percent);
            last_reported = percent;
        }
        batch.clear();
    };

    DecodedFrame frame;
    while (sampler.next(frame))
    {
        batch.push_back(std::move(frame));
        frame = DecodedFrame();
        if (batch.size() >= static_cast<size_t>(engine.batchSize()))
            flush();
    }
    token.throwIfCancelled("frame embedding");
    flush();

    Logger::debug("Sampled " + std::to_string(sampler.sampledFrames()) + " frames every " +
                  formatSeconds(sampler.step()) + ", skipped " + std::to_string(sampler.skippedFrames()));
    if (on_progress)
        on_progress(ProgressCheckpoints::kFramesEmbedded);

    token.throwIfCancelled("scene matching");
    SceneAggregator aggregator(settings_.similarity_threshold, settings_.min_scene_seconds,
                               settings_.merge_gap_seconds);
    auto candidates = aggregator.aggregate(std::move(scores), sampler.step(), source.duration_seconds,
                                           selector.label());
    Logger::debug("Matched " + std::to_string(candidates.size()) + " candidate scenes for '" + selector.label() +
                  "'");
    return candidates;
}
