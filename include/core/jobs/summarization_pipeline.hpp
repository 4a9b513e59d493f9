#pragma once

#include "core/cancellation_token.hpp"
#include "core/decoder/frame_sampler.hpp"
#include "core/embedding/embedding_model_provider.hpp"
#include "core/pipeline_settings.hpp"
#include "core/scenes/scene_selector.hpp"
#include "core/storage/artifact_store.hpp"
#include "core/summary_types.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Progress checkpoints recorded on a job
 */
struct ProgressCheckpoints
{
    static constexpr int kSourceOpened = 10;
    static constexpr int kFramesSampled = 20;
    static constexpr int kFramesEmbedded = 40;
    static constexpr int kScenesMatched = 60;
    static constexpr int kScenesSelected = 80;
    static constexpr int kArtifactStored = 90;

    static constexpr int kRangesMapped = 30;
    static constexpr int kRangesComposing = 60;
    static constexpr int kRangesStored = 80;

    static constexpr int kCompleted = 100;
};

/**
 * @brief What a successful run hands back to the orchestrator
 */
struct PipelineOutcome
{
    std::vector<SceneCandidate> selected_scenes;
    ArtifactRef artifact;
};

/**
 * @brief Runs one job end to end on the calling thread
 *
 * probe -> (sample + embed -> aggregate) -> select -> compose -> store.
 * Time-range requests skip the embedding stages and never load the model.
 * The job's scratch directory lives for the duration of run() and is gone
 * when it returns or throws.
 */
class SummarizationPipeline
{
public:
    using ProgressCallback = std::function<void(int percent)>;

    SummarizationPipeline(const PipelineSettings &settings, std::shared_ptr<EmbeddingModelProvider> models,
                          std::shared_ptr<ArtifactStore> artifacts);

    /**
     * @brief Summarize one source video
     * @param job_id Names the scratch directory and the stored artifact
     * @param source_path Source video
     * @param selection Selection request of the job
     * @param token Checked at every stage boundary
     * @param on_progress Called with each checkpoint reached
     * @throws ResourceError, NoMatchError, ComposeError, CancelledError
     */
    PipelineOutcome run(const std::string &job_id, const std::string &source_path, const SelectionRequest &selection,
                        const CancellationToken &token, const ProgressCallback &on_progress) const;

    const PipelineSettings &settings() const { return settings_; }

    static SamplingOptions samplingOptions(const PipelineSettings &settings);

private:
    std::vector<SceneCandidate> matchScenes(const SourceVideo &source, const SceneSelectionStrategy &selector,
                                            const CancellationToken &token,
                                            const ProgressCallback &on_progress) const;

    PipelineSettings settings_;
    std::shared_ptr<EmbeddingModelProvider> models_;
    std::shared_ptr<ArtifactStore> artifacts_;
};
