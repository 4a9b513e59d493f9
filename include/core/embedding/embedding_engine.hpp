#pragma once

#include "core/decoder/frame_sampler.hpp"
#include "core/embedding/embedding_model.hpp"
#include "core/summary_types.hpp"
#include <memory>
#include <string>
#include <vector>

/**
 * @brief Maps frames and text into the model's vector space and scores them
 *
 * Every vector leaving the engine is L2-normalized.
 */
class EmbeddingEngine
{
public:
    EmbeddingEngine(std::shared_ptr<const EmbeddingModel> model, int batch_size = 16);

    /**
     * @brief Embed decoded frames in batches of batch_size
     * @return One FrameSample per frame, in input order
     */
    std::vector<FrameSample> embedFrames(const std::vector<DecodedFrame> &frames) const;

    std::vector<float> embedText(const std::string &query) const;

    /**
     * @brief Prompt ensemble: mean of the normalized prompt embeddings, renormalized
     * @throws ValidationError when prompts is empty
     */
    std::vector<float> embedPrompts(const std::vector<std::string> &prompts) const;

    /**
     * @brief Score every sample against a query embedding
     */
    std::vector<ScoredFrame> scoreFrames(const std::vector<FrameSample> &samples,
                                         const std::vector<float> &query) const;

    // Cosine similarity in [-1, 1]
    static double rawCosine(const std::vector<float> &a, const std::vector<float> &b);

    // Cosine similarity with negatives clamped to 0
    static double similarity(const std::vector<float> &a, const std::vector<float> &b);

    static void normalize(std::vector<float> &vector);

    std::size_t dimension() const { return model_->dimension(); }
    int batchSize() const { return batch_size_; }

private:
    std::shared_ptr<const EmbeddingModel> model_;
    int batch_size_;
};
