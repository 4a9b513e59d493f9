#include "core/embedding/embedding_engine.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cmath>

EmbeddingEngine::EmbeddingEngine(std::shared_ptr<const EmbeddingModel> model, int batch_size)
    : model_(std::move(model)), batch_size_(std::max(1, batch_size))
{
    if (!model_)
    {
        throw ResourceError("Embedding engine requires a model");
    }
}

void EmbeddingEngine::normalize(std::vector<float> &vector)
{
    double norm = 0.0;
    for (float value : vector)
        norm += static_cast<double>(value) * value;
    norm = std::sqrt(norm);
    if (norm <= 0.0)
        return;
    for (float &value : vector)
        value = static_cast<float>(value / norm);
}

double EmbeddingEngine::rawCosine(const std::vector<float> &a, const std::vector<float> &b)
{
    if (a.size() != b.size() || a.empty())
    {
        throw SummarizerError(ErrorKind::INTERNAL, "Embedding dimension mismatch: " + std::to_string(a.size()) +
                                                       " vs " + std::to_string(b.size()));
    }

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i)
    {
        dot += static_cast<double>(a[i]) * b[i];
        norm_a += static_cast<double>(a[i]) * a[i];
        norm_b += static_cast<double>(b[i]) * b[i];
    }
    if (norm_a <= 0.0 || norm_b <= 0.0)
        return 0.0;
    return std::clamp(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)), -1.0, 1.0);
}

double EmbeddingEngine::similarity(const std::vector<float> &a, const std::vector<float> &b)
{
    return std::max(0.0, rawCosine(a, b));
}

std::vector<FrameSample> EmbeddingEngine::embedFrames(const std::vector<DecodedFrame> &frames) const
{
    std::vector<FrameSample> samples;
    samples.reserve(frames.size());

    for (size_t offset = 0; offset < frames.size(); offset += batch_size_)
    {
        const size_t end = std::min(frames.size(), offset + static_cast<size_t>(batch_size_));
        std::vector<cv::Mat> batch;
        batch.reserve(end - offset);
        for (size_t i = offset; i < end; ++i)
            batch.push_back(frames[i].image);

        auto vectors = model_->encodeImages(batch);
        if (vectors.size() != batch.size())
        {
            throw SummarizerError(ErrorKind::INTERNAL, "Model returned " + std::to_string(vectors.size()) +
                                                           " embeddings for " + std::to_string(batch.size()) +
                                                           " frames");
        }
        for (size_t i = 0; i < vectors.size(); ++i)
        {
            normalize(vectors[i]);
            samples.push_back(FrameSample{frames[offset + i].timestamp, std::move(vectors[i])});
        }
    }

    Logger::trace("Embedded " + std::to_string(samples.size()) + " frames");
    return samples;
}

std::vector<float> EmbeddingEngine::embedText(const std::string &query) const
{
    auto vectors = model_->encodeTexts({query});
    if (vectors.size() != 1)
    {
        throw SummarizerError(ErrorKind::INTERNAL, "Model returned no text embedding");
    }
    normalize(vectors.front());
    return vectors.front();
}

std::vector<float> EmbeddingEngine::embedPrompts(const std::vector<std::string> &prompts) const
{
    if (prompts.empty())
    {
        throw ValidationError("At least one prompt is required");
    }

    auto vectors = model_->encodeTexts(prompts);
    if (vectors.size() != prompts.size())
    {
        throw SummarizerError(ErrorKind::INTERNAL, "Model returned " + std::to_string(vectors.size()) +
                                                       " embeddings for " + std::to_string(prompts.size()) +
                                                       " prompts");
    }

    std::vector<float> mean(vectors.front().size(), 0.0f);
    for (auto &vector : vectors)
    {
        if (vector.size() != mean.size())
        {
            throw SummarizerError(ErrorKind::INTERNAL, "Prompt embeddings differ in dimension");
        }
        normalize(vector);
        for (size_t i = 0; i < mean.size(); ++i)
            mean[i] += vector[i] / static_cast<float>(vectors.size());
    }
    normalize(mean);
    return mean;
}

std::vector<ScoredFrame> EmbeddingEngine::scoreFrames(const std::vector<FrameSample> &samples,
                                                      const std::vector<float> &query) const
{
    std::vector<ScoredFrame> scores;
    scores.reserve(samples.size());
    for (const auto &sample : samples)
    {
        scores.push_back(ScoredFrame{sample.timestamp, similarity(sample.embedding, query)});
    }
    return scores;
}
