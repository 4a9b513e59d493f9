#pragma once

#include "core/embedding/embedding_model.hpp"
#include "core/pipeline_settings.hpp"
#include <functional>
#include <memory>
#include <mutex>

/**
 * @brief Process-scoped, lazily loaded handle to the shared embedding model
 *
 * The first get() runs the factory; later calls return the same instance.
 * A factory that throws leaves the provider unloaded so the next job retries.
 */
class EmbeddingModelProvider
{
public:
    using Factory = std::function<std::shared_ptr<const EmbeddingModel>()>;

    explicit EmbeddingModelProvider(Factory factory);

    // Provider that loads the CLIP encoders named in settings
    static std::shared_ptr<EmbeddingModelProvider> forClip(const PipelineSettings &settings);

    // Provider around an already constructed model
    static std::shared_ptr<EmbeddingModelProvider> fromModel(std::shared_ptr<const EmbeddingModel> model);

    /**
     * @brief Load on first use
     * @throws ResourceError when the model cannot be loaded
     */
    std::shared_ptr<const EmbeddingModel> get();

    bool isLoaded() const;

private:
    Factory factory_;
    std::mutex load_mutex_;
    std::shared_ptr<const EmbeddingModel> model_;
    mutable std::mutex mutex_;
};
