#include "core/embedding/embedding_model_provider.hpp"
#include "core/embedding/onnx_clip_model.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"

EmbeddingModelProvider::EmbeddingModelProvider(Factory factory)
    : factory_(std::move(factory))
{
}

std::shared_ptr<EmbeddingModelProvider> EmbeddingModelProvider::forClip(const PipelineSettings &settings)
{
    OnnxClipOptions options;
    options.visual_model_path = settings.visual_model_path;
    options.text_model_path = settings.text_model_path;
    options.tokenizer_path = settings.tokenizer_path;
    options.intra_op_threads = settings.intra_op_threads;

    return std::make_shared<EmbeddingModelProvider>([options]() -> std::shared_ptr<const EmbeddingModel>
                                                    { return std::make_shared<OnnxClipModel>(options); });
}

std::shared_ptr<EmbeddingModelProvider> EmbeddingModelProvider::fromModel(std::shared_ptr<const EmbeddingModel> model)
{
    return std::make_shared<EmbeddingModelProvider>([model]()
                                                    { return model; });
}

std::shared_ptr<const EmbeddingModel> EmbeddingModelProvider::get()
{
    // Loads are serialized; a factory that throws leaves model_ empty for the next caller
    std::lock_guard<std::mutex> load_lock(load_mutex_);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (model_)
            return model_;
    }

    std::shared_ptr<const EmbeddingModel> model;
    try
    {
        model = factory_();
    }
    catch (const SummarizerError &)
    {
        throw;
    }
    catch (const std::exception &e)
    {
        throw ResourceError(std::string("Could not load embedding model: ") + e.what());
    }
    if (!model)
    {
        throw ResourceError("Embedding model factory returned no model");
    }
    Logger::info("Embedding model ready: " + model->name() + " (" + std::to_string(model->dimension()) + "-d)");

    std::lock_guard<std::mutex> lock(mutex_);
    model_ = std::move(model);
    return model_;
}

bool EmbeddingModelProvider::isLoaded() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return model_ != nullptr;
}
