#include "core/embedding/onnx_clip_model.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>

namespace
{
    const float kClipMean[3] = {0.48145466f, 0.4578275f, 0.40821073f};
    const float kClipStd[3] = {0.26862954f, 0.26130258f, 0.27577711f};

    template <typename T>
    Ort::Value makeIdTensor(const Ort::MemoryInfo &memory_info, std::vector<T> &buffer,
                            const std::vector<int64_t> &shape)
    {
        return Ort::Value::CreateTensor<T>(memory_info, buffer.data(), buffer.size(), shape.data(), shape.size());
    }
}

OnnxClipModel::OnnxClipModel(const OnnxClipOptions &options)
    : options_(options), env_(ORT_LOGGING_LEVEL_WARNING, "video_summarizer")
{
    tokenizer_ = std::make_unique<ClipTokenizer>(options_.tokenizer_path);

    try
    {
        Ort::SessionOptions session_options;
        session_options.SetIntraOpNumThreads(std::max(1, options_.intra_op_threads));
        session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        visual_session_ = openSession(options_.visual_model_path, session_options);
        text_session_ = openSession(options_.text_model_path, session_options);
        visual_info_ = describeSession(*visual_session_, "image_embeds");
        text_info_ = describeSession(*text_session_, "text_embeds");
    }
    catch (const Ort::Exception &e)
    {
        throw ResourceError(std::string("ONNX Runtime could not load CLIP model: ") + e.what());
    }

    if (visual_info_.input_names.empty() || text_info_.input_names.empty())
    {
        throw ResourceError("CLIP model has no inputs");
    }

    if (text_info_.output_dim > 0)
    {
        dimension_ = static_cast<std::size_t>(text_info_.output_dim);
    }
    else if (visual_info_.output_dim > 0)
    {
        dimension_ = static_cast<std::size_t>(visual_info_.output_dim);
    }
    else
    {
        // Dynamic output shape: ask the text encoder once
        dimension_ = encodeTexts({"a photo"}).front().size();
    }

    Logger::info("CLIP model loaded (" + std::to_string(dimension_) + "-d): " + options_.visual_model_path + ", " +
                 options_.text_model_path);
}

std::unique_ptr<Ort::Session> OnnxClipModel::openSession(const std::string &path,
                                                         Ort::SessionOptions &options)
{
    if (!std::filesystem::exists(path))
    {
        throw ResourceError("Model file not found: " + path);
    }
    Logger::debug("Loading ONNX model: " + path);
    return std::make_unique<Ort::Session>(env_, path.c_str(), options);
}

OnnxClipModel::SessionInfo OnnxClipModel::describeSession(Ort::Session &session, const std::string &preferred_output)
{
    SessionInfo info;
    Ort::AllocatorWithDefaultOptions allocator;

    for (size_t i = 0; i < session.GetInputCount(); ++i)
    {
        auto input_name = session.GetInputNameAllocated(i, allocator);
        info.input_names.emplace_back(input_name.get());
        Ort::TypeInfo type_info = session.GetInputTypeInfo(i);
        info.input_types.push_back(type_info.GetTensorTypeAndShapeInfo().GetElementType());
    }

    size_t output_index = 0;
    for (size_t i = 0; i < session.GetOutputCount(); ++i)
    {
        auto output_name = session.GetOutputNameAllocated(i, allocator);
        if (preferred_output == output_name.get())
        {
            output_index = i;
            break;
        }
    }
    if (session.GetOutputCount() > 0)
    {
        info.output_name = session.GetOutputNameAllocated(output_index, allocator).get();
        Ort::TypeInfo type_info = session.GetOutputTypeInfo(output_index);
        auto shape = type_info.GetTensorTypeAndShapeInfo().GetShape();
        if (!shape.empty())
            info.output_dim = shape.back();
    }
    else
    {
        throw ResourceError("CLIP model has no outputs");
    }
    return info;
}

void OnnxClipModel::preprocess(const cv::Mat &image, std::vector<float> &tensor) const
{
    if (image.empty() || image.type() != CV_8UC3)
    {
        throw ResourceError("CLIP preprocessing expects a non-empty RGB image");
    }

    const int size = options_.image_size;
    const double scale = static_cast<double>(size) / std::min(image.cols, image.rows);
    const int resized_width = std::max(size, static_cast<int>(std::lround(image.cols * scale)));
    const int resized_height = std::max(size, static_cast<int>(std::lround(image.rows * scale)));

    cv::Mat resized;
    cv::resize(image, resized, cv::Size(resized_width, resized_height), 0, 0, cv::INTER_CUBIC);

    const int x = (resized_width - size) / 2;
    const int y = (resized_height - size) / 2;
    cv::Mat cropped = resized(cv::Rect(x, y, size, size));

    cv::Mat as_float;
    cropped.convertTo(as_float, CV_32FC3, 1.0 / 255.0);

    const size_t plane = static_cast<size_t>(size) * size;
    const size_t offset = tensor.size();
    tensor.resize(offset + 3 * plane);
    for (int row = 0; row < size; ++row)
    {
        const cv::Vec3f *pixels = as_float.ptr<cv::Vec3f>(row);
        for (int col = 0; col < size; ++col)
        {
            const size_t index = static_cast<size_t>(row) * size + col;
            for (int c = 0; c < 3; ++c)
            {
                tensor[offset + c * plane + index] = (pixels[col][c] - kClipMean[c]) / kClipStd[c];
            }
        }
    }
}

std::vector<std::vector<float>> OnnxClipModel::unpackEmbeddings(Ort::Value &output, std::size_t batch)
{
    auto shape = output.GetTensorTypeAndShapeInfo().GetShape();
    if (shape.size() != 2 || shape[0] != static_cast<int64_t>(batch) || shape[1] <= 0)
    {
        throw ResourceError("Unexpected CLIP output shape");
    }

    const float *data = output.GetTensorData<float>();
    const size_t dim = static_cast<size_t>(shape[1]);
    std::vector<std::vector<float>> vectors(batch);
    for (size_t i = 0; i < batch; ++i)
    {
        vectors[i].assign(data + i * dim, data + (i + 1) * dim);
    }
    return vectors;
}

std::vector<std::vector<float>> OnnxClipModel::encodeImages(const std::vector<cv::Mat> &images) const
{
    if (images.empty())
        return {};

    std::vector<float> pixels;
    pixels.reserve(images.size() * 3 * options_.image_size * options_.image_size);
    for (const auto &image : images)
    {
        preprocess(image, pixels);
    }

    const std::vector<int64_t> shape = {static_cast<int64_t>(images.size()), 3, options_.image_size,
                                        options_.image_size};
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    Ort::Value input = Ort::Value::CreateTensor<float>(memory_info, pixels.data(), pixels.size(), shape.data(),
                                                       shape.size());

    const char *input_name = visual_info_.input_names.front().c_str();
    const char *output_name = visual_info_.output_name.c_str();
    try
    {
        auto outputs = visual_session_->Run(Ort::RunOptions{nullptr}, &input_name, &input, 1, &output_name, 1);
        return unpackEmbeddings(outputs.front(), images.size());
    }
    catch (const Ort::Exception &e)
    {
        throw ResourceError(std::string("CLIP image encoder failed: ") + e.what());
    }
}

std::vector<std::vector<float>> OnnxClipModel::encodeTexts(const std::vector<std::string> &texts) const
{
    if (texts.empty())
        return {};

    const int64_t batch = static_cast<int64_t>(texts.size());
    const int64_t context = static_cast<int64_t>(ClipTokenizer::kContextLength);

    std::vector<int64_t> ids;
    std::vector<int64_t> mask;
    ids.reserve(batch * context);
    mask.reserve(batch * context);
    for (const auto &text : texts)
    {
        auto encoded = tokenizer_->encode(text);
        bool past_end = false;
        for (int64_t id : encoded)
        {
            ids.push_back(id);
            mask.push_back(past_end ? 0 : 1);
            if (id == tokenizer_->endOfTextId())
                past_end = true;
        }
    }

    std::vector<int32_t> ids32(ids.begin(), ids.end());
    std::vector<int32_t> mask32(mask.begin(), mask.end());
    const std::vector<int64_t> shape = {batch, context};
    Ort::MemoryInfo memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);

    std::vector<Ort::Value> inputs;
    std::vector<const char *> input_names;
    for (size_t i = 0; i < text_info_.input_names.size(); ++i)
    {
        const std::string &input_name = text_info_.input_names[i];
        const bool is_mask = input_name.find("mask") != std::string::npos;
        const bool wide = text_info_.input_types[i] == ONNX_TENSOR_ELEMENT_DATA_TYPE_INT64;
        if (wide)
            inputs.push_back(makeIdTensor(memory_info, is_mask ? mask : ids, shape));
        else
            inputs.push_back(makeIdTensor(memory_info, is_mask ? mask32 : ids32, shape));
        input_names.push_back(input_name.c_str());
    }

    const char *output_name = text_info_.output_name.c_str();
    try
    {
        auto outputs = text_session_->Run(Ort::RunOptions{nullptr}, input_names.data(), inputs.data(), inputs.size(),
                                          &output_name, 1);
        return unpackEmbeddings(outputs.front(), texts.size());
    }
    catch (const Ort::Exception &e)
    {
        throw ResourceError(std::string("CLIP text encoder failed: ") + e.what());
    }
}
