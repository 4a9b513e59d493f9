#pragma once

#include "core/embedding/clip_tokenizer.hpp"
#include "core/embedding/embedding_model.hpp"
#include <onnxruntime_cxx_api.h>
#include <memory>
#include <string>
#include <vector>

struct OnnxClipOptions
{
    std::string visual_model_path;
    std::string text_model_path;
    std::string tokenizer_path;
    int intra_op_threads = 2;
    int image_size = 224;
};

/**
 * @brief CLIP image and text encoders run as two ONNX Runtime sessions
 *
 * Session::Run is safe to call concurrently, so one instance serves every job.
 */
class OnnxClipModel : public EmbeddingModel
{
public:
    /**
     * @brief Load both encoders and the tokenizer
     * @throws ResourceError when a model file is missing or ONNX Runtime rejects it
     */
    explicit OnnxClipModel(const OnnxClipOptions &options);

    std::string name() const override { return "clip-onnx"; }
    std::size_t dimension() const override { return dimension_; }

    std::vector<std::vector<float>> encodeImages(const std::vector<cv::Mat> &images) const override;
    std::vector<std::vector<float>> encodeTexts(const std::vector<std::string> &texts) const override;

private:
    struct SessionInfo
    {
        std::vector<std::string> input_names;
        std::vector<ONNXTensorElementDataType> input_types;
        std::string output_name;
        int64_t output_dim = -1;
    };

    std::unique_ptr<Ort::Session> openSession(const std::string &path, Ort::SessionOptions &options);
    static SessionInfo describeSession(Ort::Session &session, const std::string &preferred_output);
    static std::vector<std::vector<float>> unpackEmbeddings(Ort::Value &output, std::size_t batch);

    // RGB CV_8UC3 -> CLIP-normalized planar floats appended to tensor
    void preprocess(const cv::Mat &image, std::vector<float> &tensor) const;

    OnnxClipOptions options_;
    Ort::Env env_;
    std::unique_ptr<Ort::Session> visual_session_;
    std::unique_ptr<Ort::Session> text_session_;
    SessionInfo visual_info_;
    SessionInfo text_info_;
    std::unique_ptr<ClipTokenizer> tokenizer_;
    std::size_t dimension_ = 0;
};
