#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/embedding/embedding_model.hpp"

/**
 * @brief Three-dimensional stand-in for CLIP
 *
 * An image maps to its mean (R, G, B); a text maps through a fixed table, so
 * a test picks frame colors to get exact similarity scores. Unknown texts map
 * to pure red.
 */
class FakeEmbeddingModel : public EmbeddingModel
{
public:
    explicit FakeEmbeddingModel(std::map<std::string, std::vector<float>> texts = {})
        : texts_(std::move(texts))
    {
    }

    std::string name() const override { return "fake-color"; }
    std::size_t dimension() const override { return 3; }

    std::vector<std::vector<float>> encodeImages(const std::vector<cv::Mat> &images) const override
    {
        image_calls_ += images.size();
        ++image_batches_;
        std::vector<std::vector<float>> vectors;
        for (const auto &image : images)
        {
            cv::Scalar mean = cv::mean(image);
            vectors.push_back({static_cast<float>(mean[0]), static_cast<float>(mean[1]),
                               static_cast<float>(mean[2])});
        }
        return vectors;
    }

    std::vector<std::vector<float>> encodeTexts(const std::vector<std::string> &texts) const override
    {
        text_calls_ += texts.size();
        std::vector<std::vector<float>> vectors;
        for (const auto &text : texts)
        {
            auto it = texts_.find(text);
            vectors.push_back(it != texts_.end() ? it->second : std::vector<float>{1.0f, 0.0f, 0.0f});
        }
        return vectors;
    }

    size_t imageCalls() const { return image_calls_.load(); }
    size_t imageBatches() const { return image_batches_.load(); }
    size_t textCalls() const { return text_calls_.load(); }

private:
    std::map<std::string, std::vector<float>> texts_;
    mutable std::atomic<size_t> image_calls_{0};
    mutable std::atomic<size_t> image_batches_{0};
    mutable std::atomic<size_t> text_calls_{0};
};

/**
 * @brief Fake model whose image encoder holds the calling job until released
 *
 * Lets a test act on a job while it is known to be processing.
 */
class GatedEmbeddingModel : public FakeEmbeddingModel
{
public:
    std::vector<std::vector<float>> encodeImages(const std::vector<cv::Mat> &images) const override
    {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            entered_ = true;
            changed_.notify_all();
            changed_.wait_for(lock, std::chrono::seconds(30), [this]()
                              { return released_; });
        }
        return FakeEmbeddingModel::encodeImages(images);
    }

    // Wait until a job is inside the encoder
    bool waitUntilEntered(std::chrono::milliseconds timeout = std::chrono::seconds(30)) const
    {
        std::unique_lock<std::mutex> lock(mutex_);
        return changed_.wait_for(lock, timeout, [this]()
                                 { return entered_; });
    }

    void release()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        changed_.notify_all();
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable changed_;
    mutable bool entered_ = false;
    bool released_ = false;
};
