#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

/**
 * @brief Read-only multimodal encoder mapping images and text into one vector space
 *
 * Implementations must allow concurrent calls from several jobs and must
 * not change state per request.
 */
class EmbeddingModel
{
public:
    virtual ~EmbeddingModel() = default;

    virtual std::string name() const = 0;

    // Length of every vector returned by the encoders
    virtual std::size_t dimension() const = 0;

    /**
     * @brief Encode a batch of RGB images (CV_8UC3)
     * @return One vector per image, in input order, not necessarily normalized
     */
    virtual std::vector<std::vector<float>> encodeImages(const std::vector<cv::Mat> &images) const = 0;

    /**
     * @brief Encode a batch of text queries
     * @return One vector per text, in input order, not necessarily normalized
     */
    virtual std::vector<std::vector<float>> encodeTexts(const std::vector<std::string> &texts) const = 0;
};
