#pragma once

#include <string>
#include <vector>
#include "core/summary_types.hpp"

/**
 * @brief Reads container and stream facts of a source video with libavformat
 */
class VideoProbe
{
public:
    /**
     * @brief Open the source and describe it
     * @param path Source video path
     * @return Duration, frame rate, resolution, container and codec facts
     * @throws ResourceError when the file is missing, has no video stream,
     *         has no usable duration, or no frame of it can be decoded
     */
    static SourceVideo probe(const std::string &path);

    /**
     * @brief Presentation times of video key frames, ascending, in seconds from the start
     * @throws ResourceError when the file cannot be opened
     */
    static std::vector<double> keyframeTimes(const std::string &path);
};
