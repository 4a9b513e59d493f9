#pragma once

#include <gtest/gtest.h>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>
#include "core/pipeline_settings.hpp"
#include "logging/logger.hpp"

/**
 * @brief A stretch of synthetic video filled with one RGB color
 */
struct ColorSegment
{
    double seconds;
    cv::Scalar rgb;
};

/**
 * @brief Base class for tests that need a private directory and generated media
 */
class TestBase : public ::testing::Test
{
protected:
    void SetUp() override
    {
        const auto *info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = std::string(info->test_suite_name()) + "_" + info->name();
        for (auto &c : name)
        {
            if (!std::isalnum(static_cast<unsigned char>(c)))
                c = '_';
        }
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("video_summarizer_" + name + "_" + std::to_string(getpid()));
        std::filesystem::remove_all(test_dir_);
        std::filesystem::create_directories(test_dir_);

        Logger::info("TestBase SetUp completed for test: " + std::string(info->name()));
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
        if (ec)
        {
            Logger::warn("Could not remove test directory " + test_dir_.string() + ": " + ec.message());
        }
    }

    std::string testPath(const std::string &name) const { return (test_dir_ / name).string(); }

    std::string testDir() const { return test_dir_.string(); }

    void writeFile(const std::string &name, const std::string &content)
    {
        std::ofstream file(testPath(name), std::ios::binary);
        file << content;
    }

    /**
     * @brief Write an MJPEG AVI made of solid color segments
     * @return Path of the video
     */
    std::string createVideo(const std::string &name, const std::vector<ColorSegment> &segments, int fps = 10,
                            cv::Size size = cv::Size(64, 48))
    {
        const std::string path = testPath(name);
        cv::VideoWriter writer(path, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'), fps, size);
        if (!writer.isOpened())
        {
            throw std::runtime_error("OpenCV could not open a video writer for " + path);
        }
        for (const auto &segment : segments)
        {
            // VideoWriter expects BGR
            cv::Mat frame(size, CV_8UC3, cv::Scalar(segment.rgb[2], segment.rgb[1], segment.rgb[0]));
            const int frames = static_cast<int>(segment.seconds * fps + 0.5);
            for (int i = 0; i < frames; ++i)
            {
                writer.write(frame);
            }
        }
        writer.release();
        return path;
    }

    // Video of one color lasting the given number of seconds
    std::string createSolidVideo(const std::string &name, double seconds, const cv::Scalar &rgb = cv::Scalar(0, 0, 255))
    {
        return createVideo(name, {{seconds, rgb}});
    }

    // A file with a video extension and no decodable content
    std::string createCorruptVideo(const std::string &name = "corrupt.mp4")
    {
        std::string garbage = "ftypisom";
        for (int i = 0; i < 4096; ++i)
        {
            garbage += static_cast<char>((i * 37 + 11) % 251);
        }
        writeFile(name, garbage);
        return testPath(name);
    }

    /**
     * @brief Settings pointing every directory into the test directory
     */
    PipelineSettings testSettings() const
    {
        PipelineSettings settings;
        settings.max_workers = 2;
        settings.stride_seconds = 0.5;
        settings.max_frame_side = 0;
        settings.embedding_batch_size = 8;
        settings.similarity_threshold = 0.5;
        settings.min_scene_seconds = 1.0;
        settings.merge_gap_seconds = 1.0;
        settings.target_duration_seconds = 60.0;
        settings.output_format = "mp4";
        settings.max_retries = 2;
        settings.retry_backoff_ms = 1;
        settings.scratch_dir = (test_dir_ / "scratch").string();
        settings.artifact_dir = (test_dir_ / "artifacts").string();
        settings.database_path = "";
        return settings;
    }

    static size_t countFiles(const std::string &dir)
    {
        if (!std::filesystem::exists(dir))
            return 0;
        size_t count = 0;
        for (const auto &entry : std::filesystem::recursive_directory_iterator(dir))
        {
            if (entry.is_regular_file())
                ++count;
        }
        return count;
    }

private:
    std::filesystem::path test_dir_;
};
