#pragma once

#include <string>
#include <optional>
#include "core/summary_types.hpp"

/**
 * @brief Name and parsing helpers for selection modes and job states
 */
class SummaryModes
{
public:
    /**
     * @brief Get the wire name of a selection mode
     * @param mode The selection mode
     * @return "text-prompt", "category" or "time-range"
     */
    static std::string getModeName(SelectionMode mode)
    {
        switch (mode)
        {
        case SelectionMode::TEXT_PROMPT:
            return "text-prompt";
        case SelectionMode::CATEGORY:
            return "category";
        case SelectionMode::TIME_RANGE:
            return "time-range";
        }
        return "unknown";
    }

    /**
     * @brief Parse a wire mode name
     * @param name Mode name as it appears in a request
     * @return The mode, or std::nullopt for an unknown name
     */
    static std::optional<SelectionMode> modeFromString(const std::string &name)
    {
        if (name == "text-prompt")
            return SelectionMode::TEXT_PROMPT;
        if (name == "category")
            return SelectionMode::CATEGORY;
        if (name == "time-range")
            return SelectionMode::TIME_RANGE;
        return std::nullopt;
    }

    static SelectionMode modeOf(const SelectionRequest &request)
    {
        switch (request.index())
        {
        case 0:
            return SelectionMode::TEXT_PROMPT;
        case 1:
            return SelectionMode::CATEGORY;
        default:
            return SelectionMode::TIME_RANGE;
        }
    }

    /**
     * @brief Whether the mode needs frame embeddings
     */
    static bool usesEmbeddings(SelectionMode mode)
    {
        return mode != SelectionMode::TIME_RANGE;
    }

    static std::string getStatusName(JobStatus status)
    {
        switch (status)
        {
        case JobStatus::QUEUED:
            return "queued";
        case JobStatus::PROCESSING:
            return "processing";
        case JobStatus::COMPLETED:
            return "completed";
        case JobStatus::FAILED:
            return "failed";
        case JobStatus::CANCELLED:
            return "cancelled";
        }
        return "unknown";
    }

    static std::optional<JobStatus> statusFromString(const std::string &name)
    {
        if (name == "queued")
            return JobStatus::QUEUED;
        if (name == "processing")
            return JobStatus::PROCESSING;
        if (name == "completed")
            return JobStatus::COMPLETED;
        if (name == "failed")
            return JobStatus::FAILED;
        if (name == "cancelled")
            return JobStatus::CANCELLED;
        return std::nullopt;
    }

    static bool isTerminal(JobStatus status)
    {
        return status == JobStatus::COMPLETED || status == JobStatus::FAILED ||
               status == JobStatus::CANCELLED;
    }
};
