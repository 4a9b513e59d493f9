#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/pipeline_settings.hpp"
#include "core/summary_types.hpp"

/**
 * @brief Turns create-job request documents into validated CreateJobRequest values
 *
 * Every method throws ValidationError; nothing here touches the source file.
 */
class RequestParser
{
public:
    /**
     * @brief Parse a request from JSON text
     * @param text `{title, source, mode, payload}` document
     * @param settings Supplies the length and count limits
     */
    static CreateJobRequest parse(const std::string &text, const PipelineSettings &settings);

    static CreateJobRequest parse(const nlohmann::json &body, const PipelineSettings &settings);

    /**
     * @brief Build the selection variant from a wire mode name and its payload
     */
    static SelectionRequest parseSelection(const std::string &mode, const nlohmann::json &payload,
                                           const PipelineSettings &settings);

    /**
     * @brief Check a request built in code against the same rules as a parsed one
     */
    static void validate(const CreateJobRequest &request, const PipelineSettings &settings);
};
