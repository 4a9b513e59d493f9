#include "core/request_parser.hpp"
#include "core/category_catalog.hpp"
#include "core/error_types.hpp"
#include "core/summary_modes.hpp"
#include <cmath>

using json = nlohmann::json;

namespace
{
    std::string trim(const std::string &value)
    {
        const char *whitespace = " \t\r\n";
        auto first = value.find_first_not_of(whitespace);
        if (first == std::string::npos)
            return "";
        auto last = value.find_last_not_of(whitespace);
        return value.substr(first, last - first + 1);
    }

    std::string requireString(const json &object, const std::string &key, const std::string &context)
    {
        if (!object.contains(key) || !object[key].is_string())
        {
            throw ValidationError(context + " requires a string field '" + key + "'");
        }
        return object[key].get<std::string>();
    }

    double requireNumber(const json &object, const std::string &key, const std::string &context)
    {
        if (!object.contains(key) || !object[key].is_number())
        {
            throw ValidationError(context + " requires a numeric field '" + key + "'");
        }
        return object[key].get<double>();
    }

    void validateSelection(const SelectionRequest &selection, const PipelineSettings &settings)
    {
        if (auto text = std::get_if<TextPromptRequest>(&selection))
        {
            if (trim(text->query).empty())
                throw ValidationError("Prompt must not be empty");
            if (text->query.size() > settings.max_prompt_length)
                throw ValidationError("Prompt exceeds " + std::to_string(settings.max_prompt_length) + " characters");
        }
        else if (auto category = std::get_if<CategoryRequest>(&selection))
        {
            if (!CategoryCatalog::contains(category->category_id))
                throw ValidationError("Invalid category '" + category->category_id +
                                      "'. Must be one of: " + CategoryCatalog::idList());
        }
        else if (auto ranges = std::get_if<TimeRangeRequest>(&selection))
        {
            if (ranges->ranges.empty())
                throw ValidationError("At least one time range is required");
            if (ranges->ranges.size() > settings.max_ranges)
                throw ValidationError("At most " + std::to_string(settings.max_ranges) + " time ranges are allowed");
            for (size_t i = 0; i < ranges->ranges.size(); ++i)
            {
                const auto &range = ranges->ranges[i];
                const std::string where = "Time range " + std::to_string(i);
                if (!std::isfinite(range.start_percent) || !std::isfinite(range.end_percent))
                    throw ValidationError(where + " has a non-finite bound");
                if (range.start_percent < 0.0 || range.start_percent > 100.0 ||
                    range.end_percent < 0.0 || range.end_percent > 100.0)
                    throw ValidationError(where + " must lie within [0, 100] percent");
                if (range.start_percent >= range.end_percent)
                    throw ValidationError(where + " must start before it ends");
            }
        }
    }
}

CreateJobRequest RequestParser::parse(const std::string &text, const PipelineSettings &settings)
{
    json body;
    try
    {
        body = json::parse(text);
    }
    catch (const json::parse_error &e)
    {
        throw ValidationError("Request is not valid JSON: " + std::string(e.what()));
    }
    return parse(body, settings);
}

CreateJobRequest RequestParser::parse(const json &body, const PipelineSettings &settings)
{
    if (!body.is_object())
    {
        throw ValidationError("Request must be a JSON object");
    }

    CreateJobRequest request;
    request.title = requireString(body, "title", "Request");
    request.source_path = requireString(body, "source", "Request");
    const std::string mode = requireString(body, "mode", "Request");

    json payload = json::object();
    if (body.contains("payload"))
    {
        payload = body["payload"];
    }
    request.selection = parseSelection(mode, payload, settings);
    validate(request, settings);
    return request;
}

SelectionRequest RequestParser::parseSelection(const std::string &mode, const json &payload,
                                               const PipelineSettings &settings)
{
    auto parsed_mode = SummaryModes::modeFromString(mode);
    if (!parsed_mode)
    {
        throw ValidationError("Unknown mode '" + mode + "'. Must be one of: text-prompt, category, time-range");
    }
    if (!payload.is_object())
    {
        throw ValidationError("Payload must be a JSON object");
    }

    SelectionRequest selection;
    switch (*parsed_mode)
    {
    case SelectionMode::TEXT_PROMPT:
        selection = TextPromptRequest{requireString(payload, "prompt", "text-prompt payload")};
        break;
    case SelectionMode::CATEGORY:
    {
        // "category" is accepted as an alias of "category_id"
        const std::string key = payload.contains("category_id") ? "category_id" : "category";
        selection = CategoryRequest{requireString(payload, key, "category payload")};
        break;
    }
    case SelectionMode::TIME_RANGE:
    {
        if (!payload.contains("ranges") || !payload["ranges"].is_array())
        {
            throw ValidationError("time-range payload requires an array field 'ranges'");
        }
        TimeRangeRequest ranges;
        for (const auto &item : payload["ranges"])
        {
            if (!item.is_object())
                throw ValidationError("Each time range must be an object");
            ranges.ranges.push_back(PercentRange{requireNumber(item, "start_percent", "time range"),
                                                 requireNumber(item, "end_percent", "time range")});
        }
        selection = ranges;
        break;
    }
    }
    validateSelection(selection, settings);
    return selection;
}

void RequestParser::validate(const CreateJobRequest &request, const PipelineSettings &settings)
{
    if (trim(request.title).empty())
        throw ValidationError("Title must not be empty");
    if (request.title.size() > settings.max_title_length)
        throw ValidationError("Title exceeds " + std::to_string(settings.max_title_length) + " characters");
    if (trim(request.source_path).empty())
        throw ValidationError("Source video path must not be empty");
    validateSelection(request.selection, settings);
}
