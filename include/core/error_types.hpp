#pragma once

#include <stdexcept>
#include <string>

/**
 * @brief Failure classes recorded on a summary job
 */
enum class ErrorKind
{
    VALIDATION,
    RESOURCE,
    NO_MATCH,
    COMPOSE,
    CANCELLED,
    CONFLICT,
    INTERNAL
};

class ErrorKinds
{
public:
    static std::string getKindName(ErrorKind kind)
    {
        switch (kind)
        {
        case ErrorKind::VALIDATION:
            return "validation";
        case ErrorKind::RESOURCE:
            return "resource";
        case ErrorKind::NO_MATCH:
            return "no_match";
        case ErrorKind::COMPOSE:
            return "compose";
        case ErrorKind::CANCELLED:
            return "cancelled";
        case ErrorKind::CONFLICT:
            return "conflict";
        case ErrorKind::INTERNAL:
            return "internal";
        }
        return "internal";
    }

    static ErrorKind fromString(const std::string &name)
    {
        if (name == "validation")
            return ErrorKind::VALIDATION;
        if (name == "resource")
            return ErrorKind::RESOURCE;
        if (name == "no_match")
            return ErrorKind::NO_MATCH;
        if (name == "compose")
            return ErrorKind::COMPOSE;
        if (name == "cancelled")
            return ErrorKind::CANCELLED;
        if (name == "conflict")
            return ErrorKind::CONFLICT;
        return ErrorKind::INTERNAL;
    }
};

/**
 * @brief Base class of every error raised by the summarization pipeline
 */
class SummarizerError : public std::runtime_error
{
public:
    SummarizerError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Malformed request, rejected before a job exists
class ValidationError : public SummarizerError
{
public:
    explicit ValidationError(const std::string &message)
        : SummarizerError(ErrorKind::VALIDATION, message) {}
};

// Source missing, corrupt or undecodable; also missing model files
class ResourceError : public SummarizerError
{
public:
    explicit ResourceError(const std::string &message)
        : SummarizerError(ErrorKind::RESOURCE, message) {}
};

class NoMatchError : public SummarizerError
{
public:
    explicit NoMatchError(const std::string &message)
        : SummarizerError(ErrorKind::NO_MATCH, message) {}
};

class ComposeError : public SummarizerError
{
public:
    ComposeError(const std::string &message, bool transient = false)
        : SummarizerError(ErrorKind::COMPOSE, message), transient_(transient) {}

    /**
     * @brief True for I/O-class failures worth another attempt
     */
    bool isTransient() const noexcept { return transient_; }

private:
    bool transient_;
};

class CancelledError : public SummarizerError
{
public:
    explicit CancelledError(const std::string &message = "Job cancelled")
        : SummarizerError(ErrorKind::CANCELLED, message) {}
};

// Resubmission of a job that is still queued or processing
class JobConflictError : public SummarizerError
{
public:
    explicit JobConflictError(const std::string &message)
        : SummarizerError(ErrorKind::CONFLICT, message) {}
};
