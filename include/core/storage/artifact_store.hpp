#pragma once

#include "core/summary_types.hpp"
#include <string>

/**
 * @brief Durable home of composed summaries
 */
class ArtifactStore
{
public:
    virtual ~ArtifactStore() = default;

    /**
     * @brief Take ownership of a composed file
     * @param job_id Job the artifact belongs to
     * @param file_path Composed output, moved away on success
     * @param duration_seconds Measured duration of the output
     * @return Handle recorded on the job
     * @throws ComposeError when the file cannot be stored
     */
    virtual ArtifactRef store(const std::string &job_id, const std::string &file_path, double duration_seconds) = 0;

    /**
     * @brief Delete a stored artifact; unknown uris are ignored
     * @return false when the artifact exists but could not be deleted
     */
    virtual bool remove(const std::string &uri) = 0;
};

/**
 * @brief Keeps artifacts as <artifact_dir>/<job id>.<ext>
 */
class LocalArtifactStore : public ArtifactStore
{
public:
    explicit LocalArtifactStore(const std::string &artifact_dir);

    ArtifactRef store(const std::string &job_id, const std::string &file_path, double duration_seconds) override;
    bool remove(const std::string &uri) override;

    const std::string &directory() const { return artifact_dir_; }

protected:
    // SHA-256 of a stored artifact, empty when it cannot be read back
    virtual std::string digest(const std::string &uri) const;

private:
    std::string artifact_dir_;
};
