#include "core/storage/artifact_store.hpp"
#include "core/error_types.hpp"
#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <filesystem>

namespace fs = std::filesystem;

LocalArtifactStore::LocalArtifactStore(const std::string &artifact_dir) : artifact_dir_(artifact_dir)
{
    if (!FileUtils::ensureDirectory(artifact_dir_))
    {
        throw ResourceError("Could not create artifact directory: " + artifact_dir_);
    }
}

ArtifactRef LocalArtifactStore::store(const std::string &job_id, const std::string &file_path,
                                      double duration_seconds)
{
    std::string extension = FileUtils::getFileExtension(file_path);
    fs::path target = fs::path(artifact_dir_) / (extension.empty() ? job_id : job_id + "." + extension);

    std::error_code ec;
    fs::rename(file_path, target, ec);
    if (ec)
    {
        // Scratch and artifact directories may sit on different filesystems
        ec.clear();
        fs::copy_file(file_path, target, fs::copy_options::overwrite_existing, ec);
        if (ec)
        {
            throw ComposeError("Could not store artifact " + target.string() + ": " + ec.message(), true);
        }
        FileUtils::removeAll(file_path);
    }

    ArtifactRef artifact;
    artifact.uri = target.string();
    artifact.size_bytes = FileUtils::fileSize(artifact.uri);
    artifact.duration_seconds = duration_seconds;
    artifact.sha256 = digest(artifact.uri);
    artifact.format = extension;
    if (artifact.sha256.empty())
    {
        FileUtils::removeAll(artifact.uri);
        throw ComposeError("Could not read back stored artifact " + artifact.uri, true);
    }

    Logger::info("Stored artifact " + artifact.uri + " (" + std::to_string(artifact.size_bytes) + " bytes)");
    return artifact;
}

std::string LocalArtifactStore::digest(const std::string &uri) const
{
    return FileUtils::computeFileHash(uri);
}

bool LocalArtifactStore::remove(const std::string &uri)
{
    if (uri.empty())
        return true;
    std::error_code ec;
    if (!fs::exists(uri, ec))
        return true;
    Logger::debug("Removing artifact " + uri);
    return FileUtils::removeAll(uri);
}
