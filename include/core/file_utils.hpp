#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

class FileUtils
{
public:
    /**
     * @brief SHA-256 of a file's content as lowercase hex
     * @param file_path File to hash
     * @return Digest, or an empty string if the file cannot be read
     */
    static std::string computeFileHash(const std::string &file_path);

    static std::uint64_t fileSize(const std::string &file_path);

    /**
     * @brief Create a directory and its parents
     * @return false and log when creation fails
     */
    static bool ensureDirectory(const std::string &dir_path);

    /**
     * @brief Remove a file or directory tree, logging instead of throwing
     * @return true if nothing remains at the path
     */
    static bool removeAll(const std::string &path);

    // Regular files directly or indirectly below dir_path
    static std::vector<std::string> listFilesRecursive(const std::string &dir_path);

    static std::string getFileExtension(const std::string &file_path);
};

/**
 * @brief Job-scoped ephemeral directory, removed when the object goes away
 *
 * release() removes it early; the destructor is then a no-op.
 */
class ScratchDirectory
{
public:
    ScratchDirectory(const std::string &root, const std::string &name);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory &) = delete;
    ScratchDirectory &operator=(const ScratchDirectory &) = delete;

    const std::filesystem::path &path() const { return path_; }

    /**
     * @brief Path of a file inside the directory
     */
    std::string filePath(const std::string &file_name) const;

    void release();

private:
    std::filesystem::path path_;
    bool released_ = false;
};
