#include "core/file_utils.hpp"
#include "core/error_types.hpp"
#include "logging/logger.hpp"
#include <openssl/evp.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

namespace fs = std::filesystem;

std::string FileUtils::computeFileHash(const std::string &file_path)
{
    Logger::debug("Reading entire file for hash computation: " + file_path);
    constexpr size_t buffer_size = 8192;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1)
        return "";

    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
        return "";

    std::vector<char> buffer(buffer_size);
    while (file.good())
    {
        file.read(buffer.data(), buffer_size);
        std::streamsize bytes_read = file.gcount();
        if (bytes_read > 0)
        {
            if (EVP_DigestUpdate(ctx.get(), buffer.data(), static_cast<size_t>(bytes_read)) != 1)
                return "";
        }
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_length = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_length) != 1)
        return "";

    std::stringstream ss;
    for (unsigned int i = 0; i < hash_length; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

std::uint64_t FileUtils::fileSize(const std::string &file_path)
{
    std::error_code ec;
    auto size = fs::file_size(file_path, ec);
    return ec ? 0 : static_cast<std::uint64_t>(size);
}

bool FileUtils::ensureDirectory(const std::string &dir_path)
{
    std::error_code ec;
    fs::create_directories(dir_path, ec);
    if (ec)
    {
        Logger::error("Could not create directory " + dir_path + ": " + ec.message());
        return false;
    }
    return true;
}

bool FileUtils::removeAll(const std::string &path)
{
    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec)
    {
        Logger::warn("Could not remove " + path + ": " + ec.message());
    }
    return !fs::exists(path, ec);
}

std::vector<std::string> FileUtils::listFilesRecursive(const std::string &dir_path)
{
    std::vector<std::string> files;
    std::error_code ec;
    if (!fs::exists(dir_path, ec))
        return files;

    for (auto it = fs::recursive_directory_iterator(dir_path, ec); !ec && it != fs::recursive_directory_iterator();
         it.increment(ec))
    {
        if (it->is_regular_file(ec))
            files.push_back(it->path().string());
    }
    return files;
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext[0] == '.')
        ext = ext.substr(1);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

ScratchDirectory::ScratchDirectory(const std::string &root, const std::string &name)
    : path_(fs::path(root) / name)
{
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec)
    {
        throw ComposeError("Could not create scratch directory " + path_.string() + ": " + ec.message(), true);
    }
    Logger::debug("Created scratch directory: " + path_.string());
}

ScratchDirectory::~ScratchDirectory()
{
    release();
}

std::string ScratchDirectory::filePath(const std::string &file_name) const
{
    return (path_ / file_name).string();
}

void ScratchDirectory::release()
{
    if (released_)
        return;
    released_ = true;
    if (FileUtils::removeAll(path_.string()))
    {
        Logger::debug("Removed scratch directory: " + path_.string());
    }
}
