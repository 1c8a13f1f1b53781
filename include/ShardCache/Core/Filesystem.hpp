#pragma once
#include "ShardCache/Core/InputStream.hpp"
#include "ShardCache/Core/WritableFile.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>
namespace ShardCache::Core
{
    /// <summary>
    /// The timestamp used to order cache files from newest to oldest.
    /// </summary>
    enum class RecencyKey
    {
        ChangeTime,
        ModificationTime,
        AccessTime,
    };

    struct FileInfo
    {
        std::filesystem::path path;
        int64_t size;
        std::chrono::system_clock::time_point changeTime;
        std::chrono::system_clock::time_point modificationTime;
        std::chrono::system_clock::time_point accessTime;
    };

    class Filesystem
    {
    public:
        virtual ~Filesystem() = default;

        virtual std::unique_ptr<InputStream> Open(const std::filesystem::path& path) = 0;
        virtual std::unique_ptr<WritableFile> Create(const std::filesystem::path& path) = 0;
        virtual bool FileExists(const std::filesystem::path& path) = 0;
        virtual bool DeleteFile(const std::filesystem::path& path) = 0;
        virtual bool CreateDir(const std::filesystem::path& path) = 0;
        virtual bool Rename(const std::filesystem::path& from, const std::filesystem::path& to) = 0;

        /// <summary>
        /// Recursively lists the regular files below root. Entries that disappear
        /// while walking are skipped.
        /// </summary>
        virtual std::vector<FileInfo> ListFiles(const std::filesystem::path& root) = 0;
    };
}
