// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/LocalFilesystem.hpp"
#include "ShardCache/Core/LocalFile.hpp"
#include <boost/log/trivial.hpp>

#include <sys/stat.h>
#include <sys/types.h>
namespace ShardCache::Core
{
    using namespace boost::log::trivial;

#ifdef _WIN32
    static std::chrono::system_clock::time_point FromSeconds(const __time64_t seconds)
    {
        return std::chrono::system_clock::time_point(std::chrono::seconds(seconds));
    }
#else
    static std::chrono::system_clock::time_point FromTimespec(const timespec& ts)
    {
        return std::chrono::system_clock::time_point(
            std::chrono::duration_cast<std::chrono::system_clock::duration>(
                std::chrono::seconds(ts.tv_sec) + std::chrono::nanoseconds(ts.tv_nsec)));
    }
#endif

    LocalFilesystem::LocalFilesystem(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_logger(std::move(logger))
    {
    }

    std::unique_ptr<InputStream> LocalFilesystem::Open(const std::filesystem::path& path)
    {
        return std::make_unique<LocalFile>(path);
    }

    std::unique_ptr<WritableFile> LocalFilesystem::Create(const std::filesystem::path& path)
    {
        return std::make_unique<LocalWritableFile>(path);
    }

    bool LocalFilesystem::FileExists(const std::filesystem::path& path)
    {
        std::error_code ec;
        return std::filesystem::exists(path, ec);
    }

    bool LocalFilesystem::DeleteFile(const std::filesystem::path& path)
    {
        std::error_code ec;
        const auto removed = std::filesystem::remove(path, ec);
        if (ec)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to remove file '" << path.string() << "'. Error: " << ec.message();
            return false;
        }

        if (!removed)
        {
            // Someone else got there first. The file is gone either way.
            BOOST_LOG_SEV(*m_logger, debug) << "File '" << path.string() << "' was already removed";
        }

        return true;
    }

    bool LocalFilesystem::CreateDir(const std::filesystem::path& path)
    {
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to create directories '" << path.string() << "'. Error: " << ec.message();
            return false;
        }

        return true;
    }

    bool LocalFilesystem::Rename(const std::filesystem::path& from, const std::filesystem::path& to)
    {
        std::error_code ec;
        std::filesystem::rename(from, to, ec);
        if (ec)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to rename '" << from.string() << "' to '" << to.string() << "'. Error: " << ec.message();
            return false;
        }

        return true;
    }

    std::vector<FileInfo> LocalFilesystem::ListFiles(const std::filesystem::path& root)
    {
        std::vector<FileInfo> files;
        std::error_code ec;
        auto it = std::filesystem::recursive_directory_iterator(root, std::filesystem::directory_options::skip_permission_denied, ec);
        if (ec)
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Failed to list '" << root.string() << "'. Error: " << ec.message();
            return files;
        }

        for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec))
        {
            if (ec)
            {
                BOOST_LOG_SEV(*m_logger, debug) << "Stopped listing '" << root.string() << "'. Error: " << ec.message();
                break;
            }

            std::error_code typeEc;
            if (!it->is_regular_file(typeEc))
            {
                continue;
            }

            if (auto info = Stat(it->path()))
            {
                files.push_back(std::move(*info));
            }
        }

        return files;
    }

    std::optional<FileInfo> LocalFilesystem::Stat(const std::filesystem::path& path)
    {
#ifdef _WIN32
        struct _stat64 st = {};
        if (_wstat64(path.c_str(), &st) != 0)
        {
            return std::nullopt;
        }

        return FileInfo{ path, static_cast<int64_t>(st.st_size), FromSeconds(st.st_ctime), FromSeconds(st.st_mtime), FromSeconds(st.st_atime) };
#else
        struct stat st = {};
        if (::stat(path.c_str(), &st) != 0)
        {
            // Vanished between listing and stat.
            return std::nullopt;
        }

        return FileInfo{ path, static_cast<int64_t>(st.st_size), FromTimespec(st.st_ctim), FromTimespec(st.st_mtim), FromTimespec(st.st_atim) };
#endif
    }
}
