// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Filesystem.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <memory>
#include <optional>
namespace ShardCache::Core
{
    class LocalFilesystem final : public Filesystem
    {
    private:
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
    public:
        explicit LocalFilesystem(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        virtual std::unique_ptr<InputStream> Open(const std::filesystem::path& path) override;
        virtual std::unique_ptr<WritableFile> Create(const std::filesystem::path& path) override;
        virtual bool FileExists(const std::filesystem::path& path) override;
        virtual bool DeleteFile(const std::filesystem::path& path) override;
        virtual bool CreateDir(const std::filesystem::path& path) override;
        virtual bool Rename(const std::filesystem::path& from, const std::filesystem::path& to) override;
        virtual std::vector<FileInfo> ListFiles(const std::filesystem::path& root) override;
    private:
        std::optional<FileInfo> Stat(const std::filesystem::path& path);
    };
}
