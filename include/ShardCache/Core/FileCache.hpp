// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/ArchiveValidator.hpp"
#include "ShardCache/Core/CacheNaming.hpp"
#include "ShardCache/Core/Downloader.hpp"
#include "ShardCache/Core/EvictionSweeper.hpp"
#include "ShardCache/Core/FileOpener.hpp"
#include "ShardCache/Core/Filesystem.hpp"
#include "ShardCache/Core/Transport.hpp"
#include "ShardCache/Core/Models/CacheOptions.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
namespace ShardCache::Core
{
    class FileCache final : public FileOpener
    {
    public:
        using Validator = std::function<bool(const std::filesystem::path&)>;

    private:
        Models::CacheOptions m_options;
        std::shared_ptr<Filesystem> m_filesystem;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        NameMapper m_nameMapper;
        Downloader m_downloader;
        ArchiveValidator m_archiveValidator;
        Validator m_validator;
        EvictionSweeper m_sweeper;

        bool IsAccepted(const std::string& url, const std::filesystem::path& path);

    public:
        /// <summary>
        /// Creates a cache rooted at options.cacheDir.
        /// </summary>
        /// <param name="nameMapper">Cache name for a URL. Defaults to CacheNaming::UrlToCacheName.</param>
        /// <param name="validator">Check run on fresh downloads. Defaults to ArchiveValidator::IsValidArchive.</param>
        FileCache(Models::CacheOptions options,
            std::shared_ptr<Transport> transport,
            std::shared_ptr<Filesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            NameMapper nameMapper = {},
            Validator validator = {});
        FileCache(const FileCache&) = delete;
        FileCache& operator=(const FileCache&) = delete;
        FileCache(FileCache&&) = delete;
        FileCache& operator=(FileCache&&) = delete;

        /// <summary>
        /// Returns the local path of url, downloading and validating it on a miss.
        /// An existing file at the cache path is returned as is.
        /// </summary>
        /// <exception cref="FetchError">The download failed.</exception>
        /// <exception cref="ValidationError">The download is not an archive.</exception>
        [[nodiscard]] std::filesystem::path GetFile(const std::string& url);

        /// <summary>
        /// Opens url for reading. Local URLs are opened in place, everything else
        /// through the cache.
        /// </summary>
        virtual OpenedFile OpenFile(const std::string& url) override;

        [[nodiscard]] std::filesystem::path CachePathFor(const std::string& url) const;
        [[nodiscard]] const Models::CacheOptions& GetOptions() const noexcept;
        EvictionSweeper& GetSweeper() noexcept;
    };
}
