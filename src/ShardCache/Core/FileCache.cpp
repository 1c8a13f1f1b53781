// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/FileCache.hpp"
#include "ShardCache/Core/Configuration.hpp"
#include "ShardCache/Core/Errors.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"
#include <boost/log/trivial.hpp>

#include <stdexcept>
using namespace boost::log::trivial;
namespace ShardCache::Core
{
    FileCache::FileCache(Models::CacheOptions options,
        std::shared_ptr<Transport> transport,
        std::shared_ptr<Filesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        NameMapper nameMapper,
        Validator validator)
        : m_options(std::move(options)),
        m_filesystem(std::move(filesystem)),
        m_logger(std::move(logger)),
        m_nameMapper(std::move(nameMapper)),
        m_downloader(std::move(transport), m_filesystem, m_logger, m_options.chunkSize),
        m_archiveValidator(m_filesystem),
        m_validator(std::move(validator)),
        m_sweeper(m_filesystem, m_logger, m_options.sweepInterval, m_options.recencyKey)
    {
        if (!m_nameMapper)
        {
            m_nameMapper = [](const std::string& url)
            {
                return CacheNaming::UrlToCacheName(url);
            };
        }

        if (!m_validator)
        {
            m_validator = [this](const std::filesystem::path& path)
            {
                return m_archiveValidator.IsValidArchive(path);
            };
        }
    }

    std::filesystem::path FileCache::CachePathFor(const std::string& url) const
    {
        return m_options.cacheDir / std::filesystem::path(m_nameMapper(url));
    }

    std::filesystem::path FileCache::GetFile(const std::string& url)
    {
        const auto destPath = CachePathFor(url);
        if (!m_filesystem->CreateDir(destPath.parent_path()))
        {
            throw FetchError(url, "Unable to create cache directory '" + destPath.parent_path().string() + "'");
        }

        if (m_filesystem->FileExists(destPath))
        {
            BOOST_LOG_SEV(*m_logger, debug) << "Cache hit for '" << url << "' at '" << destPath.string() << "'";
            return destPath;
        }

        // Sweep before the download so the new file lands in a cache that is
        // already within budget.
        if (m_options.EvictionEnabled())
        {
            m_sweeper.Sweep(m_options.cacheDir, m_options.maxCacheSize);
        }

        m_downloader.Download(url, destPath);

        if (m_options.validate && !IsAccepted(url, destPath))
        {
            // The file can vanish under a concurrent sweep; report it as empty.
            auto fileType = std::string(ArchiveValidator::Describe(ArchiveValidator::FileType::Empty));
            std::string preview;
            try
            {
                fileType = std::string(ArchiveValidator::Describe(m_archiveValidator.GuessFileType(destPath)));
                preview = m_archiveValidator.ReadPreview(destPath, Configuration::PreviewSize);
            }
            catch (const std::runtime_error& e)
            {
                BOOST_LOG_SEV(*m_logger, warning) << "Unable to inspect rejected file '" << destPath.string() << "'. Error: " << e.what();
            }

            BOOST_LOG_SEV(*m_logger, info) << "Rejecting '" << destPath.string() << "' downloaded from '" << url << "'. Detected " << fileType;
            m_filesystem->DeleteFile(destPath);
            throw ValidationError(destPath, url, fileType, preview);
        }

        return destPath;
    }

    bool FileCache::IsAccepted(const std::string& url, const std::filesystem::path& path)
    {
        try
        {
            return m_validator(path);
        }
        catch (const std::runtime_error& e)
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Unable to validate '" << path.string() << "' downloaded from '" << url << "'. Error: " << e.what();
            return false;
        }
    }

    OpenedFile FileCache::OpenFile(const std::string& url)
    {
        if (UrlHelpers::IsLocal(url))
        {
            const auto localPath = std::filesystem::path(UrlHelpers::Parse(url).path);
            return OpenedFile{ m_filesystem->Open(localPath), localPath };
        }

        auto localPath = GetFile(url);
        BOOST_LOG_SEV(*m_logger, debug) << "Opening '" << localPath.string() << "'";
        return OpenedFile{ m_filesystem->Open(localPath), std::move(localPath) };
    }

    const Models::CacheOptions& FileCache::GetOptions() const noexcept
    {
        return m_options;
    }

    EvictionSweeper& FileCache::GetSweeper() noexcept
    {
        return m_sweeper;
    }
}
