// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/Downloader.hpp"
#include "ShardCache/Core/Errors.hpp"

#include <atomic>
#include <vector>

#ifdef _WIN32
#include <process.h>
#else
#include <unistd.h>
#endif
using namespace boost::log::trivial;
namespace ShardCache::Core
{
    static long CurrentProcessId()
    {
#ifdef _WIN32
        return static_cast<long>(_getpid());
#else
        return static_cast<long>(::getpid());
#endif
    }

    Downloader::Downloader(std::shared_ptr<Transport> transport,
        std::shared_ptr<Filesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        int64_t chunkSize)
        : m_transport(std::move(transport)),
        m_filesystem(std::move(filesystem)),
        m_logger(std::move(logger)),
        m_chunkSize(chunkSize > 0 ? chunkSize : Configuration::DefaultChunkSize)
    {
    }

    std::filesystem::path Downloader::TemporaryPath(const std::filesystem::path& destPath)
    {
        static std::atomic<uint64_t> counter{ 0 };
        auto temp = destPath;
        temp += ".temp" + std::to_string(CurrentProcessId()) + "." + std::to_string(counter.fetch_add(1));
        return temp;
    }

    void Downloader::Download(const std::string& url, const std::filesystem::path& destPath)
    {
        const auto tempPath = TemporaryPath(destPath);
        BOOST_LOG_SEV(*m_logger, info) << "Downloading '" << url << "' to '" << destPath.string() << "'";

        int64_t totalBytes = 0;
        try
        {
            auto stream = m_transport->Open(url);
            auto file = m_filesystem->Create(tempPath);

            std::vector<char> buffer(static_cast<std::size_t>(m_chunkSize));
            while (true)
            {
                const auto bytesRead = stream->Read(buffer.data(), m_chunkSize);
                if (bytesRead <= 0)
                {
                    break;
                }

                file->Append(buffer.data(), bytesRead);
                totalBytes += bytesRead;
            }

            file->Close();
        }
        catch (const FetchError& e)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to download '" << url << "' after " << totalBytes << " (bytes). Error: " << e.what();
            m_filesystem->DeleteFile(tempPath);
            throw;
        }
        catch (const std::exception& e)
        {
            BOOST_LOG_SEV(*m_logger, error) << "Failed to download '" << url << "' after " << totalBytes << " (bytes). Error: " << e.what();
            m_filesystem->DeleteFile(tempPath);
            throw FetchError(url, e.what());
        }

        if (!m_filesystem->Rename(tempPath, destPath))
        {
            m_filesystem->DeleteFile(tempPath);
            throw FetchError(url, "Unable to publish '" + tempPath.string() + "' as '" + destPath.string() + "'");
        }

        BOOST_LOG_SEV(*m_logger, info) << "Finished downloading '" << url << "' (" << totalBytes << " bytes)";
    }
}
