// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Configuration.hpp"
#include "ShardCache/Core/Filesystem.hpp"
#include "ShardCache/Core/Transport.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
namespace ShardCache::Core
{
    class Downloader
    {
        std::shared_ptr<Transport> m_transport;
        std::shared_ptr<Filesystem> m_filesystem;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        int64_t m_chunkSize;
    public:
        Downloader(std::shared_ptr<Transport> transport,
            std::shared_ptr<Filesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            int64_t chunkSize = Configuration::DefaultChunkSize);

        /// <summary>
        /// Streams url into a temporary file beside destPath and renames it onto
        /// destPath once the transfer completed. destPath is never observed half
        /// written.
        /// </summary>
        /// <exception cref="FetchError">The transfer failed. destPath was not created.</exception>
        void Download(const std::string& url, const std::filesystem::path& destPath);

        /// <summary>
        /// Temporary name used while downloading to destPath. Unique per process
        /// and per call.
        /// </summary>
        [[nodiscard]] static std::filesystem::path TemporaryPath(const std::filesystem::path& destPath);
    };
}
