// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Configuration.hpp"
#include "ShardCache/Core/Filesystem.hpp"

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
namespace ShardCache::Core
{
    struct SweepResult
    {
        bool scanned = false;
        int64_t bytesBefore = 0;
        int64_t bytesAfter = 0;
        std::size_t filesDeleted = 0;
    };

    /// <summary>
    /// Keeps a cache directory under a byte budget by deleting its oldest files.
    /// The directory itself is the only index: every sweep walks it again.
    /// </summary>
    class EvictionSweeper
    {
        std::shared_ptr<Filesystem> m_filesystem;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
        std::chrono::steady_clock::duration m_interval;
        RecencyKey m_recencyKey;

        std::mutex m_mutex;
        std::optional<std::chrono::steady_clock::time_point> m_lastRun;
    public:
        EvictionSweeper(std::shared_ptr<Filesystem> filesystem,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            std::chrono::steady_clock::duration interval = Configuration::DefaultSweepInterval,
            RecencyKey recencyKey = RecencyKey::ChangeTime);
        EvictionSweeper(const EvictionSweeper&) = delete;
        EvictionSweeper& operator=(const EvictionSweeper&) = delete;

        /// <summary>
        /// Deletes files oldest first until the total size under dir is within
        /// budget. Does nothing if the previous scan finished less than the interval
        /// ago. Never throws; files vanishing underneath the sweep are ignored.
        /// </summary>
        SweepResult Sweep(const std::filesystem::path& dir, int64_t budget);

        [[nodiscard]] static std::chrono::system_clock::time_point RecencyOf(const FileInfo& file, RecencyKey key) noexcept;
    private:
        SweepResult SweepUnsafe(const std::filesystem::path& dir, int64_t budget);
    };
}
