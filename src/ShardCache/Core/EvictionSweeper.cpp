// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/EvictionSweeper.hpp"

#include <algorithm>
#include <vector>
using namespace boost::log::trivial;
namespace ShardCache::Core
{
    EvictionSweeper::EvictionSweeper(std::shared_ptr<Filesystem> filesystem,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        std::chrono::steady_clock::duration interval,
        RecencyKey recencyKey)
        : m_filesystem(std::move(filesystem)),
        m_logger(std::move(logger)),
        m_interval(interval),
        m_recencyKey(recencyKey)
    {
    }

    std::chrono::system_clock::time_point EvictionSweeper::RecencyOf(const FileInfo& file, RecencyKey key) noexcept
    {
        switch (key)
        {
        case RecencyKey::ModificationTime:
            return file.modificationTime;
        case RecencyKey::AccessTime:
            return file.accessTime;
        case RecencyKey::ChangeTime:
        default:
            return file.changeTime;
        }
    }

    SweepResult EvictionSweeper::Sweep(const std::filesystem::path& dir, int64_t budget)
    {
        std::scoped_lock lock(m_mutex);
        if (!m_filesystem->FileExists(dir))
        {
            return {};
        }

        if (m_lastRun && std::chrono::steady_clock::now() - *m_lastRun < m_interval)
        {
            BOOST_LOG_SEV(*m_logger, debug) << "Skipping sweep of '" << dir.string() << "'. Last sweep was too recent";
            return {};
        }

        SweepResult result;
        try
        {
            result = SweepUnsafe(dir, budget);
        }
        catch (const std::exception& e)
        {
            // Eviction is advisory. The next sweep will see the directory as it is then.
            BOOST_LOG_SEV(*m_logger, warning) << "Sweep of '" << dir.string() << "' aborted. Error: " << e.what();
            result.scanned = true;
        }

        m_lastRun = std::chrono::steady_clock::now();
        return result;
    }

    SweepResult EvictionSweeper::SweepUnsafe(const std::filesystem::path& dir, int64_t budget)
    {
        SweepResult result;
        result.scanned = true;

        auto files = m_filesystem->ListFiles(dir);
        int64_t totalSize = 0;
        for (const auto& file : files)
        {
            totalSize += file.size;
        }

        result.bytesBefore = totalSize;
        result.bytesAfter = totalSize;
        if (totalSize <= budget)
        {
            BOOST_LOG_SEV(*m_logger, debug) << "Cache '" << dir.string() << "' holds " << totalSize << " (bytes). Within budget of " << budget;
            return result;
        }

        BOOST_LOG_SEV(*m_logger, info) << "Cache '" << dir.string() << "' holds " << totalSize
            << " (bytes). Max " << budget << " (bytes). Evicting oldest files";

        // Newest first so the oldest file sits at the back.
        const auto key = m_recencyKey;
        std::sort(files.begin(), files.end(), [key](const FileInfo& lhs, const FileInfo& rhs)
            {
                const auto lhsTime = RecencyOf(lhs, key);
                const auto rhsTime = RecencyOf(rhs, key);
                if (lhsTime != rhsTime)
                {
                    return lhsTime > rhsTime;
                }

                return lhs.path > rhs.path;
            });

        while (!files.empty() && totalSize > budget)
        {
            const auto file = std::move(files.back());
            files.pop_back();

            BOOST_LOG_SEV(*m_logger, info) << "Evicting '" << file.path.string() << "' of size " << file.size << " (bytes) from file cache";
            if (!m_filesystem->DeleteFile(file.path))
            {
                BOOST_LOG_SEV(*m_logger, warning) << "Could not evict '" << file.path.string() << "'";
                continue;
            }

            totalSize -= file.size;
            ++result.filesDeleted;
        }

        if (totalSize > budget)
        {
            BOOST_LOG_SEV(*m_logger, warning) << "Cache '" << dir.string() << "' still holds " << totalSize << " (bytes) after sweeping";
        }

        result.bytesAfter = totalSize;
        return result;
    }
}
