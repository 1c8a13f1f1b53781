// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Configuration.hpp"
#include "ShardCache/Core/Filesystem.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
namespace ShardCache::Core::Models
{
    struct CacheOptions
    {
        using EnvironmentLookup = std::function<std::optional<std::string>(std::string_view)>;

        std::filesystem::path cacheDir = std::filesystem::path(Configuration::DefaultCacheDir);

        /// <summary>
        /// Byte budget for the cache directory. Eviction is disabled when this is
        /// zero or negative.
        /// </summary>
        int64_t maxCacheSize = Configuration::DefaultCacheSize;
        std::chrono::seconds sweepInterval = Configuration::DefaultSweepInterval;
        RecencyKey recencyKey = RecencyKey::ChangeTime;
        int64_t chunkSize = Configuration::DefaultChunkSize;
        bool validate = true;
        bool verbose = false;

        bool EvictionEnabled() const noexcept { return maxCacheSize > 0; }

        /// <summary>
        /// Builds options from environment style variables. Unset variables keep
        /// their defaults.
        /// </summary>
        /// <exception cref="std::invalid_argument">A variable holds a malformed value.</exception>
        static CacheOptions FromEnvironment(const EnvironmentLookup& lookup);
    };
}
