// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
#include <chrono>
#include <string_view>
namespace ShardCache::Core
{
    struct Configuration
    {
        struct Environment
        {
            static constexpr std::string_view CacheDir = "SHARDCACHE_CACHE_DIR";
            static constexpr std::string_view CacheSize = "SHARDCACHE_CACHE_SIZE";
            static constexpr std::string_view Verbose = "SHARDCACHE_VERBOSE";
            static constexpr std::string_view SweepInterval = "SHARDCACHE_SWEEP_INTERVAL";
        };

        static constexpr std::string_view DefaultCacheDir = "./_cache";
        static const constexpr int64_t DefaultCacheSize = 1'000'000'000'000'000'000; // 1e18
        static const constexpr std::chrono::seconds DefaultSweepInterval = std::chrono::seconds(30);
        static const constexpr int64_t DefaultChunkSize = static_cast<int64_t>(1024) * 1024; // 1MiB
        static const constexpr int MaxOpenAttempts = 10;
        static const constexpr int64_t PreviewSize = 200;
        static const constexpr std::size_t MaxEncodedNameLength = 128;
        static const constexpr int64_t ProbeSize = 512;
    };
}
