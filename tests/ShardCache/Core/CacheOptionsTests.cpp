// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/Models/CacheOptions.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <limits>
#include <map>
#include <stdexcept>
using ShardCache::Core::Models::CacheOptions;

static CacheOptions::EnvironmentLookup Lookup(std::map<std::string, std::string> variables)
{
    return [variables = std::move(variables)](std::string_view name) -> std::optional<std::string>
        {
            const auto it = variables.find(std::string(name));
            if (it == variables.end())
            {
                return std::nullopt;
            }

            return it->second;
        };
}

TEST(CacheOptionsTests, FromEnvironment_Defaults)
{
    // Act
    const auto options = CacheOptions::FromEnvironment(Lookup({}));

    // Assert
    EXPECT_EQ(std::filesystem::path("./_cache"), options.cacheDir);
    EXPECT_EQ(1'000'000'000'000'000'000, options.maxCacheSize);
    EXPECT_EQ(std::chrono::seconds(30), options.sweepInterval);
    EXPECT_FALSE(options.verbose);
    EXPECT_TRUE(options.validate);
    EXPECT_TRUE(options.EvictionEnabled());
}

TEST(CacheOptionsTests, FromEnvironment_ReadsAllVariables)
{
    // Act
    const auto options = CacheOptions::FromEnvironment(Lookup(
        {
            { "SHARDCACHE_CACHE_DIR", "/var/cache/shards" },
            { "SHARDCACHE_CACHE_SIZE", "1e12" },
            { "SHARDCACHE_VERBOSE", "1" },
            { "SHARDCACHE_SWEEP_INTERVAL", "5" },
        }));

    // Assert
    EXPECT_EQ(std::filesystem::path("/var/cache/shards"), options.cacheDir);
    EXPECT_EQ(1'000'000'000'000, options.maxCacheSize);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(std::chrono::seconds(5), options.sweepInterval);
}

TEST(CacheOptionsTests, FromEnvironment_EmptyValuesKeepDefaults)
{
    const auto options = CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_DIR", "" }, { "SHARDCACHE_VERBOSE", "" } }));
    EXPECT_EQ(std::filesystem::path("./_cache"), options.cacheDir);
    EXPECT_FALSE(options.verbose);
}

TEST(CacheOptionsTests, FromEnvironment_ClampsHugeSizes)
{
    const auto options = CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_SIZE", "1e30" } }));
    EXPECT_EQ(std::numeric_limits<int64_t>::max(), options.maxCacheSize);
}

TEST(CacheOptionsTests, FromEnvironment_NonPositiveSizeDisablesEviction)
{
    EXPECT_FALSE(CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_SIZE", "0" } })).EvictionEnabled());
    EXPECT_FALSE(CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_SIZE", "-1" } })).EvictionEnabled());
}

TEST(CacheOptionsTests, FromEnvironment_RejectsMalformedValues)
{
    EXPECT_THROW(CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_SIZE", "lots" } })), std::invalid_argument);
    EXPECT_THROW(CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_SIZE", "10GB" } })), std::invalid_argument);
    EXPECT_THROW(CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_SIZE", "nan" } })), std::invalid_argument);
    EXPECT_THROW(CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_VERBOSE", "yes" } })), std::invalid_argument);
    EXPECT_THROW(CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_SWEEP_INTERVAL", "-3" } })), std::invalid_argument);
}

TEST(CacheOptionsTests, FromEnvironment_ClampsHugeNegativeSizes)
{
    const auto options = CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_CACHE_SIZE", "-1e30" } }));
    EXPECT_EQ(std::numeric_limits<int64_t>::min(), options.maxCacheSize);
    EXPECT_FALSE(options.EvictionEnabled());
}

TEST(CacheOptionsTests, FromEnvironment_ClampsSweepIntervalToSteadyClockRange)
{
    // Arrange
    const auto longest = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max());

    // Act
    const auto large = CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_SWEEP_INTERVAL", "1e12" } }));
    const auto huge = CacheOptions::FromEnvironment(Lookup({ { "SHARDCACHE_SWEEP_INTERVAL", "1e30" } }));

    // Assert
    EXPECT_EQ(longest, large.sweepInterval);
    EXPECT_EQ(longest, huge.sweepInterval);
    const std::chrono::steady_clock::duration converted = large.sweepInterval;
    EXPECT_GT(converted, std::chrono::steady_clock::duration::zero());
}
