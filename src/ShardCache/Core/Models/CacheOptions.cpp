// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/Models/CacheOptions.hpp"

#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
namespace ShardCache::Core::Models
{
    static double ParseNumber(std::string_view name, const std::string& value)
    {
        std::size_t consumed = 0;
        double number = 0;
        try
        {
            number = std::stod(value, &consumed);
        }
        catch (const std::exception&)
        {
            throw std::invalid_argument(std::string(name) + " must be a number, got '" + value + "'");
        }

        if (consumed != value.size() || !std::isfinite(number))
        {
            throw std::invalid_argument(std::string(name) + " must be a number, got '" + value + "'");
        }

        return number;
    }

    CacheOptions CacheOptions::FromEnvironment(const EnvironmentLookup& lookup)
    {
        using Env = Configuration::Environment;
        CacheOptions options;

        if (auto dir = lookup(Env::CacheDir); dir && !dir->empty())
        {
            options.cacheDir = *dir;
        }

        if (auto size = lookup(Env::CacheSize); size && !size->empty())
        {
            // Accepts "1e12" style values.
            const auto bytes = ParseNumber(Env::CacheSize, *size);
            if (bytes >= static_cast<double>(std::numeric_limits<int64_t>::max()))
            {
                options.maxCacheSize = std::numeric_limits<int64_t>::max();
            }
            else if (bytes <= static_cast<double>(std::numeric_limits<int64_t>::min()))
            {
                options.maxCacheSize = std::numeric_limits<int64_t>::min();
            }
            else
            {
                options.maxCacheSize = static_cast<int64_t>(bytes);
            }
        }

        if (auto verbose = lookup(Env::Verbose); verbose && !verbose->empty())
        {
            options.verbose = ParseNumber(Env::Verbose, *verbose) != 0;
        }

        if (auto interval = lookup(Env::SweepInterval); interval && !interval->empty())
        {
            const auto seconds = ParseNumber(Env::SweepInterval, *interval);
            if (seconds < 0)
            {
                throw std::invalid_argument(std::string(Env::SweepInterval) + " must not be negative");
            }

            // The sweeper measures the interval on the steady clock, so it must fit there.
            const auto longest = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max());
            options.sweepInterval = seconds >= static_cast<double>(longest.count())
                ? longest
                : std::chrono::seconds(static_cast<int64_t>(seconds));
        }

        return options;
    }
}
