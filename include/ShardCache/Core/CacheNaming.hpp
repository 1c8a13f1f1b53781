// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <functional>
#include <string>
#include <string_view>
namespace ShardCache::Core
{
    /// <summary>
    /// Maps a URL to a path relative to the cache root.
    /// </summary>
    using NameMapper = std::function<std::string(const std::string&)>;

    struct CacheNaming
    {
        /// <summary>
        /// Derives the cache name for a URL. For known schemes this is the last
        /// ndir + 1 segments of the URL path. Anything else is percent-encoded as a
        /// whole and truncated to its last 128 characters.
        /// </summary>
        [[nodiscard]] static std::string UrlToCacheName(std::string_view url, int ndir = 0);

        /// <summary>
        /// Returns the first URL embedded in a "pipe:" command spec, or spec itself
        /// when it is not a pipe spec or holds no recognizable URL.
        /// </summary>
        [[nodiscard]] static std::string PipeCleaner(std::string_view spec);

        [[nodiscard]] static std::string PipeAwareCacheName(std::string_view url);

        [[nodiscard]] static bool IsKnownScheme(std::string_view scheme);
    };
}
