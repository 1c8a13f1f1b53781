// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/CacheNaming.hpp"
#include "ShardCache/Core/Configuration.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"

#include <array>
#include <vector>
namespace ShardCache::Core
{
    static const constexpr std::string_view g_pipePrefix = "pipe:";
    static const constexpr std::string_view g_quoteSafe = "_+{}*,-";

    static std::vector<std::string_view> SplitPath(std::string_view path)
    {
        std::vector<std::string_view> segments;
        std::size_t start = 0;
        while (true)
        {
            const auto slash = path.find('/', start);
            segments.push_back(path.substr(start, slash == std::string_view::npos ? std::string_view::npos : slash - start));
            if (slash == std::string_view::npos)
            {
                break;
            }

            start = slash + 1;
        }

        return segments;
    }

    static std::string EncodedName(std::string_view url)
    {
        const auto quoted = UrlHelpers::Quote(url, g_quoteSafe);
        if (quoted.size() <= Configuration::MaxEncodedNameLength)
        {
            return quoted;
        }

        return quoted.substr(quoted.size() - Configuration::MaxEncodedNameLength);
    }

    bool CacheNaming::IsKnownScheme(std::string_view scheme)
    {
        static const constexpr std::array<std::string_view, 10> knownSchemes =
        {
            "", "file", "http", "https", "ftp", "ftps", "gs", "s3", "ais", "az"
        };

        for (const auto& known : knownSchemes)
        {
            if (scheme == known)
            {
                return true;
            }
        }

        return false;
    }

    std::string CacheNaming::UrlToCacheName(std::string_view url, int ndir)
    {
        const auto parsed = UrlHelpers::Parse(url);
        if (!IsKnownScheme(parsed.scheme))
        {
            return EncodedName(url);
        }

        const auto segments = SplitPath(parsed.path);
        const auto keep = static_cast<std::size_t>(ndir < 0 ? 1 : ndir + 1);
        const auto first = segments.size() > keep ? segments.size() - keep : 0;

        std::string name;
        for (auto i = first; i < segments.size(); ++i)
        {
            const auto segment = segments[i];

            // Anything that would not resolve to a file strictly below the cache
            // root falls back to the encoded form.
            if (segment == "." || segment == ".." || (i + 1 == segments.size() && segment.empty()))
            {
                return EncodedName(url);
            }

            if (segment.empty())
            {
                continue;
            }

            if (!name.empty())
            {
                name.push_back('/');
            }

            name.append(segment);
        }

        return name.empty() ? EncodedName(url) : name;
    }

    std::string CacheNaming::PipeCleaner(std::string_view spec)
    {
        static const constexpr std::array<std::string_view, 7> urlPrefixes =
        {
            "http:", "https:", "hdfs:", "gs:", "ais:", "s3:", "az:"
        };

        if (!spec.starts_with(g_pipePrefix))
        {
            return std::string(spec);
        }

        auto command = spec.substr(g_pipePrefix.size());
        while (!command.empty())
        {
            const auto space = command.find(' ');
            const auto word = command.substr(0, space);
            for (const auto& prefix : urlPrefixes)
            {
                if (word.starts_with(prefix))
                {
                    return std::string(word);
                }
            }

            if (space == std::string_view::npos)
            {
                break;
            }

            command.remove_prefix(space + 1);
        }

        return std::string(spec);
    }

    std::string CacheNaming::PipeAwareCacheName(std::string_view url)
    {
        return UrlToCacheName(PipeCleaner(url));
    }
}
