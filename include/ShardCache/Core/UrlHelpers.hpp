// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <string>
#include <string_view>
namespace ShardCache::Core
{
    struct ParsedUrl
    {
        std::string scheme;
        std::string authority;
        std::string path;
        std::string query;
        std::string fragment;
    };

    struct UrlHelpers
    {
        struct Scheme
        {
            static constexpr std::string_view file = "file";
            static constexpr std::string_view http = "http";
            static constexpr std::string_view https = "https";
            static constexpr std::string_view azure = "az";
        };

        /// <summary>
        /// Splits a URL into scheme://authority/path?query#fragment. The scheme is
        /// lower-cased; a string without a valid scheme prefix parses as a bare path.
        /// </summary>
        [[nodiscard]] static ParsedUrl Parse(std::string_view url);

        /// <summary>
        /// True for URLs with an empty or "file" scheme.
        /// </summary>
        [[nodiscard]] static bool IsLocal(std::string_view url);

        /// <summary>
        /// Percent-encodes every byte except ASCII letters, digits, "_.-~" and the
        /// characters in safe.
        /// </summary>
        [[nodiscard]] static std::string Quote(std::string_view value, std::string_view safe = "/");
    };
}
