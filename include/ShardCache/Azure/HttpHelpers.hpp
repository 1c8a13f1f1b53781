// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <azure/core/http/http_status_code.hpp>

#include <string>
namespace ShardCache::Azure
{
    struct HttpHelpers
    {
        [[nodiscard]] static bool IsRedirect(::Azure::Core::Http::HttpStatusCode statusCode);

        /// <summary>
        /// Resolves a Location header value against the URL that produced it.
        /// Handles absolute, protocol-relative, absolute-path and relative-path
        /// references, including "." and ".." segments.
        /// </summary>
        [[nodiscard]] static std::string ResolveLocation(const std::string& base, const std::string& location);
    };
}
