// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Azure/HttpHelpers.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"

#include <string_view>
namespace ShardCache::Azure
{
    static std::string RemoveDotSegments(std::string_view path)
    {
        std::string output;
        while (!path.empty())
        {
            if (path.starts_with("../"))
            {
                path.remove_prefix(3);
            }
            else if (path.starts_with("./"))
            {
                path.remove_prefix(2);
            }
            else if (path.starts_with("/./"))
            {
                path.remove_prefix(2);
            }
            else if (path == "/.")
            {
                path = "/";
            }
            else if (path.starts_with("/../") || path == "/..")
            {
                path = path.size() == 3 ? std::string_view("/") : path.substr(3);
                const auto slash = output.rfind('/');
                output.erase(slash == std::string::npos ? 0 : slash);
            }
            else if (path == "." || path == "..")
            {
                path = {};
            }
            else
            {
                // Move the first segment, with its leading slash, to the output.
                const auto next = path.find('/', path.starts_with('/') ? 1 : 0);
                output.append(path.substr(0, next));
                path = next == std::string_view::npos ? std::string_view{} : path.substr(next);
            }
        }

        return output;
    }

    bool HttpHelpers::IsRedirect(const ::Azure::Core::Http::HttpStatusCode statusCode)
    {
        const auto code = static_cast<int>(statusCode);
        return code == 301 || code == 302 || code == 303 || code == 307 || code == 308;
    }

    std::string HttpHelpers::ResolveLocation(const std::string& base, const std::string& location)
    {
        if (!Core::UrlHelpers::Parse(location).scheme.empty())
        {
            return location;
        }

        const auto parsedBase = Core::UrlHelpers::Parse(base);
        const auto schemePrefix = parsedBase.scheme + ":";
        if (location.starts_with("//"))
        {
            return schemePrefix + location;
        }

        const auto origin = schemePrefix + "//" + parsedBase.authority;
        if (location.empty())
        {
            return origin + parsedBase.path + (parsedBase.query.empty() ? "" : "?" + parsedBase.query);
        }

        const auto end = location.find_first_of("?#");
        const auto path = location.substr(0, end);
        const auto suffix = end == std::string::npos ? std::string() : location.substr(end);

        if (path.empty())
        {
            // "?query" or "#fragment" only
            const auto query = location.starts_with('#') && !parsedBase.query.empty() ? "?" + parsedBase.query : std::string();
            return origin + parsedBase.path + query + suffix;
        }

        if (path.starts_with('/'))
        {
            return origin + RemoveDotSegments(path) + suffix;
        }

        std::string merged;
        if (!parsedBase.authority.empty() && parsedBase.path.empty())
        {
            merged = "/" + path;
        }
        else
        {
            const auto slash = parsedBase.path.rfind('/');
            merged = (slash == std::string::npos ? std::string() : parsedBase.path.substr(0, slash + 1)) + path;
        }

        return origin + RemoveDotSegments(merged) + suffix;
    }
}
