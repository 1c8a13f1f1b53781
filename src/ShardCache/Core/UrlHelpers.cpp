// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/UrlHelpers.hpp"
#include "ShardCache/Core/Util.hpp"

#include <cctype>
namespace ShardCache::Core
{
    static bool IsSchemeChar(const char c)
    {
        const auto uc = static_cast<unsigned char>(c);
        return std::isalnum(uc) || c == '+' || c == '-' || c == '.';
    }

    static bool IsUnreserved(const char c)
    {
        const auto uc = static_cast<unsigned char>(c);
        return uc < 0x80 && (std::isalnum(uc) || c == '_' || c == '.' || c == '-' || c == '~');
    }

    ParsedUrl UrlHelpers::Parse(std::string_view url)
    {
        ParsedUrl parsed;

        // scheme ":" must start with a letter and contain only scheme characters
        const auto colon = url.find(':');
        if (colon != std::string_view::npos && colon > 0 && std::isalpha(static_cast<unsigned char>(url[0])))
        {
            bool valid = true;
            for (std::size_t i = 1; i < colon; ++i)
            {
                if (!IsSchemeChar(url[i]))
                {
                    valid = false;
                    break;
                }
            }

            if (valid)
            {
                parsed.scheme = ToLower(url.substr(0, colon));
                url.remove_prefix(colon + 1);
            }
        }

        const auto hash = url.find('#');
        if (hash != std::string_view::npos)
        {
            parsed.fragment = std::string(url.substr(hash + 1));
            url = url.substr(0, hash);
        }

        const auto question = url.find('?');
        if (question != std::string_view::npos)
        {
            parsed.query = std::string(url.substr(question + 1));
            url = url.substr(0, question);
        }

        if (url.starts_with("//"))
        {
            url.remove_prefix(2);
            const auto slash = url.find('/');
            parsed.authority = std::string(url.substr(0, slash));
            url = slash == std::string_view::npos ? std::string_view{} : url.substr(slash);
        }

        parsed.path = std::string(url);
        return parsed;
    }

    bool UrlHelpers::IsLocal(std::string_view url)
    {
        const auto scheme = Parse(url).scheme;
        return scheme.empty() || scheme == Scheme::file;
    }

    std::string UrlHelpers::Quote(std::string_view value, std::string_view safe)
    {
        static const constexpr char hex[] = "0123456789ABCDEF";

        std::string quoted;
        quoted.reserve(value.size());
        for (const char c : value)
        {
            if (IsUnreserved(c) || safe.find(c) != std::string_view::npos)
            {
                quoted.push_back(c);
                continue;
            }

            const auto byte = static_cast<unsigned char>(c);
            quoted.push_back('%');
            quoted.push_back(hex[byte >> 4]);
            quoted.push_back(hex[byte & 0x0F]);
        }

        return quoted;
    }
}
