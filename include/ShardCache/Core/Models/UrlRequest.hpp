// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/InputStream.hpp"

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
namespace ShardCache::Core::Models
{
    class UrlRequest
    {
        std::string m_url;
        std::map<std::string, std::string> m_metadata;
    public:
        // Implicit so that a bare URL can stand in for a request.
        UrlRequest(std::string url);
        UrlRequest(const char* url);
        UrlRequest(std::string url, std::map<std::string, std::string> metadata);

        const std::string& GetUrl() const noexcept;
        const std::map<std::string, std::string>& GetMetadata() const noexcept;
    };

    struct OpenStreamResult
    {
        std::string url;
        std::map<std::string, std::string> metadata;
        std::unique_ptr<InputStream> stream;
        std::filesystem::path localPath;
    };

    /// <summary>
    /// Pull based producer of URL requests. Returns std::nullopt once exhausted.
    /// </summary>
    using UrlSource = std::function<std::optional<UrlRequest>()>;

    [[nodiscard]] UrlSource MakeUrlSource(std::vector<UrlRequest> requests);
}
