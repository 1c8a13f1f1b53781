// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
namespace ShardCache::Core
{
    /// <summary>
    /// A transport or I/O failure while fetching a URL. The canonical cache path
    /// is never created when this is thrown.
    /// </summary>
    class FetchError : public std::runtime_error
    {
        std::string m_url;
        std::optional<int> m_statusCode;
        bool m_retryable;
    public:
        FetchError(std::string url, const std::string& message, std::optional<int> statusCode = {}, bool retryable = false);

        const std::string& GetUrl() const noexcept;
        std::optional<int> GetStatusCode() const noexcept;
        bool IsRetryable() const noexcept;
    };

    /// <summary>
    /// A freshly downloaded file was not recognized as an archive. The file has
    /// already been removed from the cache when this is thrown.
    /// </summary>
    class ValidationError : public std::runtime_error
    {
        std::filesystem::path m_path;
        std::string m_url;
        std::string m_fileType;
        std::string m_preview;
    public:
        ValidationError(std::filesystem::path path, std::string url, std::string fileType, std::string preview);

        const std::filesystem::path& GetPath() const noexcept;
        const std::string& GetUrl() const noexcept;
        const std::string& GetFileType() const noexcept;
        const std::string& GetPreview() const noexcept;
    };

    class RetriesExhaustedError : public std::runtime_error
    {
        std::string m_url;
        int m_attempts;
    public:
        RetriesExhaustedError(std::string url, int attempts);

        const std::string& GetUrl() const noexcept;
        int GetAttempts() const noexcept;
    };
}
