// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/Errors.hpp"
#include "ShardCache/Core/ArchiveValidator.hpp"
namespace ShardCache::Core
{
    FetchError::FetchError(std::string url, const std::string& message, std::optional<int> statusCode, bool retryable)
        : std::runtime_error("Failed to fetch '" + url + "': " + message),
        m_url(std::move(url)),
        m_statusCode(statusCode),
        m_retryable(retryable)
    {
    }

    const std::string& FetchError::GetUrl() const noexcept
    {
        return m_url;
    }

    std::optional<int> FetchError::GetStatusCode() const noexcept
    {
        return m_statusCode;
    }

    bool FetchError::IsRetryable() const noexcept
    {
        return m_retryable;
    }

    ValidationError::ValidationError(std::filesystem::path path, std::string url, std::string fileType, std::string preview)
        : std::runtime_error(path.string() + " (" + url + ") is not a tar archive, but a " + fileType
            + ", contains '" + ArchiveValidator::Escape(preview) + "'"),
        m_path(std::move(path)),
        m_url(std::move(url)),
        m_fileType(std::move(fileType)),
        m_preview(std::move(preview))
    {
    }

    const std::filesystem::path& ValidationError::GetPath() const noexcept
    {
        return m_path;
    }

    const std::string& ValidationError::GetUrl() const noexcept
    {
        return m_url;
    }

    const std::string& ValidationError::GetFileType() const noexcept
    {
        return m_fileType;
    }

    const std::string& ValidationError::GetPreview() const noexcept
    {
        return m_preview;
    }

    RetriesExhaustedError::RetriesExhaustedError(std::string url, int attempts)
        : std::runtime_error("Giving up on '" + url + "' after " + std::to_string(attempts) + " attempts"),
        m_url(std::move(url)),
        m_attempts(attempts)
    {
    }

    const std::string& RetriesExhaustedError::GetUrl() const noexcept
    {
        return m_url;
    }

    int RetriesExhaustedError::GetAttempts() const noexcept
    {
        return m_attempts;
    }
}
