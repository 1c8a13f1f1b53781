// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Azure/AzureErrorTranslator.hpp"
namespace ShardCache::Azure
{
    bool AzureErrorTranslator::IsRetryable(const ::Azure::Core::Http::HttpStatusCode statusCode) noexcept
    {
        using ::Azure::Core::Http::HttpStatusCode;
        switch (statusCode)
        {
        case HttpStatusCode::RequestTimeout:
        case HttpStatusCode::TooManyRequests:
        case HttpStatusCode::InternalServerError:
        case HttpStatusCode::BadGateway:
        case HttpStatusCode::ServiceUnavailable:
        case HttpStatusCode::GatewayTimeout:
            return true;
        default:
            return false;
        }
    }

    Core::FetchError AzureErrorTranslator::FetchErrorFromStatus(const std::string& url, const ::Azure::Core::Http::HttpStatusCode statusCode, const std::string& reason)
    {
        const auto code = static_cast<int>(statusCode);
        return Core::FetchError(url,
            "HTTP " + std::to_string(code) + (reason.empty() ? "" : " " + reason),
            code,
            IsRetryable(statusCode));
    }

    Core::FetchError AzureErrorTranslator::FetchErrorFromException(const std::string& url, const ::Azure::Core::RequestFailedException& exception)
    {
        // Failures below HTTP (DNS, connect, TLS) carry no status code.
        if (exception.StatusCode == ::Azure::Core::Http::HttpStatusCode::None)
        {
            return Core::FetchError(url, exception.what(), std::nullopt, true);
        }

        return Core::FetchError(url,
            exception.Message.empty() ? std::string(exception.what()) : exception.Message,
            static_cast<int>(exception.StatusCode),
            IsRetryable(exception.StatusCode));
    }
}
