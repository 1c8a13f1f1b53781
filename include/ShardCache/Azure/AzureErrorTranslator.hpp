// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Errors.hpp"

#include <azure/core/exception.hpp>
#include <azure/core/http/http_status_code.hpp>

#include <string>
namespace ShardCache::Azure
{
    struct AzureErrorTranslator
    {
        static bool IsRetryable(::Azure::Core::Http::HttpStatusCode statusCode) noexcept;
        static Core::FetchError FetchErrorFromStatus(const std::string& url, ::Azure::Core::Http::HttpStatusCode statusCode, const std::string& reason);
        static Core::FetchError FetchErrorFromException(const std::string& url, const ::Azure::Core::RequestFailedException& exception);
    };
}
