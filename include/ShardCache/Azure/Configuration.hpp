// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <chrono>
#include <string_view>
namespace ShardCache::Azure
{
    struct Configuration
    {
        struct Environment
        {
            static constexpr std::string_view StorageAccountUrl = "SHARDCACHE_AZURE_ACCOUNT_URL";
            static constexpr std::string_view TenantId = "SHARDCACHE_AZURE_TENANT_ID";
            static constexpr std::string_view ServicePrincipalId = "SHARDCACHE_AZURE_CLIENT_ID";
            static constexpr std::string_view ServicePrincipalSecret = "SHARDCACHE_AZURE_CLIENT_SECRET";
            static constexpr std::string_view ManagedIdentityId = "SHARDCACHE_AZURE_MANAGED_IDENTITY_ID";
        };

        static const constexpr int MaxClientRetries = 8;
        static const constexpr int MaxRedirects = 5;
        static const constexpr std::chrono::milliseconds ConnectionTimeout = std::chrono::seconds(30);
    };
}
