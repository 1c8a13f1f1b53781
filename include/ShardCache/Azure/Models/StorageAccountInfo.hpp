// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <string>
#include <string_view>
#include <optional>
namespace ShardCache::Azure::Models
{
    /// <summary>
    /// Storage account to read az:// URLs from. Credentials are optional; the
    /// environment, workload and managed identities are always tried as well.
    /// </summary>
    class StorageAccountInfo
    {
        std::string m_storageAccountUrl;
        std::optional<std::string> m_tenantId;
        std::optional<std::string> m_servicePrincipalId;
        std::optional<std::string> m_servicePrincipalSecret;
        std::optional<std::string> m_managedIdentityId;
    public:
        explicit StorageAccountInfo(std::string storageAccountUrl,
            std::optional<std::string> tenantId = {},
            std::optional<std::string> servicePrincipalId = {},
            std::optional<std::string> servicePrincipalSecret = {},
            std::optional<std::string> managedIdentityId = {});

        const std::string& GetStorageAccountUrl() const noexcept;
        std::optional<std::string_view> GetTenantId() const noexcept;
        std::optional<std::string_view> GetServicePrincipalId() const noexcept;
        std::optional<std::string_view> GetServicePrincipalSecret() const noexcept;
        std::optional<std::string_view> GetManagedIdentityId() const noexcept;
        bool HasServicePrincipal() const noexcept;
    };
}
