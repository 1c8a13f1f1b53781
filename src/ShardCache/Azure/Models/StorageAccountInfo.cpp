#include "ShardCache/Azure/Models/StorageAccountInfo.hpp"
namespace ShardCache::Azure::Models
{
    StorageAccountInfo::StorageAccountInfo(std::string storageAccountUrl,
        std::optional<std::string> tenantId,
        std::optional<std::string> servicePrincipalId,
        std::optional<std::string> servicePrincipalSecret,
        std::optional<std::string> managedIdentityId)
        : m_storageAccountUrl(std::move(storageAccountUrl)),
        m_tenantId(std::move(tenantId)),
        m_servicePrincipalId(std::move(servicePrincipalId)),
        m_servicePrincipalSecret(std::move(servicePrincipalSecret)),
        m_managedIdentityId(std::move(managedIdentityId))
    {
    }

    const std::string& StorageAccountInfo::GetStorageAccountUrl() const noexcept
    {
        return m_storageAccountUrl;
    }

    std::optional<std::string_view> StorageAccountInfo::GetTenantId() const noexcept
    {
        return m_tenantId;
    }

    std::optional<std::string_view> StorageAccountInfo::GetServicePrincipalId() const noexcept
    {
        return m_servicePrincipalId;
    }

    std::optional<std::string_view> StorageAccountInfo::GetServicePrincipalSecret() const noexcept
    {
        return m_servicePrincipalSecret;
    }

    std::optional<std::string_view> StorageAccountInfo::GetManagedIdentityId() const noexcept
    {
        return m_managedIdentityId;
    }

    bool StorageAccountInfo::HasServicePrincipal() const noexcept
    {
        return m_tenantId && m_servicePrincipalId && m_servicePrincipalSecret;
    }
}
