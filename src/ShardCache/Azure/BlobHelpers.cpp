// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Azure/BlobHelpers.hpp"
#include "ShardCache/Azure/Configuration.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"

#include <azure/identity/chained_token_credential.hpp>
#include <azure/identity/managed_identity_credential.hpp>
#include <azure/identity/environment_credential.hpp>
#include <azure/identity/workload_identity_credential.hpp>

#include <stdexcept>
namespace ShardCache::Azure
{
    ::Azure::Storage::Blobs::BlobClientOptions BlobHelpers::CreateBlobClientOptions()
    {
        auto opts = ::Azure::Storage::Blobs::BlobClientOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Identity::ClientSecretCredentialOptions BlobHelpers::CreateClientSecretCredentialOptions()
    {
        auto opts = ::Azure::Identity::ClientSecretCredentialOptions();
        opts.Retry.MaxRetries = Configuration::MaxClientRetries;
        return opts;
    }

    ::Azure::Storage::Blobs::BlobServiceClient BlobHelpers::CreateServiceClient(const Models::StorageAccountInfo& storageAccount)
    {
        ::Azure::Identity::ChainedTokenCredential::Sources credSources;
        auto clientSecretOptions = CreateClientSecretCredentialOptions();

        // Explicit credentials are tried first.
        if (storageAccount.HasServicePrincipal())
        {
            credSources.push_back(std::make_shared<::Azure::Identity::ClientSecretCredential>(std::string(*storageAccount.GetTenantId()),
                std::string(*storageAccount.GetServicePrincipalId()),
                std::string(*storageAccount.GetServicePrincipalSecret()),
                clientSecretOptions));
        }

        if (storageAccount.GetManagedIdentityId())
        {
            credSources.push_back(std::make_shared<::Azure::Identity::ManagedIdentityCredential>(std::string(*storageAccount.GetManagedIdentityId()), clientSecretOptions));
        }

        credSources.push_back(std::make_shared<::Azure::Identity::EnvironmentCredential>(clientSecretOptions));
        credSources.push_back(std::make_shared<::Azure::Identity::WorkloadIdentityCredential>(clientSecretOptions));

        auto cred = std::make_shared<::Azure::Identity::ChainedTokenCredential>(credSources);

        auto blobOptions = CreateBlobClientOptions();
        return ::Azure::Storage::Blobs::BlobServiceClient
        {
            storageAccount.GetStorageAccountUrl(),
            std::move(cred),
            blobOptions
        };
    }

    std::pair<std::string, std::string> BlobHelpers::SplitBlobUrl(const std::string& url)
    {
        const auto parsed = Core::UrlHelpers::Parse(url);
        auto blobName = std::string_view(parsed.path);
        while (blobName.starts_with('/'))
        {
            blobName.remove_prefix(1);
        }

        if (parsed.scheme != Core::UrlHelpers::Scheme::azure || parsed.authority.empty() || blobName.empty())
        {
            throw std::invalid_argument("Expected az://<container>/<blob>, got '" + url + "'");
        }

        return std::make_pair(parsed.authority, std::string(blobName));
    }
}
