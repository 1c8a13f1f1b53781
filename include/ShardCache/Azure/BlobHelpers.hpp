#pragma once
#include "ShardCache/Azure/Models/StorageAccountInfo.hpp"

#include <azure/storage/blobs/blob_service_client.hpp>
#include <azure/identity/client_secret_credential.hpp>

#include <string>
#include <utility>
namespace ShardCache::Azure
{
    struct BlobHelpers
    {
        static ::Azure::Storage::Blobs::BlobClientOptions CreateBlobClientOptions();
        static ::Azure::Identity::ClientSecretCredentialOptions CreateClientSecretCredentialOptions();
        static ::Azure::Storage::Blobs::BlobServiceClient CreateServiceClient(const Models::StorageAccountInfo& storageAccount);

        /// <summary>
        /// Splits "az://container/path/to/blob" into its container and blob names.
        /// </summary>
        /// <exception cref="std::invalid_argument">The URL does not name both.</exception>
        static std::pair<std::string, std::string> SplitBlobUrl(const std::string& url);
    };
}
