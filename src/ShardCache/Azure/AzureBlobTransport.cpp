// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Azure/AzureBlobTransport.hpp"
#include "ShardCache/Azure/AzureErrorTranslator.hpp"
#include "ShardCache/Azure/BlobHelpers.hpp"
#include "ShardCache/Azure/BodyStreamInput.hpp"
#include "ShardCache/Core/Errors.hpp"

#include <azure/core/exception.hpp>

#include <stdexcept>
using namespace boost::log::trivial;
namespace ShardCache::Azure
{
    AzureBlobTransport::AzureBlobTransport(::Azure::Storage::Blobs::BlobServiceClient client,
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger)
        : m_client(std::move(client)),
        m_logger(std::move(logger))
    {
    }

    std::unique_ptr<Core::InputStream> AzureBlobTransport::Open(const std::string& url)
    {
        try
        {
            const auto [containerName, blobName] = BlobHelpers::SplitBlobUrl(url);
            auto blobClient = m_client.GetBlobContainerClient(containerName).GetBlobClient(blobName);

            BOOST_LOG_SEV(*m_logger, debug) << "Opening blob '" << blobName << "' in container '" << containerName << "'";
            auto response = blobClient.Download();
            return std::make_unique<BodyStreamInput>(url, std::move(response.Value.BodyStream));
        }
        catch (const ::Azure::Core::RequestFailedException& e)
        {
            throw AzureErrorTranslator::FetchErrorFromException(url, e);
        }
        catch (const std::invalid_argument& e)
        {
            throw Core::FetchError(url, e.what());
        }
    }
}
