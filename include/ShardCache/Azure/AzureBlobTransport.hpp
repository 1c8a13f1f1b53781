// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Transport.hpp"

#include <azure/storage/blobs.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <memory>
namespace ShardCache::Azure
{
    /// <summary>
    /// Opens az://container/blob URLs against a single storage account.
    /// </summary>
    class AzureBlobTransport final : public Core::Transport
    {
        ::Azure::Storage::Blobs::BlobServiceClient m_client;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;

    public:
        AzureBlobTransport(::Azure::Storage::Blobs::BlobServiceClient client,
            std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger);
        virtual std::unique_ptr<Core::InputStream> Open(const std::string& url) override;
    };
}
