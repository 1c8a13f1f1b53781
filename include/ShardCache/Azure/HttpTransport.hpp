// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Azure/Configuration.hpp"
#include "ShardCache/Core/Transport.hpp"

#include <azure/core/http/curl_transport.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

#include <chrono>
#include <memory>
namespace ShardCache::Azure
{
    /// <summary>
    /// Plain HTTP(S) GET over the Azure Core libcurl transport. Bodies are
    /// streamed, not buffered, and redirects are followed.
    /// </summary>
    class HttpTransport final : public Core::Transport
    {
        std::unique_ptr<::Azure::Core::Http::CurlTransport> m_transport;
        std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> m_logger;
    public:
        explicit HttpTransport(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
            std::chrono::milliseconds connectionTimeout = Configuration::ConnectionTimeout);
        virtual std::unique_ptr<Core::InputStream> Open(const std::string& url) override;
    };
}
