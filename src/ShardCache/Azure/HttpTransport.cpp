// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Azure/HttpTransport.hpp"
#include "ShardCache/Azure/AzureErrorTranslator.hpp"
#include "ShardCache/Azure/BodyStreamInput.hpp"
#include "ShardCache/Azure/HttpHelpers.hpp"
#include "ShardCache/Core/Errors.hpp"

#include <azure/core/context.hpp>
#include <azure/core/exception.hpp>
#include <azure/core/http/http.hpp>
#include <azure/core/url.hpp>

#include <stdexcept>
using namespace boost::log::trivial;
namespace ShardCache::Azure
{
    HttpTransport::HttpTransport(std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>> logger,
        std::chrono::milliseconds connectionTimeout)
        : m_logger(std::move(logger))
    {
        ::Azure::Core::Http::CurlTransportOptions options;
        options.ConnectionTimeout = connectionTimeout;
        m_transport = std::make_unique<::Azure::Core::Http::CurlTransport>(options);
    }

    std::unique_ptr<Core::InputStream> HttpTransport::Open(const std::string& url)
    {
        auto current = url;
        for (int redirects = 0; redirects <= Configuration::MaxRedirects; ++redirects)
        {
            try
            {
                ::Azure::Core::Url requestUrl(current);

                // Unbuffered so that the body is streamed straight into the cache.
                ::Azure::Core::Http::Request request(::Azure::Core::Http::HttpMethod::Get, requestUrl, false);
                auto response = m_transport->Send(request, ::Azure::Core::Context());

                const auto statusCode = response->GetStatusCode();
                if (HttpHelpers::IsRedirect(statusCode))
                {
                    const auto& headers = response->GetHeaders();
                    const auto location = headers.find("location");
                    if (location == headers.end())
                    {
                        throw AzureErrorTranslator::FetchErrorFromStatus(url, statusCode, "redirect without location");
                    }

                    current = HttpHelpers::ResolveLocation(current, location->second);
                    BOOST_LOG_SEV(*m_logger, debug) << "Following redirect from '" << url << "' to '" << current << "'";
                    continue;
                }

                const auto code = static_cast<int>(statusCode);
                if (code < 200 || code >= 300)
                {
                    throw AzureErrorTranslator::FetchErrorFromStatus(url, statusCode, response->GetReasonPhrase());
                }

                return std::make_unique<BodyStreamInput>(url, response->ExtractBodyStream());
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

        throw Core::FetchError(url, "Too many redirects");
    }
}
