// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Azure/AzureBlobTransport.hpp"
#include "ShardCache/Azure/BlobHelpers.hpp"
#include "ShardCache/Azure/Configuration.hpp"
#include "ShardCache/Azure/HttpTransport.hpp"
#include "ShardCache/Azure/Models/StorageAccountInfo.hpp"
#include "ShardCache/Core/ErrorHandlers.hpp"
#include "ShardCache/Core/FileCache.hpp"
#include "ShardCache/Core/LocalFilesystem.hpp"
#include "ShardCache/Core/LocalTransport.hpp"
#include "ShardCache/Core/SchemeTransport.hpp"
#include "ShardCache/Core/StreamOpener.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"
#include "ShardCache/Core/Models/CacheOptions.hpp"
#include "ShardCache/Core/Models/UrlRequest.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>
using namespace boost::log::trivial;

static std::optional<std::string> LookupEnvironment(std::string_view name)
{
    const char* value = std::getenv(std::string(name).c_str());
    if (!value)
    {
        return std::nullopt;
    }

    return std::string(value);
}

static void ConfigureLogging(const bool verbose)
{
    boost::log::core::get()->set_filter(boost::log::trivial::severity >= (verbose ? debug : warning));
}

static std::shared_ptr<ShardCache::Core::SchemeTransport> CreateTransport(const std::shared_ptr<ShardCache::Core::Filesystem>& filesystem,
    const std::shared_ptr<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>& logger)
{
    auto transport = std::make_shared<ShardCache::Core::SchemeTransport>();
    transport->Register(ShardCache::Core::UrlHelpers::Scheme::file, std::make_shared<ShardCache::Core::LocalTransport>(filesystem));

    auto http = std::make_shared<ShardCache::Azure::HttpTransport>(logger);
    transport->Register(ShardCache::Core::UrlHelpers::Scheme::http, http);
    transport->Register(ShardCache::Core::UrlHelpers::Scheme::https, http);

    if (auto accountUrl = LookupEnvironment(ShardCache::Azure::Configuration::Environment::StorageAccountUrl); accountUrl && !accountUrl->empty())
    {
        const ShardCache::Azure::Models::StorageAccountInfo storageAccount(*accountUrl,
            LookupEnvironment(ShardCache::Azure::Configuration::Environment::TenantId),
            LookupEnvironment(ShardCache::Azure::Configuration::Environment::ServicePrincipalId),
            LookupEnvironment(ShardCache::Azure::Configuration::Environment::ServicePrincipalSecret),
            LookupEnvironment(ShardCache::Azure::Configuration::Environment::ManagedIdentityId));
        transport->Register(ShardCache::Core::UrlHelpers::Scheme::azure,
            std::make_shared<ShardCache::Azure::AzureBlobTransport>(ShardCache::Azure::BlobHelpers::CreateServiceClient(storageAccount), logger));
    }
    else
    {
        BOOST_LOG_SEV(*logger, debug) << ShardCache::Azure::Configuration::Environment::StorageAccountUrl << " is not set. az:// URLs are unavailable";
    }

    return transport;
}

int main(int argc, char** argv)
{
    if (argc < 2)
    {
        std::cerr << "usage: " << argv[0] << " URL..." << std::endl
            << "Downloads each URL into the shard cache and prints 'url<TAB>local path<TAB>bytes'." << std::endl;
        return 2;
    }

    ShardCache::Core::Models::CacheOptions options;
    try
    {
        options = ShardCache::Core::Models::CacheOptions::FromEnvironment(LookupEnvironment);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << e.what() << std::endl;
        return 2;
    }

    ConfigureLogging(options.verbose);
    auto logger = std::make_shared<boost::log::sources::severity_logger_mt<boost::log::trivial::severity_level>>();
    auto filesystem = std::make_shared<ShardCache::Core::LocalFilesystem>(logger);

    std::vector<ShardCache::Core::Models::UrlRequest> requests;
    for (int i = 1; i < argc; ++i)
    {
        requests.emplace_back(std::string(argv[i]));
    }

    const auto requested = requests.size();
    std::size_t opened = 0;
    try
    {
        auto cache = std::make_shared<ShardCache::Core::FileCache>(options, CreateTransport(filesystem, logger), filesystem, logger);
        ShardCache::Core::StreamOpener opener(cache, ShardCache::Core::Models::MakeUrlSource(std::move(requests)), logger, ShardCache::Core::ErrorHandlers::WarnAndContinue(logger));
        while (auto result = opener.Next())
        {
            int64_t bytes = 0;
            std::vector<char> buffer(static_cast<std::size_t>(options.chunkSize));
            while (true)
            {
                const auto bytesRead = result->stream->Read(buffer.data(), options.chunkSize);
                if (bytesRead <= 0)
                {
                    break;
                }

                bytes += bytesRead;
            }

            std::cout << result->url << '\t' << result->localPath.string() << '\t' << bytes << std::endl;
            ++opened;
        }
    }
    catch (const std::exception& e)
    {
        BOOST_LOG_SEV(*logger, error) << "Fetch aborted. Error: " << e.what();
        return 1;
    }

    return opened == requested ? 0 : 1;
}
