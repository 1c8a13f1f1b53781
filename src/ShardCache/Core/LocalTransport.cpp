// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/LocalTransport.hpp"
#include "ShardCache/Core/Errors.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"
namespace ShardCache::Core
{
    LocalTransport::LocalTransport(std::shared_ptr<Filesystem> filesystem)
        : m_filesystem(std::move(filesystem))
    {
    }

    std::unique_ptr<InputStream> LocalTransport::Open(const std::string& url)
    {
        const auto parsed = UrlHelpers::Parse(url);
        if (!parsed.scheme.empty() && parsed.scheme != UrlHelpers::Scheme::file)
        {
            throw FetchError(url, "Not a local file URL");
        }

        try
        {
            return m_filesystem->Open(parsed.path);
        }
        catch (const std::exception& e)
        {
            throw FetchError(url, e.what());
        }
    }
}
