// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/SchemeTransport.hpp"
#include "ShardCache/Core/Errors.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"
namespace ShardCache::Core
{
    void SchemeTransport::Register(std::string_view scheme, std::shared_ptr<Transport> transport)
    {
        m_transports.insert_or_assign(ToLower(scheme), std::move(transport));
    }

    bool SchemeTransport::Supports(std::string_view scheme) const
    {
        return m_transports.find(ToLower(scheme)) != m_transports.end();
    }

    std::unique_ptr<InputStream> SchemeTransport::Open(const std::string& url)
    {
        const auto scheme = UrlHelpers::Parse(url).scheme;
        auto it = m_transports.find(scheme);
        if (it == m_transports.end())
        {
            throw FetchError(url, "No transport registered for scheme '" + scheme + "'");
        }

        return it->second->Open(url);
    }
}
