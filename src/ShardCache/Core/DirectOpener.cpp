// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/DirectOpener.hpp"
#include "ShardCache/Core/UrlHelpers.hpp"
namespace ShardCache::Core
{
    DirectOpener::DirectOpener(std::shared_ptr<Transport> transport, std::shared_ptr<Filesystem> filesystem)
        : m_transport(std::move(transport)),
        m_filesystem(std::move(filesystem))
    {
    }

    OpenedFile DirectOpener::OpenFile(const std::string& url)
    {
        if (UrlHelpers::IsLocal(url))
        {
            const auto localPath = std::filesystem::path(UrlHelpers::Parse(url).path);
            return OpenedFile{ m_filesystem->Open(localPath), localPath };
        }

        return OpenedFile{ m_transport->Open(url), {} };
    }
}
