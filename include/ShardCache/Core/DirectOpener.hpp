// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/FileOpener.hpp"
#include "ShardCache/Core/Filesystem.hpp"
#include "ShardCache/Core/Transport.hpp"

#include <memory>
namespace ShardCache::Core
{
    /// <summary>
    /// Opens URLs without caching them.
    /// </summary>
    class DirectOpener final : public FileOpener
    {
        std::shared_ptr<Transport> m_transport;
        std::shared_ptr<Filesystem> m_filesystem;
    public:
        DirectOpener(std::shared_ptr<Transport> transport, std::shared_ptr<Filesystem> filesystem);
        virtual OpenedFile OpenFile(const std::string& url) override;
    };
}
