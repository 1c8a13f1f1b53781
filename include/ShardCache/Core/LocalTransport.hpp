// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Filesystem.hpp"
#include "ShardCache/Core/Transport.hpp"

#include <memory>
namespace ShardCache::Core
{
    class LocalTransport final : public Transport
    {
        std::shared_ptr<Filesystem> m_filesystem;
    public:
        explicit LocalTransport(std::shared_ptr<Filesystem> filesystem);
        virtual std::unique_ptr<InputStream> Open(const std::string& url) override;
    };
}
