// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Transport.hpp"
#include "ShardCache/Core/Util.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
namespace ShardCache::Core
{
    /// <summary>
    /// Routes each URL to the transport registered for its scheme.
    /// </summary>
    class SchemeTransport final : public Transport
    {
        std::unordered_map<std::string, std::shared_ptr<Transport>, StringHash, StringEqual> m_transports;
    public:
        void Register(std::string_view scheme, std::shared_ptr<Transport> transport);
        [[nodiscard]] bool Supports(std::string_view scheme) const;
        virtual std::unique_ptr<InputStream> Open(const std::string& url) override;
    };
}
