// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/InputStream.hpp"

#include <azure/core/context.hpp>
#include <azure/core/io/body_stream.hpp>

#include <memory>
#include <string>
namespace ShardCache::Azure
{
    /// <summary>
    /// Exposes a response body as an InputStream. Transport failures while
    /// reading surface as FetchError.
    /// </summary>
    class BodyStreamInput final : public Core::InputStream
    {
        std::string m_url;
        std::unique_ptr<::Azure::Core::IO::BodyStream> m_body;
        ::Azure::Core::Context m_context;
    public:
        BodyStreamInput(std::string url, std::unique_ptr<::Azure::Core::IO::BodyStream> body);
        virtual int64_t Read(char* buffer, int64_t length) override;
    };
}
