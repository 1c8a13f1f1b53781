// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Azure/BodyStreamInput.hpp"
#include "ShardCache/Azure/AzureErrorTranslator.hpp"

#include <azure/core/exception.hpp>

#include <cstdint>
namespace ShardCache::Azure
{
    BodyStreamInput::BodyStreamInput(std::string url, std::unique_ptr<::Azure::Core::IO::BodyStream> body)
        : m_url(std::move(url)),
        m_body(std::move(body))
    {
    }

    int64_t BodyStreamInput::Read(char* buffer, int64_t length)
    {
        if (length <= 0 || !m_body)
        {
            return 0;
        }

        try
        {
            const auto bytesRead = m_body->Read(reinterpret_cast<uint8_t*>(buffer), static_cast<std::size_t>(length), m_context);
            return static_cast<int64_t>(bytesRead);
        }
        catch (const ::Azure::Core::RequestFailedException& e)
        {
            throw AzureErrorTranslator::FetchErrorFromException(m_url, e);
        }
    }
}
