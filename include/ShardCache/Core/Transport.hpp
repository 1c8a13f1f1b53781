// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/InputStream.hpp"
#include <string>
#include <memory>
namespace ShardCache::Core
{
    class Transport
    {
    public:
        Transport() = default;
        virtual ~Transport() = default;

        /// <summary>
        /// Opens a readable byte stream for the given URL.
        /// </summary>
        /// <param name="url">The URL to open.</param>
        /// <returns>The stream. Ownership passes to the caller.</returns>
        /// <exception cref="FetchError">The URL could not be opened.</exception>
        virtual std::unique_ptr<InputStream> Open(const std::string& url) = 0;
    };
}
