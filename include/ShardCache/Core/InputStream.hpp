// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
namespace ShardCache::Core
{
    class InputStream
    {
    public:
        virtual ~InputStream() = default;

        /// <summary>
        /// Reads up to length bytes into buffer.
        /// </summary>
        /// <returns>The number of bytes read. Zero once the stream is exhausted.</returns>
        virtual int64_t Read(char* buffer, int64_t length) = 0;
    };
}
