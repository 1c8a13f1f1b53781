// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include <cstdint>
namespace ShardCache::Core
{
    class WritableFile
    {
    public:
        virtual ~WritableFile() = default;

        virtual void Append(const char* data, int64_t length) = 0;
        virtual void Close() = 0;
    };
}
