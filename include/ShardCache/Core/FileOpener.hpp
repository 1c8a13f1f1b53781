// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/InputStream.hpp"

#include <filesystem>
#include <memory>
#include <string>
namespace ShardCache::Core
{
    struct OpenedFile
    {
        std::unique_ptr<InputStream> stream;

        /// <summary>
        /// Local path the stream reads from. Empty when the stream is not backed
        /// by a local file.
        /// </summary>
        std::filesystem::path localPath;
    };

    class FileOpener
    {
    public:
        FileOpener() = default;
        virtual ~FileOpener() = default;

        virtual OpenedFile OpenFile(const std::string& url) = 0;
    };
}
