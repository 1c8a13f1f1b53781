// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/InputStream.hpp"
#include "ShardCache/Core/WritableFile.hpp"
#include <fstream>
#include <filesystem>
namespace ShardCache::Core
{
    class LocalFile final : public InputStream
    {
        std::ifstream m_file;
    public:
        explicit LocalFile(const std::filesystem::path& path);
        virtual int64_t Read(char* buffer, int64_t length) override;
    };

    class LocalWritableFile final : public WritableFile
    {
        std::filesystem::path m_path;
        std::ofstream m_file;
    public:
        explicit LocalWritableFile(const std::filesystem::path& path);
        virtual void Append(const char* data, int64_t length) override;
        virtual void Close() override;
    };
}
