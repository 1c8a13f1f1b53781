// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#pragma once
#include "ShardCache/Core/Filesystem.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
namespace ShardCache::Core
{
    class ArchiveValidator
    {
        std::shared_ptr<Filesystem> m_filesystem;
    public:
        enum class FileType
        {
            Empty,
            Data,
            Tar,
            Gzip,
            Bzip2,
            Xz,
            Zstd,
            Zip,
        };

        explicit ArchiveValidator(std::shared_ptr<Filesystem> filesystem);

        [[nodiscard]] bool IsValidArchive(const std::filesystem::path& path);
        [[nodiscard]] FileType GuessFileType(const std::filesystem::path& path);

        /// <summary>
        /// Reads at most length bytes from the start of the file.
        /// </summary>
        [[nodiscard]] std::string ReadPreview(const std::filesystem::path& path, int64_t length);

        /// <summary>
        /// Classifies a file from its leading bytes. A tar header needs the full
        /// first 512 byte block.
        /// </summary>
        [[nodiscard]] static FileType Probe(std::span<const char> header);
        [[nodiscard]] static bool IsArchive(FileType type) noexcept;
        [[nodiscard]] static std::string_view Describe(FileType type) noexcept;

        /// <summary>
        /// Renders bytes printable, escaping everything else as \xNN.
        /// </summary>
        [[nodiscard]] static std::string Escape(std::string_view bytes);
    };
}
