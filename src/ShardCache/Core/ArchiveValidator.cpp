// SPDX-License-Identifier: Apache-2.0
// SPDX-FileCopyrightText: Copyright 2025 AVEVA

#include "ShardCache/Core/ArchiveValidator.hpp"
#include "ShardCache/Core/Configuration.hpp"

#include <vector>
namespace ShardCache::Core
{
    static const constexpr std::size_t g_tarBlockSize = 512;
    static const constexpr std::size_t g_tarMagicOffset = 257;
    static const constexpr std::size_t g_tarChecksumOffset = 148;
    static const constexpr std::size_t g_tarChecksumLength = 8;

    static bool HasPrefix(std::span<const char> header, std::string_view magic)
    {
        return header.size() >= magic.size() && std::string_view(header.data(), magic.size()) == magic;
    }

    // Pre-POSIX (v7) archives have no magic. The header checksum is the sum of all
    // header bytes with the checksum field itself counted as spaces.
    static bool HasValidTarChecksum(std::span<const char> header)
    {
        if (header.size() < g_tarBlockSize || header[0] == '\0')
        {
            return false;
        }

        int64_t stored = 0;
        bool digits = false;
        for (std::size_t i = g_tarChecksumOffset; i < g_tarChecksumOffset + g_tarChecksumLength; ++i)
        {
            const auto c = header[i];
            if (c >= '0' && c <= '7')
            {
                stored = stored * 8 + (c - '0');
                digits = true;
            }
            else if (c == ' ' && !digits)
            {
                continue;
            }
            else if (c == ' ' || c == '\0')
            {
                break;
            }
            else
            {
                return false;
            }
        }

        if (!digits)
        {
            return false;
        }

        int64_t computed = 0;
        for (std::size_t i = 0; i < g_tarBlockSize; ++i)
        {
            const bool inChecksum = i >= g_tarChecksumOffset && i < g_tarChecksumOffset + g_tarChecksumLength;
            computed += inChecksum ? ' ' : static_cast<unsigned char>(header[i]);
        }

        return computed == stored;
    }

    ArchiveValidator::ArchiveValidator(std::shared_ptr<Filesystem> filesystem)
        : m_filesystem(std::move(filesystem))
    {
    }

    bool ArchiveValidator::IsValidArchive(const std::filesystem::path& path)
    {
        return IsArchive(GuessFileType(path));
    }

    ArchiveValidator::FileType ArchiveValidator::GuessFileType(const std::filesystem::path& path)
    {
        const auto header = ReadPreview(path, Configuration::ProbeSize);
        return Probe(std::span<const char>(header.data(), header.size()));
    }

    std::string ArchiveValidator::ReadPreview(const std::filesystem::path& path, int64_t length)
    {
        std::string buffer(static_cast<std::size_t>(length > 0 ? length : 0), '\0');
        auto file = m_filesystem->Open(path);

        int64_t offset = 0;
        while (offset < length)
        {
            const auto bytesRead = file->Read(buffer.data() + offset, length - offset);
            if (bytesRead <= 0)
            {
                break;
            }

            offset += bytesRead;
        }

        buffer.resize(static_cast<std::size_t>(offset));
        return buffer;
    }

    ArchiveValidator::FileType ArchiveValidator::Probe(std::span<const char> header)
    {
        if (header.empty())
        {
            return FileType::Empty;
        }

        if (HasPrefix(header, std::string_view("\x1f\x8b", 2)))
        {
            return FileType::Gzip;
        }

        if (HasPrefix(header, "BZh"))
        {
            return FileType::Bzip2;
        }

        if (HasPrefix(header, std::string_view("\xfd" "7zXZ\0", 6)))
        {
            return FileType::Xz;
        }

        if (HasPrefix(header, std::string_view("\x28\xb5\x2f\xfd", 4)))
        {
            return FileType::Zstd;
        }

        if (HasPrefix(header, std::string_view("PK\x03\x04", 4)) || HasPrefix(header, std::string_view("PK\x05\x06", 4)))
        {
            return FileType::Zip;
        }

        if (header.size() >= g_tarMagicOffset + 5 && std::string_view(header.data() + g_tarMagicOffset, 5) == "ustar")
        {
            return FileType::Tar;
        }

        if (HasValidTarChecksum(header))
        {
            return FileType::Tar;
        }

        return FileType::Data;
    }

    bool ArchiveValidator::IsArchive(FileType type) noexcept
    {
        switch (type)
        {
        case FileType::Tar:
        case FileType::Gzip:
        case FileType::Bzip2:
        case FileType::Xz:
        case FileType::Zstd:
        case FileType::Zip:
            return true;
        default:
            return false;
        }
    }

    std::string_view ArchiveValidator::Describe(FileType type) noexcept
    {
        switch (type)
        {
        case FileType::Empty:
            return "empty";
        case FileType::Tar:
            return "POSIX tar archive";
        case FileType::Gzip:
            return "gzip compressed data";
        case FileType::Bzip2:
            return "bzip2 compressed data";
        case FileType::Xz:
            return "XZ compressed data";
        case FileType::Zstd:
            return "Zstandard compressed data";
        case FileType::Zip:
            return "Zip archive data";
        case FileType::Data:
        default:
            return "data";
        }
    }

    std::string ArchiveValidator::Escape(std::string_view bytes)
    {
        static const constexpr char hex[] = "0123456789abcdef";

        std::string escaped;
        escaped.reserve(bytes.size());
        for (const char c : bytes)
        {
            const auto byte = static_cast<unsigned char>(c);
            switch (c)
            {
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (byte >= 0x20 && byte < 0x7f)
                {
                    escaped.push_back(c);
                }
                else
                {
                    escaped += "\\x";
                    escaped.push_back(hex[byte >> 4]);
                    escaped.push_back(hex[byte & 0x0F]);
                }
                break;
            }
        }

        return escaped;
    }
}
