#include "ShardCache/Core/LocalFile.hpp"

#include <stdexcept>
namespace ShardCache::Core
{
    LocalFile::LocalFile(const std::filesystem::path& path)
        : m_file(path, std::ios::in | std::ios::binary)
    {
        if (!m_file.is_open())
        {
            throw std::runtime_error("Unable to open '" + path.string() + "' for reading");
        }
    }

    int64_t LocalFile::Read(char* buffer, int64_t length)
    {
        if (length <= 0 || m_file.eof())
        {
            return 0;
        }

        m_file.read(buffer, static_cast<std::streamsize>(length));
        if (m_file.bad())
        {
            throw std::runtime_error("I/O error while reading local file");
        }

        const auto bytesRead = m_file.gcount();
        if (bytesRead < 0)
        {
            throw std::runtime_error("Invalid file read request. Received negative number of bytes read.");
        }

        return static_cast<int64_t>(bytesRead);
    }

    LocalWritableFile::LocalWritableFile(const std::filesystem::path& path)
        : m_path(path),
        m_file(path, std::ios::out | std::ios::binary | std::ios::trunc)
    {
        if (!m_file.is_open())
        {
            throw std::runtime_error("Unable to open '" + path.string() + "' for writing");
        }
    }

    void LocalWritableFile::Append(const char* data, int64_t length)
    {
        m_file.write(data, static_cast<std::streamsize>(length));
        if (!m_file)
        {
            throw std::runtime_error("Failed to write to '" + m_path.string() + "'");
        }
    }

    void LocalWritableFile::Close()
    {
        m_file.flush();
        m_file.close();
        if (m_file.fail())
        {
            throw std::runtime_error("Failed to close '" + m_path.string() + "'");
        }
    }
}
