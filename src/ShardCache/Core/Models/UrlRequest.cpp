#include "ShardCache/Core/Models/UrlRequest.hpp"

#include <memory>
namespace ShardCache::Core::Models
{
    UrlRequest::UrlRequest(std::string url)
        : m_url(std::move(url))
    {
    }

    UrlRequest::UrlRequest(const char* url)
        : m_url(url)
    {
    }

    UrlRequest::UrlRequest(std::string url, std::map<std::string, std::string> metadata)
        : m_url(std::move(url)),
        m_metadata(std::move(metadata))
    {
    }

    const std::string& UrlRequest::GetUrl() const noexcept
    {
        return m_url;
    }

    const std::map<std::string, std::string>& UrlRequest::GetMetadata() const noexcept
    {
        return m_metadata;
    }

    UrlSource MakeUrlSource(std::vector<UrlRequest> requests)
    {
        auto state = std::make_shared<std::pair<std::vector<UrlRequest>, std::size_t>>(std::move(requests), 0);
        return [state]() -> std::optional<UrlRequest>
        {
            auto& [items, next] = *state;
            if (next >= items.size())
            {
                return std::nullopt;
            }

            return items[next++];
        };
    }
}
