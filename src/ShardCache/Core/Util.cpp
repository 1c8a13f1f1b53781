#include "ShardCache/Core/Util.hpp"

#include <algorithm>
#include <cctype>
namespace ShardCache::Core
{
    bool StringEqual::operator()(const std::string& lhs, const std::string& rhs) const
    {
        return lhs == rhs;
    }

    bool StringEqual::operator()(std::string_view lhs, const std::string& rhs) const
    {
        return lhs == rhs;
    }

    bool StringEqual::operator()(const std::string& lhs, std::string_view rhs) const
    {
        return lhs == rhs;
    }

    bool StringEqual::operator()(std::string_view lhs, std::string_view rhs) const
    {
        return lhs == rhs;
    }

    std::size_t StringHash::operator()(const std::string& s) const
    {
        return std::hash<std::string>{}(s);
    }

    std::size_t StringHash::operator()(std::string_view s) const
    {
        return std::hash<std::string_view>{}(s);
    }

    std::string ToLower(std::string_view value)
    {
        std::string result(value);
        std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c)
            {
                return static_cast<char>(std::tolower(c));
            });
        return result;
    }
}
