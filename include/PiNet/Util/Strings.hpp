#ifndef PINET_STRINGS_HPP
#define PINET_STRINGS_HPP

#include <string>
#include <string_view>
#include <vector>

namespace PiNet::Util
{
    inline std::string_view trim(std::string_view text)
    {
        constexpr std::string_view whitespace = " \t\r\n";
        const auto first = text.find_first_not_of(whitespace);
        if (first == std::string_view::npos)
        {
            return {};
        }
        const auto last = text.find_last_not_of(whitespace);
        return text.substr(first, last - first + 1);
    }

    inline std::vector<std::string> split(std::string_view text, const char separator)
    {
        std::vector<std::string> parts;
        std::size_t start = 0;
        while (true)
        {
            const auto pos = text.find(separator, start);
            if (pos == std::string_view::npos)
            {
                parts.emplace_back(text.substr(start));
                return parts;
            }
            parts.emplace_back(text.substr(start, pos - start));
            start = pos + 1;
        }
    }

    // Lines of command output, without the trailing empty line
    inline std::vector<std::string> lines(std::string_view text)
    {
        auto result = split(text, '\n');
        if (!result.empty() && result.back().empty())
        {
            result.pop_back();
        }
        return result;
    }

    inline std::string to_lower(std::string_view text)
    {
        std::string result(text);
        for (auto& c : result)
        {
            if (c >= 'A' && c <= 'Z')
            {
                c = static_cast<char>(c - 'A' + 'a');
            }
        }
        return result;
    }

    inline std::string join(const std::vector<std::string>& parts, std::string_view separator)
    {
        std::string result;
        for (std::size_t i = 0; i < parts.size(); ++i)
        {
            if (i > 0)
            {
                result += separator;
            }
            result += parts[i];
        }
        return result;
    }
}

#endif //PINET_STRINGS_HPP
