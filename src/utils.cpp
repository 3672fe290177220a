#include "utils.hpp"

#include <algorithm>
#include <cctype>

namespace httpsig
{

namespace
{

bool isSpace(char c)
{
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

char lowerChar(char c)
{
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
}

} // namespace

std::string_view lstrip(std::string_view s)
{
    size_t i = 0;
    while(i < s.size() && isSpace(s[i]))
    {
        i++;
    }
    return s.substr(i);
}

std::string_view rstrip(std::string_view s)
{
    size_t n = s.size();
    while(n > 0 && isSpace(s[n - 1]))
    {
        n--;
    }
    return s.substr(0, n);
}

std::string_view strip(std::string_view s)
{
    return rstrip(lstrip(s));
}

bool iequals(std::string_view a, std::string_view b)
{
    return a.size() == b.size() &&
        std::equal(a.begin(), a.end(), b.begin(), [](char x, char y)
        {
            return lowerChar(x) == lowerChar(y);
        });
}

std::string join(const std::vector<std::string>& parts, std::string_view sep)
{
    std::string result;
    for(size_t i = 0; i < parts.size(); i++)
    {
        if(i > 0)
        {
            result += sep;
        }
        result += parts[i];
    }
    return result;
}

} // namespace httpsig
