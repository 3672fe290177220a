#include "request_view.hpp"

#include <algorithm>
#include <cctype>

namespace httpsig
{

bool CaseInsensitiveLess::operator()(const std::string& a,
                                     const std::string& b) const
{
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](char x, char y)
        {
            return std::tolower(static_cast<unsigned char>(x)) <
                std::tolower(static_cast<unsigned char>(y));
        });
}

void RequestView::addHeader(const std::string& name, const std::string& value)
{
    headers.emplace(name, value);
}

bool RequestView::hasHeader(const std::string& name) const
{
    return headers.contains(name);
}

std::vector<std::string> RequestView::headerValues(const std::string& name)
    const
{
    std::vector<std::string> values;
    auto [begin, end] = headers.equal_range(name);
    for(auto it = begin; it != end; ++it)
    {
        values.push_back(it->second);
    }
    return values;
}

std::optional<std::string> RequestView::headerValue(const std::string& name)
    const
{
    // find() may land anywhere in the range of equal keys.
    auto [begin, end] = headers.equal_range(name);
    if(begin == end)
    {
        return std::nullopt;
    }
    return begin->second;
}

std::string RequestView::target() const
{
    if(query.empty())
    {
        return path;
    }
    return path + "?" + query;
}

} // namespace httpsig
