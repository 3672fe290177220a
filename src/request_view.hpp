#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace httpsig
{

struct CaseInsensitiveLess
{
    bool operator()(const std::string& a, const std::string& b) const;
};

// The part of an HTTP request that takes part in signing. Header
// names are case-insensitive; a name may carry several values, kept
// in the order they were added.
struct RequestView
{
    std::string method = "GET";
    std::string path = "/";
    // Already encoded, without the leading “?”.
    std::string query;
    std::multimap<std::string, std::string, CaseInsensitiveLess> headers;

    void addHeader(const std::string& name, const std::string& value);
    bool hasHeader(const std::string& name) const;
    std::vector<std::string> headerValues(const std::string& name) const;
    // The first value, if any.
    std::optional<std::string> headerValue(const std::string& name) const;

    // Path plus query, as it appears on the request line.
    std::string target() const;
};

} // namespace httpsig
