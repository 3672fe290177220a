#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace httpsig
{

std::string_view lstrip(std::string_view s);
std::string_view rstrip(std::string_view s);
std::string_view strip(std::string_view s);

// ASCII case-insensitive comparison, as HTTP header names are.
bool iequals(std::string_view a, std::string_view b);

std::string join(const std::vector<std::string>& parts, std::string_view sep);

} // namespace httpsig
