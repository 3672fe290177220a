#pragma once
#include <string>

namespace http_utils
{
// The current time in the format of the Date header.
std::string getHttpDate();
} // namespace http_utils
