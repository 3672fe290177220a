#pragma once

#include <string>
#include <vector>

#include "request_view.hpp"

namespace httpsig
{

// Builds the string that gets signed, one “name: value” line per
// component, each terminated by “\n”. A header the request does not
// carry contributes no line at all. Several values of one header are
// joined with “, ”.
std::string buildSigningString(const RequestView& req,
                               const std::vector<std::string>& components);

} // namespace httpsig
