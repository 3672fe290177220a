#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace httpsig
{

using HeaderList = std::vector<std::string>;

// Which components to sign on an outbound request. Built once from
// configuration and then only read.
struct HeaderSelectionPolicy
{
    // Used when neither the target nor the algorithm has its own list.
    std::optional<HeaderList> default_headers;
    // Keyed by lowercase algorithm token.
    std::map<std::string, HeaderList> by_algorithm;
    // Keyed by keyId of the outbound target.
    std::map<std::string, HeaderList> by_target;

    // The target's own list, else the algorithm's, else the default,
    // else (request-target) and date. An empty configured list is
    // returned as is.
    HeaderList resolve(const std::string& key_id,
                       const std::optional<std::string>& algorithm) const;
};

} // namespace httpsig
