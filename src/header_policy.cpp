#include "header_policy.hpp"

#include <mw/utils.hpp>

#include "signature_header.hpp"

namespace httpsig
{

HeaderList HeaderSelectionPolicy::resolve(
    const std::string& key_id, const std::optional<std::string>& algorithm)
    const
{
    if(auto it = by_target.find(key_id); it != by_target.end())
    {
        return it->second;
    }
    if(algorithm.has_value())
    {
        std::string lower = *algorithm;
        mw::toLower(lower);
        if(auto it = by_algorithm.find(lower); it != by_algorithm.end())
        {
            return it->second;
        }
    }
    if(default_headers.has_value())
    {
        return *default_headers;
    }
    return defaultSignedHeaders();
}

} // namespace httpsig
