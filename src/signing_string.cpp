#include "signing_string.hpp"

#include <mw/utils.hpp>

#include "signature_header.hpp"
#include "utils.hpp"

namespace httpsig
{

std::string buildSigningString(const RequestView& req,
                               const std::vector<std::string>& components)
{
    std::string result;
    for(const std::string& name : components)
    {
        if(iequals(name, REQUEST_TARGET))
        {
            std::string lower_method = req.method;
            mw::toLower(lower_method);
            result += std::string(REQUEST_TARGET) + ": " + lower_method +
                " " + req.target() + "\n";
            continue;
        }

        std::vector<std::string> values = req.headerValues(name);
        if(values.empty())
        {
            continue;
        }
        std::string lower_name = name;
        mw::toLower(lower_name);
        result += lower_name + ": " + join(values, ", ") + "\n";
    }
    return result;
}

} // namespace httpsig
