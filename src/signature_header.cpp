#include "signature_header.hpp"

#include <sstream>
#include <utility>

#include "utils.hpp"

namespace httpsig
{

const std::vector<std::string>& defaultSignedHeaders()
{
    static const std::vector<std::string> headers = {REQUEST_TARGET, "date"};
    return headers;
}

namespace
{

using Component = std::pair<std::string, std::string>;

// Splits the header value on unquoted commas. A quote toggles the
// quoted state wherever it shows up in a value, and is not part of the
// value itself.
std::vector<Component> splitComponents(std::string_view header)
{
    std::vector<Component> components;
    std::string key, val;
    bool in_quote = false;
    bool parsing_key = true;
    // Set once the value has a character or an opening quote.
    bool has_value = false;

    auto finish = [&]()
    {
        std::string name(strip(key));
        if(!name.empty())
        {
            components.emplace_back(std::move(name), std::string(strip(val)));
        }
        key.clear();
        val.clear();
        parsing_key = true;
        has_value = false;
    };

    for(char c : header)
    {
        if(parsing_key)
        {
            if(c == '=')
            {
                parsing_key = false;
            }
            else if(c == ',')
            {
                // A bare token without “=”.
                key.clear();
            }
            else
            {
                key += c;
            }
        }
        else
        {
            if(c == '"')
            {
                in_quote = !in_quote;
                has_value = true;
            }
            else if(c == ',' && !in_quote)
            {
                finish();
            }
            else
            {
                val += c;
                has_value = true;
            }
        }
    }
    // The last component only counts if it got its “=”, some value and
    // closed all its quotes.
    if(!parsing_key && !in_quote && has_value)
    {
        finish();
    }
    return components;
}

std::vector<std::string> splitHeaderNames(const std::string& s)
{
    std::vector<std::string> names;
    std::istringstream ss(s);
    std::string name;
    while(ss >> name)
    {
        names.push_back(std::move(name));
    }
    return names;
}

} // namespace

SignatureDescriptor parseSignatureHeader(std::string_view header)
{
    SignatureDescriptor sig;
    for(auto& [name, val] : splitComponents(header))
    {
        if(name == "keyId")
        {
            sig.key_id = std::move(val);
        }
        else if(name == "algorithm")
        {
            sig.algorithm = std::move(val);
        }
        else if(name == "headers")
        {
            std::vector<std::string> names = splitHeaderNames(val);
            if(names.empty())
            {
                sig.headers = defaultSignedHeaders();
            }
            else
            {
                sig.headers = std::move(names);
            }
        }
        else if(name == "signature")
        {
            sig.signature = std::move(val);
        }
    }
    return sig;
}

E<void> validateSyntax(const SignatureDescriptor& sig)
{
    if(sig.key_id.empty())
    {
        return std::unexpected(syntaxError(
            "keyId is a mandatory signature header component"));
    }
    if(sig.signature.empty())
    {
        return std::unexpected(syntaxError(
            "signature is a mandatory signature header component"));
    }
    return {};
}

std::string serialize(const SignatureDescriptor& sig)
{
    return "keyId=\"" + sig.key_id + "\",algorithm=\"" + sig.algorithm +
           "\",headers=\"" + join(sig.headers, " ") + "\",signature=\"" +
           sig.signature + "\"";
}

} // namespace httpsig
