#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "error.hpp"

namespace httpsig
{

constexpr char REQUEST_TARGET[] = "(request-target)";

// Signed when neither the header nor the configuration names any
// component.
const std::vector<std::string>& defaultSignedHeaders();

// The structured form of a “Signature” header value, e.g.
//
//   keyId="rsa-key-1",algorithm="rsa-sha256",
//   headers="(request-target) host date",signature="Base64(...)"
struct SignatureDescriptor
{
    std::string key_id;
    std::string algorithm;
    // Component names in signing order. Duplicates are allowed.
    std::vector<std::string> headers = defaultSignedHeaders();
    // Base64 encoded.
    std::string signature;

    bool operator==(const SignatureDescriptor&) const = default;
};

// Parsing never fails. Components that are not name=value (a bare
// token, an unterminated quote) are dropped. When a name appears more
// than once, the last value wins. Unknown names are ignored.
SignatureDescriptor parseSignatureHeader(std::string_view header);

// Purely syntactic: keyId and signature must be present.
E<void> validateSyntax(const SignatureDescriptor& sig);

// keyId, algorithm, headers, signature, in that order.
std::string serialize(const SignatureDescriptor& sig);

} // namespace httpsig
