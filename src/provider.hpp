#pragma once

#include <memory>
#include <string>

#include "error.hpp"
#include "header_policy.hpp"
#include "key_resolver.hpp"
#include "request_view.hpp"
#include "signature_verifier.hpp"
#include "signer.hpp"

namespace httpsig
{

constexpr char SIGNATURE_HEADER[] = "Signature";
constexpr char AUTHORIZATION_HEADER[] = "Authorization";

// Ties key lookup and header policy to the signer and the verifier.
class HttpSignatureProvider
{
public:
    HttpSignatureProvider(std::unique_ptr<KeyResolverInterface> resolver,
                          HeaderSelectionPolicy policy,
                          HeaderList required_headers, Signer signer,
                          SignatureVerifier verifier);

    // Verifies the signature carried by the request, either in a
    // “Signature” header or in “Authorization: Signature ...”. Returns
    // the principal of the client that signed it.
    E<std::string> authenticate(const RequestView& req) const;

    // Returns the value of the “Signature” header to attach to the
    // request sent to the target with this keyId.
    E<std::string> signOutbound(const RequestView& req,
                                const std::string& key_id) const;

private:
    std::unique_ptr<KeyResolverInterface> resolver;
    const HeaderSelectionPolicy policy;
    const HeaderList required_headers;
    Signer signer;
    SignatureVerifier verifier;
};

} // namespace httpsig
