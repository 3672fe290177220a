#include "provider.hpp"

#include <format>
#include <optional>

#include <spdlog/spdlog.h>

#include "signature_header.hpp"
#include "utils.hpp"

namespace httpsig
{

namespace
{

constexpr std::string_view AUTH_SCHEME = "Signature ";

std::optional<std::string> findSignatureHeader(const RequestView& req)
{
    if(auto sig = req.headerValue(SIGNATURE_HEADER); sig.has_value())
    {
        return sig;
    }
    for(const std::string& auth : req.headerValues(AUTHORIZATION_HEADER))
    {
        if(auth.size() > AUTH_SCHEME.size() &&
           iequals(std::string_view(auth).substr(0, AUTH_SCHEME.size()),
                   AUTH_SCHEME))
        {
            return auth.substr(AUTH_SCHEME.size());
        }
    }
    return std::nullopt;
}

} // namespace

HttpSignatureProvider::HttpSignatureProvider(
    std::unique_ptr<KeyResolverInterface> resolver,
    HeaderSelectionPolicy policy, HeaderList required_headers,
    Signer signer, SignatureVerifier verifier)
    : resolver(std::move(resolver)), policy(std::move(policy)),
      required_headers(std::move(required_headers)),
      signer(std::move(signer)), verifier(std::move(verifier))
{
}

E<std::string> HttpSignatureProvider::authenticate(const RequestView& req)
    const
{
    std::optional<std::string> header = findSignatureHeader(req);
    if(!header.has_value())
    {
        return std::unexpected(MissingSignatureHeader{
            "Neither Signature nor Authorization: Signature header present"});
    }

    SignatureDescriptor sig = parseSignatureHeader(*header);
    HTTPSIG_DO_OR_RETURN(validateSyntax(sig));
    HTTPSIG_ASSIGN_OR_RETURN(InboundClient client,
                             resolver->resolveInbound(sig.key_id));

    if(!sig.algorithm.empty())
    {
        HTTPSIG_ASSIGN_OR_RETURN(Algorithm algo,
                                 algorithmFromStr(sig.algorithm));
        if(algo != client.algorithm)
        {
            spdlog::debug("keyId {} signed with {}, configured for {}",
                          sig.key_id, sig.algorithm,
                          algorithmStr(client.algorithm));
            return std::unexpected(UnsupportedAlgorithm{
                sig.algorithm,
                std::format("Algorithm of signature is {}, configured: {}",
                            sig.algorithm, algorithmStr(client.algorithm))});
        }
    }
    else
    {
        sig.algorithm = algorithmStr(client.algorithm);
    }

    if(auto valid = verifier.verify(sig, req, client.key, required_headers);
       !valid)
    {
        spdlog::debug("Rejected signature of {}: {}", sig.key_id,
                      errorMsg(valid.error()));
        return std::unexpected(valid.error());
    }

    if(client.principal.empty())
    {
        return client.key_id;
    }
    return client.principal;
}

E<std::string> HttpSignatureProvider::signOutbound(
    const RequestView& req, const std::string& key_id) const
{
    HTTPSIG_ASSIGN_OR_RETURN(OutboundTarget target,
                             resolver->resolveOutbound(key_id));
    std::string algorithm = algorithmStr(target.algorithm);
    HeaderList headers = target.headers.has_value()
        ? *target.headers : policy.resolve(key_id, algorithm);
    HTTPSIG_ASSIGN_OR_RETURN(
        SignatureDescriptor sig,
        signer.sign(req, headers, key_id, algorithm, target.key));
    return serialize(sig);
}

} // namespace httpsig
