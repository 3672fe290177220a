#pragma once

#include <memory>

#include <mw/crypto.hpp>

#include "crypto.hpp"
#include "error.hpp"
#include "header_policy.hpp"
#include "request_view.hpp"
#include "signature_header.hpp"

namespace httpsig
{

class SignatureVerifier
{
public:
    explicit SignatureVerifier(std::unique_ptr<mw::CryptoInterface> crypto);

    // Verifies the signature against the signing string rebuilt from
    // our own view of the request, using the components the signature
    // claims to cover. Every name in required_headers must be among
    // those components. The key has already been looked up by keyId.
    E<void> verify(const SignatureDescriptor& sig, const RequestView& req,
                   const KeyMaterial& key,
                   const HeaderList& required_headers) const;

private:
    std::unique_ptr<mw::CryptoInterface> crypto;

    E<void> verifyRsa(const std::vector<unsigned char>& sig_bytes,
                      const std::string& signed_str,
                      const KeyMaterial& key) const;
    E<void> verifyHmac(const std::vector<unsigned char>& sig_bytes,
                       const std::string& signed_str,
                       const KeyMaterial& key) const;
};

} // namespace httpsig
