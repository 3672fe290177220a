#pragma once

#include <memory>
#include <string>

#include <mw/crypto.hpp>

#include "crypto.hpp"
#include "error.hpp"
#include "header_policy.hpp"
#include "request_view.hpp"
#include "signature_header.hpp"

namespace httpsig
{

class Signer
{
public:
    explicit Signer(std::unique_ptr<mw::CryptoInterface> crypto);

    // Signs the given components of the request. The returned
    // descriptor lists exactly these components in this order, so
    // that the receiver can rebuild the same signing string. An empty
    // algorithm means the one implied by the key.
    E<SignatureDescriptor> sign(const RequestView& req,
                                const HeaderList& headers,
                                const std::string& key_id,
                                const std::string& algorithm,
                                const KeyMaterial& key) const;

private:
    std::unique_ptr<mw::CryptoInterface> crypto;
};

} // namespace httpsig
