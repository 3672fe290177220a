#include "signer.hpp"

#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "signing_string.hpp"

namespace httpsig
{

Signer::Signer(std::unique_ptr<mw::CryptoInterface> crypto)
    : crypto(std::move(crypto))
{
}

E<SignatureDescriptor> Signer::sign(const RequestView& req,
                                    const HeaderList& headers,
                                    const std::string& key_id,
                                    const std::string& algorithm,
                                    const KeyMaterial& key) const
{
    Algorithm algo = impliedAlgorithm(key);
    if(!algorithm.empty())
    {
        HTTPSIG_ASSIGN_OR_RETURN(algo, algorithmFromStr(algorithm));
    }

    std::string to_sign = buildSigningString(req, headers);
    std::vector<unsigned char> sig_bytes;
    switch(algo)
    {
    case Algorithm::RSA_SHA256:
    {
        const RsaKeys* keys = std::get_if<RsaKeys>(&key);
        if(keys == nullptr)
        {
            return std::unexpected(
                keyMismatch("rsa-sha256 needs an RSA private key"));
        }
        if(keys->private_key.empty())
        {
            return std::unexpected(
                keyMismatch("No private key to sign with"));
        }
        auto sig = crypto->sign(mw::SignatureAlgorithm::RSA_V1_5_SHA256,
                                keys->private_key, to_sign);
        if(!sig)
        {
            return std::unexpected(cryptoError(sig.error()));
        }
        sig_bytes = *std::move(sig);
        break;
    }
    case Algorithm::HMAC_SHA256:
    {
        const HmacSecret* secret = std::get_if<HmacSecret>(&key);
        if(secret == nullptr)
        {
            return std::unexpected(
                keyMismatch("hmac-sha256 needs a shared secret"));
        }
        sig_bytes = hmacSha256(secret->secret, to_sign);
        break;
    }
    }

    SignatureDescriptor result;
    result.key_id = key_id;
    result.algorithm = algorithmStr(algo);
    result.headers = headers;
    result.signature = mw::base64Encode(sig_bytes);
    spdlog::debug("Signed {} components with {} for keyId {}",
                  headers.size(), result.algorithm, key_id);
    return result;
}

} // namespace httpsig
