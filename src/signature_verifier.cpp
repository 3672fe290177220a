#include "signature_verifier.hpp"

#include <algorithm>

#include <mw/utils.hpp>
#include <spdlog/spdlog.h>

#include "signing_string.hpp"
#include "utils.hpp"

namespace httpsig
{

SignatureVerifier::SignatureVerifier(
    std::unique_ptr<mw::CryptoInterface> crypto)
    : crypto(std::move(crypto))
{
}

E<void> SignatureVerifier::verify(const SignatureDescriptor& sig,
                                  const RequestView& req,
                                  const KeyMaterial& key,
                                  const HeaderList& required_headers) const
{
    HTTPSIG_DO_OR_RETURN(validateSyntax(sig));

    for(const std::string& required : required_headers)
    {
        bool signed_it = std::any_of(
            sig.headers.begin(), sig.headers.end(),
            [&](const std::string& h) { return iequals(h, required); });
        if(!signed_it)
        {
            spdlog::debug("Signature of {} does not cover {}", sig.key_id,
                          required);
            return std::unexpected(missingRequiredHeader(required));
        }
    }

    Algorithm algo = impliedAlgorithm(key);
    if(!sig.algorithm.empty())
    {
        HTTPSIG_ASSIGN_OR_RETURN(algo, algorithmFromStr(sig.algorithm));
    }

    auto sig_bytes = mw::base64Decode(sig.signature);
    if(!sig_bytes)
    {
        spdlog::debug("Signature of {} is not valid base64", sig.key_id);
        return std::unexpected(signatureMismatch("Invalid base64 signature"));
    }

    std::string signed_str = buildSigningString(req, sig.headers);
    switch(algo)
    {
    case Algorithm::RSA_SHA256:
        return verifyRsa(*sig_bytes, signed_str, key);
    case Algorithm::HMAC_SHA256:
        return verifyHmac(*sig_bytes, signed_str, key);
    }
    return std::unexpected(unsupportedAlgorithm(sig.algorithm));
}

E<void> SignatureVerifier::verifyRsa(
    const std::vector<unsigned char>& sig_bytes,
    const std::string& signed_str, const KeyMaterial& key) const
{
    const RsaKeys* keys = std::get_if<RsaKeys>(&key);
    // The caller should not learn what kind of key the keyId has.
    if(keys == nullptr || keys->public_key.empty())
    {
        spdlog::debug("No RSA public key to verify rsa-sha256 with");
        return std::unexpected(signatureMismatch("Invalid signature"));
    }

    auto valid =
        crypto->verifySignature(mw::SignatureAlgorithm::RSA_V1_5_SHA256,
                                keys->public_key, sig_bytes, signed_str);
    if(!valid)
    {
        // A signature of the wrong size ends up here rather than as
        // false.
        spdlog::debug("RSA verification error: {}",
                      mw::errorMsg(valid.error()));
        return std::unexpected(signatureMismatch("Invalid signature"));
    }
    if(!*valid)
    {
        return std::unexpected(signatureMismatch("Invalid signature"));
    }
    return {};
}

E<void> SignatureVerifier::verifyHmac(
    const std::vector<unsigned char>& sig_bytes,
    const std::string& signed_str, const KeyMaterial& key) const
{
    const HmacSecret* secret = std::get_if<HmacSecret>(&key);
    if(secret == nullptr)
    {
        spdlog::debug("No shared secret to verify hmac-sha256 with");
        return std::unexpected(signatureMismatch("Invalid signature"));
    }
    std::vector<unsigned char> expected = hmacSha256(secret->secret,
                                                     signed_str);
    if(!constantTimeEquals(expected, sig_bytes))
    {
        return std::unexpected(signatureMismatch("Invalid signature"));
    }
    return {};
}

} // namespace httpsig
