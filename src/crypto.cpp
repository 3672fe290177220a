#include "crypto.hpp"

#include <cryptopp/hmac.h>
#include <cryptopp/misc.h>
#include <cryptopp/sha.h>
#include <mw/utils.hpp>

namespace httpsig
{

E<Algorithm> algorithmFromStr(std::string_view s)
{
    std::string lower(s);
    mw::toLower(lower);
    if(lower == "rsa-sha256")
    {
        return Algorithm::RSA_SHA256;
    }
    if(lower == "hmac-sha256")
    {
        return Algorithm::HMAC_SHA256;
    }
    return std::unexpected(unsupportedAlgorithm(std::string(s)));
}

std::string algorithmStr(Algorithm algo)
{
    switch(algo)
    {
    case Algorithm::RSA_SHA256:
        return "rsa-sha256";
    case Algorithm::HMAC_SHA256:
        return "hmac-sha256";
    }
    return "";
}

Algorithm impliedAlgorithm(const KeyMaterial& key)
{
    if(std::holds_alternative<HmacSecret>(key))
    {
        return Algorithm::HMAC_SHA256;
    }
    return Algorithm::RSA_SHA256;
}

std::vector<unsigned char> hmacSha256(std::string_view secret,
                                      std::string_view msg)
{
    CryptoPP::HMAC<CryptoPP::SHA256> hmac(
        reinterpret_cast<const CryptoPP::byte*>(secret.data()),
        secret.size());
    std::vector<unsigned char> mac(hmac.DigestSize());
    hmac.CalculateDigest(mac.data(),
                         reinterpret_cast<const CryptoPP::byte*>(msg.data()),
                         msg.size());
    return mac;
}

bool constantTimeEquals(std::span<const unsigned char> a,
                        std::span<const unsigned char> b)
{
    // The length of a MAC is public.
    if(a.size() != b.size())
    {
        return false;
    }
    return CryptoPP::VerifyBufsEqual(a.data(), b.data(), a.size());
}

} // namespace httpsig
