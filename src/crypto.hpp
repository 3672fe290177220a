#pragma once

#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "error.hpp"

namespace httpsig
{

enum class Algorithm { RSA_SHA256, HMAC_SHA256 };

// Case-insensitive.
E<Algorithm> algorithmFromStr(std::string_view s);
std::string algorithmStr(Algorithm algo);

// PEM encoded. Either half may be empty if only one direction is
// needed.
struct RsaKeys
{
    std::string private_key;
    std::string public_key;
};

struct HmacSecret
{
    std::string secret;
};

using KeyMaterial = std::variant<RsaKeys, HmacSecret>;

// The algorithm a key is used with when the signature header does not
// name one.
Algorithm impliedAlgorithm(const KeyMaterial& key);

std::vector<unsigned char> hmacSha256(std::string_view secret,
                                      std::string_view msg);

// Runs in time independent of where the buffers differ.
bool constantTimeEquals(std::span<const unsigned char> a,
                        std::span<const unsigned char> b);

} // namespace httpsig
