#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "crypto.hpp"
#include "error.hpp"
#include "header_policy.hpp"

namespace httpsig
{

// A caller we accept signed requests from.
struct InboundClient
{
    std::string key_id;
    std::string principal;
    Algorithm algorithm = Algorithm::RSA_SHA256;
    KeyMaterial key;
};

// A destination we sign requests for.
struct OutboundTarget
{
    std::string key_id;
    Algorithm algorithm = Algorithm::RSA_SHA256;
    KeyMaterial key;
    // Overrides the header selection policy when set.
    std::optional<HeaderList> headers;
};

class KeyResolverInterface
{
public:
    virtual ~KeyResolverInterface() = default;

    // Fail with KeyResolutionError for an unknown keyId.
    virtual E<InboundClient> resolveInbound(const std::string& key_id) const
        = 0;
    virtual E<OutboundTarget> resolveOutbound(const std::string& key_id) const
        = 0;
};

class StaticKeyResolver : public KeyResolverInterface
{
public:
    StaticKeyResolver(std::vector<InboundClient> inbound,
                      std::vector<OutboundTarget> outbound);

    E<InboundClient> resolveInbound(const std::string& key_id) const override;
    E<OutboundTarget> resolveOutbound(const std::string& key_id) const
        override;

private:
    std::map<std::string, InboundClient> inbound;
    std::map<std::string, OutboundTarget> outbound;
};

} // namespace httpsig
