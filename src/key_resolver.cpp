#include "key_resolver.hpp"

#include <spdlog/spdlog.h>

namespace httpsig
{

StaticKeyResolver::StaticKeyResolver(std::vector<InboundClient> inbound_clients,
                                     std::vector<OutboundTarget> targets)
{
    for(InboundClient& client : inbound_clients)
    {
        std::string key_id = client.key_id;
        if(!inbound.emplace(key_id, std::move(client)).second)
        {
            spdlog::warn("Duplicated inbound keyId {}, keeping the first",
                         key_id);
        }
    }
    for(OutboundTarget& target : targets)
    {
        std::string key_id = target.key_id;
        if(!outbound.emplace(key_id, std::move(target)).second)
        {
            spdlog::warn("Duplicated outbound keyId {}, keeping the first",
                         key_id);
        }
    }
}

E<InboundClient> StaticKeyResolver::resolveInbound(const std::string& key_id)
    const
{
    auto it = inbound.find(key_id);
    if(it == inbound.end())
    {
        return std::unexpected(keyResolutionError(key_id));
    }
    return it->second;
}

E<OutboundTarget> StaticKeyResolver::resolveOutbound(const std::string& key_id)
    const
{
    auto it = outbound.find(key_id);
    if(it == outbound.end())
    {
        return std::unexpected(keyResolutionError(key_id));
    }
    return it->second;
}

} // namespace httpsig
