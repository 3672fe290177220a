#pragma once

#include <gmock/gmock.h>

#include "key_resolver.hpp"

namespace httpsig
{

class KeyResolverMock : public KeyResolverInterface
{
public:
    MOCK_METHOD(E<InboundClient>, resolveInbound, (const std::string&),
                (const, override));
    MOCK_METHOD(E<OutboundTarget>, resolveOutbound, (const std::string&),
                (const, override));
};

} // namespace httpsig
