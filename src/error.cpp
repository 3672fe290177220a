#include "error.hpp"

#include <format>

namespace httpsig
{

std::string errorMsg(const Error& e)
{
    return std::visit([](const auto& err) { return err.msg; }, e);
}

SyntaxError syntaxError(const std::string& msg)
{
    return {msg};
}

MissingRequiredHeader missingRequiredHeader(const std::string& header)
{
    return {header, std::format("Header {} is required, yet not signed",
                                header)};
}

UnsupportedAlgorithm unsupportedAlgorithm(const std::string& algorithm)
{
    return {algorithm,
            std::format("Unsupported signature algorithm: {}", algorithm)};
}

SignatureMismatch signatureMismatch(const std::string& msg)
{
    return {msg};
}

KeyMismatch keyMismatch(const std::string& msg)
{
    return {msg};
}

KeyResolutionError keyResolutionError(const std::string& key_id)
{
    return {key_id, std::format("No key configured for keyId {}", key_id)};
}

ConfigError configError(const std::string& msg)
{
    return {msg};
}

CryptoError cryptoError(const mw::Error& e)
{
    return {mw::errorMsg(e)};
}

} // namespace httpsig
