#pragma once

#include <expected>
#include <string>
#include <variant>

#include <mw/error.hpp>

namespace httpsig
{

// The Signature header is missing keyId or signature.
struct SyntaxError
{
    std::string msg;
};

struct MissingRequiredHeader
{
    std::string header;
    std::string msg;
};

struct UnsupportedAlgorithm
{
    std::string algorithm;
    std::string msg;
};

struct SignatureMismatch
{
    std::string msg;
};

// The key material does not fit the algorithm, or lacks the half
// needed for the direction (private to sign, public to verify).
struct KeyMismatch
{
    std::string msg;
};

struct KeyResolutionError
{
    std::string key_id;
    std::string msg;
};

struct MissingSignatureHeader
{
    std::string msg;
};

struct CryptoError
{
    std::string msg;
};

struct ConfigError
{
    std::string msg;
};

using Error = std::variant<SyntaxError, MissingRequiredHeader,
                           UnsupportedAlgorithm, SignatureMismatch,
                           KeyMismatch, KeyResolutionError,
                           MissingSignatureHeader, CryptoError, ConfigError>;

template<typename T>
using E = std::expected<T, Error>;

std::string errorMsg(const Error& e);

SyntaxError syntaxError(const std::string& msg);
MissingRequiredHeader missingRequiredHeader(const std::string& header);
UnsupportedAlgorithm unsupportedAlgorithm(const std::string& algorithm);
SignatureMismatch signatureMismatch(const std::string& msg);
KeyMismatch keyMismatch(const std::string& msg);
KeyResolutionError keyResolutionError(const std::string& key_id);
ConfigError configError(const std::string& msg);

// Errors from libmw only ever come out of the crypto primitives.
CryptoError cryptoError(const mw::Error& e);

} // namespace httpsig

#define HTTPSIG_CONCAT_NAMES_INNER_(a, b) a##b
#define HTTPSIG_CONCAT_NAMES_(a, b) HTTPSIG_CONCAT_NAMES_INNER_(a, b)

#define HTTPSIG_ASSIGN_OR_RETURN_(tmp, var, val)                             \
    auto tmp = val;                                                          \
    if(!tmp.has_value())                                                     \
    {                                                                        \
        return std::unexpected(std::move(tmp).error());                      \
    }                                                                        \
    var = std::move(tmp).value()

// Val should be a rvalue.
#define HTTPSIG_ASSIGN_OR_RETURN(var, val)                                   \
    HTTPSIG_ASSIGN_OR_RETURN_(                                               \
        HTTPSIG_CONCAT_NAMES_(httpsig_assign_or_return_tmp, __COUNTER__),    \
        var, val)

#define HTTPSIG_DO_OR_RETURN(val)                                            \
    do                                                                       \
    {                                                                        \
        auto httpsig_do_or_return_tmp = val;                                 \
        if(!httpsig_do_or_return_tmp.has_value())                            \
        {                                                                    \
            return std::unexpected(                                          \
                std::move(httpsig_do_or_return_tmp).error());                \
        }                                                                    \
    } while(false)
