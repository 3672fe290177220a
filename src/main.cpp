#include <iostream>
#include <memory>
#include <string>
#include <vector>

// Header values contain commas, so -H must not split on them.
#define CXXOPTS_VECTOR_DELIMITER '\0'
#include <cxxopts.hpp>
#include <mw/crypto.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "http_utils.hpp"
#include "key_resolver.hpp"
#include "provider.hpp"
#include "request_view.hpp"
#include "utils.hpp"

namespace
{

httpsig::E<httpsig::RequestView>
requestFromOptions(const cxxopts::ParseResult& opts)
{
    httpsig::RequestView req;
    req.method = opts["method"].as<std::string>();
    req.path = opts["path"].as<std::string>();
    req.query = opts["query"].as<std::string>();
    if(opts.count("header"))
    {
        for(const std::string& h :
                opts["header"].as<std::vector<std::string>>())
        {
            size_t colon = h.find(':');
            if(colon == std::string::npos || colon == 0)
            {
                return std::unexpected(httpsig::configError(
                    "Header should look like “Name: value”: " + h));
            }
            req.addHeader(std::string(httpsig::strip(h.substr(0, colon))),
                          std::string(httpsig::strip(h.substr(colon + 1))));
        }
    }
    return req;
}

std::unique_ptr<httpsig::HttpSignatureProvider>
providerFromConfig(const Config& config)
{
    return std::make_unique<httpsig::HttpSignatureProvider>(
        std::make_unique<httpsig::StaticKeyResolver>(config.inbound,
                                                     config.outbound),
        config.sign_headers, config.required_headers,
        httpsig::Signer(std::make_unique<mw::Crypto>()),
        httpsig::SignatureVerifier(std::make_unique<mw::Crypto>()));
}

int sign(const cxxopts::ParseResult& opts,
         const httpsig::HttpSignatureProvider& provider)
{
    if(!opts.count("key-id"))
    {
        spdlog::error("Signing needs --key-id");
        return 1;
    }
    auto req = requestFromOptions(opts);
    if(!req)
    {
        spdlog::error(httpsig::errorMsg(req.error()));
        return 1;
    }
    if(!req->hasHeader("Date"))
    {
        std::string date = http_utils::getHttpDate();
        spdlog::info("Adding Date: {}", date);
        req->addHeader("Date", date);
    }

    auto header =
        provider.signOutbound(*req, opts["key-id"].as<std::string>());
    if(!header)
    {
        spdlog::error("Failed to sign: {}", httpsig::errorMsg(header.error()));
        return 1;
    }
    std::cout << httpsig::SIGNATURE_HEADER << ": " << *header << std::endl;
    return 0;
}

int verify(const cxxopts::ParseResult& opts,
           const httpsig::HttpSignatureProvider& provider)
{
    auto req = requestFromOptions(opts);
    if(!req)
    {
        spdlog::error(httpsig::errorMsg(req.error()));
        return 1;
    }
    auto principal = provider.authenticate(*req);
    if(!principal)
    {
        spdlog::error("Verification failed: {}",
                      httpsig::errorMsg(principal.error()));
        return 1;
    }
    std::cout << *principal << std::endl;
    return 0;
}

int keygen()
{
    auto keys = mw::Crypto().generateKeyPair(mw::KeyType::RSA);
    if(!keys)
    {
        spdlog::error("Failed to generate key pair: {}",
                      mw::errorMsg(keys.error()));
        return 1;
    }
    std::cout << keys->public_key << std::endl;
    std::cout << keys->private_key << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv)
{
    cxxopts::Options cmd_options("httpsig",
                                 "Sign and verify HTTP request signatures");
    cmd_options.add_options()
        ("c,config", "Config file",
         cxxopts::value<std::string>()->default_value("httpsig.yaml"))
        ("k,key-id", "keyId to sign with", cxxopts::value<std::string>())
        ("m,method", "Request method",
         cxxopts::value<std::string>()->default_value("GET"))
        ("p,path", "Request path",
         cxxopts::value<std::string>()->default_value("/"))
        ("q,query", "Request query, already encoded",
         cxxopts::value<std::string>()->default_value(""))
        ("H,header", "Request header as “Name: value”, repeatable",
         cxxopts::value<std::vector<std::string>>())
        ("v,verbose", "Log debug messages")
        ("h,help", "Print this message.")
        ("command", "sign, verify or keygen", cxxopts::value<std::string>());
    cmd_options.parse_positional({"command"});
    cmd_options.positional_help("sign|verify|keygen");

    cxxopts::ParseResult opts;
    try
    {
        opts = cmd_options.parse(argc, argv);
    }
    catch(const std::exception& e)
    {
        std::cerr << e.what() << "\n" << cmd_options.help() << std::endl;
        return 1;
    }

    if(opts.count("help") || !opts.count("command"))
    {
        std::cout << cmd_options.help() << std::endl;
        return opts.count("help") ? 0 : 1;
    }
    if(opts.count("verbose"))
    {
        spdlog::set_level(spdlog::level::debug);
    }

    const std::string command = opts["command"].as<std::string>();
    if(command == "keygen")
    {
        return keygen();
    }
    if(command != "sign" && command != "verify")
    {
        spdlog::error("Unknown command: {}", command);
        return 1;
    }

    auto config = Config::load(opts["config"].as<std::string>());
    if(!config)
    {
        spdlog::error("Failed to load config: {}",
                      httpsig::errorMsg(config.error()));
        return 1;
    }
    auto provider = providerFromConfig(*config);
    if(command == "sign")
    {
        return sign(opts, *provider);
    }
    return verify(opts, *provider);
}
