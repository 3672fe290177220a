#include "config.hpp"

#include <format>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include <mw/utils.hpp>
#include <ryml.hpp>
#include <ryml_std.hpp> // For std::string support
#include <spdlog/spdlog.h>


using httpsig::E;

namespace
{

E<std::string> readFile(const std::filesystem::path& path)
{
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if(!f)
    {
        return std::unexpected(
            httpsig::configError("Cannot open file: " + path.string()));
    }
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

// rapidyaml aborts on errors unless told otherwise.
[[noreturn]] void throwYamlError(const char* msg, size_t len, ryml::Location,
                                 void*)
{
    throw std::runtime_error(std::string(msg, len));
}

std::string str(ryml::csubstr s)
{
    return std::string(s.str, s.len);
}

std::string readStr(ryml::ConstNodeRef node, ryml::csubstr key)
{
    std::string result;
    if(node.has_child(key))
    {
        node[key] >> result;
    }
    return result;
}

httpsig::HeaderList readList(ryml::ConstNodeRef node)
{
    httpsig::HeaderList result;
    for(ryml::ConstNodeRef child : node.children())
    {
        std::string name;
        child >> name;
        result.push_back(std::move(name));
    }
    return result;
}

std::map<std::string, httpsig::HeaderList> readListMap(ryml::ConstNodeRef node)
{
    std::map<std::string, httpsig::HeaderList> result;
    for(ryml::ConstNodeRef child : node.children())
    {
        result[str(child.key())] = readList(child);
    }
    return result;
}

// Inbound entries carry a public key, outbound ones a private key.
E<httpsig::KeyMaterial> readKey(ryml::ConstNodeRef node,
                                httpsig::Algorithm algo, bool inbound,
                                const std::filesystem::path& base_dir,
                                const std::string& key_id)
{
    ryml::csubstr pem_key = inbound ? ryml::csubstr("public_key_file")
                                    : ryml::csubstr("private_key_file");
    bool has_secret = node.has_child("hmac_secret");
    bool has_pem = node.has_child(pem_key);
    if(has_secret == has_pem)
    {
        return std::unexpected(httpsig::configError(std::format(
            "keyId {} needs exactly one of hmac_secret and {}", key_id,
            str(pem_key))));
    }

    if(algo == httpsig::Algorithm::HMAC_SHA256)
    {
        if(!has_secret)
        {
            return std::unexpected(httpsig::configError(std::format(
                "keyId {} uses hmac-sha256 but has no hmac_secret", key_id)));
        }
        return httpsig::HmacSecret{readStr(node, "hmac_secret")};
    }

    if(!has_pem)
    {
        return std::unexpected(httpsig::configError(std::format(
            "keyId {} uses rsa-sha256 but has no {}", key_id,
            str(pem_key))));
    }
    HTTPSIG_ASSIGN_OR_RETURN(std::string pem,
                             readFile(base_dir / readStr(node, pem_key)));
    httpsig::RsaKeys keys;
    if(inbound)
    {
        keys.public_key = std::move(pem);
    }
    else
    {
        keys.private_key = std::move(pem);
    }
    return keys;
}

E<httpsig::Algorithm> readAlgorithm(ryml::ConstNodeRef node)
{
    std::string algo = readStr(node, "algorithm");
    if(algo.empty())
    {
        return node.has_child("hmac_secret")
            ? httpsig::Algorithm::HMAC_SHA256
            : httpsig::Algorithm::RSA_SHA256;
    }
    auto result = httpsig::algorithmFromStr(algo);
    if(!result)
    {
        return std::unexpected(httpsig::configError(
            httpsig::errorMsg(result.error())));
    }
    return *result;
}

E<httpsig::InboundClient> readInbound(ryml::ConstNodeRef node,
                                      const std::filesystem::path& base_dir)
{
    httpsig::InboundClient client;
    client.key_id = readStr(node, "key_id");
    if(client.key_id.empty())
    {
        return std::unexpected(
            httpsig::configError("Inbound client without key_id"));
    }
    client.principal = readStr(node, "principal");
    HTTPSIG_ASSIGN_OR_RETURN(client.algorithm, readAlgorithm(node));
    HTTPSIG_ASSIGN_OR_RETURN(
        client.key,
        readKey(node, client.algorithm, true, base_dir, client.key_id));
    return client;
}

E<httpsig::OutboundTarget> readOutbound(ryml::ConstNodeRef node,
                                        const std::filesystem::path& base_dir)
{
    httpsig::OutboundTarget target;
    target.key_id = readStr(node, "key_id");
    if(target.key_id.empty())
    {
        return std::unexpected(
            httpsig::configError("Outbound target without key_id"));
    }
    HTTPSIG_ASSIGN_OR_RETURN(target.algorithm, readAlgorithm(node));
    HTTPSIG_ASSIGN_OR_RETURN(
        target.key,
        readKey(node, target.algorithm, false, base_dir, target.key_id));
    if(node.has_child("headers"))
    {
        target.headers = readList(node["headers"]);
    }
    return target;
}

E<Config> parseConfig(const std::string& content,
                      const std::filesystem::path& base_dir)
{
    ryml::Tree tree = ryml::parse_in_arena(ryml::to_csubstr(content));
    ryml::ConstNodeRef root = tree.crootref();

    Config config;
    if(root.has_child("sign_headers"))
    {
        ryml::ConstNodeRef node = root["sign_headers"];
        if(node.has_child("default"))
        {
            config.sign_headers.default_headers = readList(node["default"]);
        }
        if(node.has_child("algorithms"))
        {
            for(auto& [algo, headers] : readListMap(node["algorithms"]))
            {
                std::string lower = algo;
                mw::toLower(lower);
                config.sign_headers.by_algorithm[lower] = std::move(headers);
            }
        }
        if(node.has_child("targets"))
        {
            config.sign_headers.by_target = readListMap(node["targets"]);
        }
    }
    if(root.has_child("required_headers"))
    {
        config.required_headers = readList(root["required_headers"]);
    }
    if(root.has_child("inbound"))
    {
        for(ryml::ConstNodeRef child : root["inbound"].children())
        {
            HTTPSIG_ASSIGN_OR_RETURN(httpsig::InboundClient client,
                                     readInbound(child, base_dir));
            config.inbound.push_back(std::move(client));
        }
    }
    if(root.has_child("outbound"))
    {
        for(ryml::ConstNodeRef child : root["outbound"].children())
        {
            HTTPSIG_ASSIGN_OR_RETURN(httpsig::OutboundTarget target,
                                     readOutbound(child, base_dir));
            config.outbound.push_back(std::move(target));
        }
    }
    return config;
}

} // namespace

E<Config> Config::load(const std::string& path)
{
    HTTPSIG_ASSIGN_OR_RETURN(std::string content, readFile(path));
    std::filesystem::path base_dir =
        std::filesystem::path(path).parent_path();
    if(base_dir.empty())
    {
        base_dir = ".";
    }
    return fromStr(content, base_dir);
}

E<Config> Config::fromStr(const std::string& yaml,
                          const std::filesystem::path& base_dir)
{
    static const bool callbacks_set = []()
    {
        ryml::set_callbacks(
            ryml::Callbacks(nullptr, nullptr, nullptr, throwYamlError));
        return true;
    }();
    (void)callbacks_set;

    try
    {
        auto config = parseConfig(yaml, base_dir);
        if(config)
        {
            spdlog::debug("Loaded {} inbound clients and {} outbound targets",
                          config->inbound.size(), config->outbound.size());
        }
        return config;
    }
    catch(const std::runtime_error& e)
    {
        return std::unexpected(httpsig::configError(
            std::format("Invalid config: {}", e.what())));
    }
}
