#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "error.hpp"
#include "header_policy.hpp"
#include "key_resolver.hpp"

struct Config
{
    httpsig::HeaderSelectionPolicy sign_headers;
    // Every inbound signature has to cover these.
    httpsig::HeaderList required_headers;
    std::vector<httpsig::InboundClient> inbound;
    std::vector<httpsig::OutboundTarget> outbound;

    // Key files are relative to the directory of the config file.
    static httpsig::E<Config> load(const std::string& path);
    static httpsig::E<Config> fromStr(const std::string& yaml,
                                      const std::filesystem::path& base_dir);
};
