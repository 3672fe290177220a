#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "config.hpp"
#include "test_utils.hpp"

using namespace httpsig;

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path() /
            ::testing::UnitTest::GetInstance()->current_test_info()->name();
        std::filesystem::create_directories(dir);
    }

    void TearDown() override
    {
        std::filesystem::remove_all(dir);
    }

    void writeFile(const std::string& name, const std::string& content)
    {
        std::ofstream f(dir / name);
        f << content;
    }

    std::filesystem::path dir;
};

TEST_F(ConfigTest, Load)
{
    writeFile("service.pub.pem", "PUBLIC KEY PEM");
    writeFile("client.pem", "PRIVATE KEY PEM");
    writeFile("httpsig.yaml",
              "sign_headers:\n"
              "  default: [\"date\", \"(request-target)\", \"host\"]\n"
              "  algorithms:\n"
              "    HMAC-SHA256: [\"date\", \"(request-target)\"]\n"
              "  targets:\n"
              "    myServiceKeyId: [\"date\", \"host\", \"(request-target)\", "
              "\"authorization\"]\n"
              "required_headers: [\"date\"]\n"
              "inbound:\n"
              "  - key_id: rsa-key-12345\n"
              "    principal: theService\n"
              "    algorithm: rsa-sha256\n"
              "    public_key_file: service.pub.pem\n"
              "  - key_id: myServiceKeyId\n"
              "    principal: theService\n"
              "    hmac_secret: MyPasswordForHmac\n"
              "outbound:\n"
              "  - key_id: myServiceKeyId\n"
              "    algorithm: hmac-sha256\n"
              "    hmac_secret: MyPasswordForHmac\n"
              "    headers: [\"date\", \"host\"]\n"
              "  - key_id: rsa-client\n"
              "    private_key_file: client.pem\n");

    ASSIGN_OR_FAIL(Config config, Config::load((dir / "httpsig.yaml").string()));

    EXPECT_EQ(config.sign_headers.default_headers,
              (HeaderList{"date", "(request-target)", "host"}));
    EXPECT_EQ(config.sign_headers.by_algorithm.at("hmac-sha256"),
              (HeaderList{"date", "(request-target)"}));
    EXPECT_EQ(config.sign_headers.by_target.at("myServiceKeyId").size(), 4u);
    EXPECT_EQ(config.required_headers, HeaderList{"date"});

    ASSERT_EQ(config.inbound.size(), 2u);
    EXPECT_EQ(config.inbound[0].key_id, "rsa-key-12345");
    EXPECT_EQ(config.inbound[0].principal, "theService");
    EXPECT_EQ(config.inbound[0].algorithm, Algorithm::RSA_SHA256);
    EXPECT_EQ(std::get<RsaKeys>(config.inbound[0].key).public_key,
              "PUBLIC KEY PEM");
    // Implied by hmac_secret.
    EXPECT_EQ(config.inbound[1].algorithm, Algorithm::HMAC_SHA256);
    EXPECT_EQ(std::get<HmacSecret>(config.inbound[1].key).secret,
              "MyPasswordForHmac");

    ASSERT_EQ(config.outbound.size(), 2u);
    EXPECT_EQ(config.outbound[0].headers, (HeaderList{"date", "host"}));
    EXPECT_EQ(config.outbound[1].algorithm, Algorithm::RSA_SHA256);
    EXPECT_EQ(std::get<RsaKeys>(config.outbound[1].key).private_key,
              "PRIVATE KEY PEM");
    EXPECT_FALSE(config.outbound[1].headers.has_value());
}

TEST_F(ConfigTest, EmptyConfigUsesDefaults)
{
    ASSIGN_OR_FAIL(Config config, Config::fromStr("{}", dir));
    EXPECT_TRUE(config.inbound.empty());
    EXPECT_TRUE(config.required_headers.empty());
    EXPECT_EQ(config.sign_headers.resolve("any", std::nullopt),
              (HeaderList{"(request-target)", "date"}));
}

TEST_F(ConfigTest, FailsOnMissingFile)
{
    EXPECT_ERROR(Config::load((dir / "nope.yaml").string()), ConfigError);
    EXPECT_ERROR(Config::fromStr("inbound:\n"
                                 "  - key_id: k\n"
                                 "    public_key_file: nope.pem\n",
                                 dir),
                 ConfigError);
}

TEST_F(ConfigTest, FailsOnBadKeyEntries)
{
    // Unknown algorithm.
    EXPECT_ERROR(Config::fromStr("inbound:\n"
                                 "  - key_id: k\n"
                                 "    algorithm: hs2019\n"
                                 "    hmac_secret: s\n",
                                 dir),
                 ConfigError);
    // Both key sources.
    writeFile("k.pem", "PEM");
    EXPECT_ERROR(Config::fromStr("inbound:\n"
                                 "  - key_id: k\n"
                                 "    hmac_secret: s\n"
                                 "    public_key_file: k.pem\n",
                                 dir),
                 ConfigError);
    // Algorithm does not fit the key.
    EXPECT_ERROR(Config::fromStr("outbound:\n"
                                 "  - key_id: k\n"
                                 "    algorithm: hmac-sha256\n"
                                 "    private_key_file: k.pem\n",
                                 dir),
                 ConfigError);
    // No keyId.
    EXPECT_ERROR(Config::fromStr("outbound:\n"
                                 "  - hmac_secret: s\n",
                                 dir),
                 ConfigError);
}
