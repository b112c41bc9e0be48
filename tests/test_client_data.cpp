#include <gtest/gtest.h>
#include "client/client_data.h"
#include "client/protocol/game_packet.h"
#include "common/crypto/crypto.h"

using namespace MCBE;

class ClientDataTest : public ::testing::Test {
protected:
    void SetUp() override {}
    void TearDown() override {}
};

TEST_F(ClientDataTest, Defaults_Populated) {
    Random random(5);
    auto data = DefaultClientData("example.org:19132", random);

    EXPECT_EQ(data.server_address, "example.org:19132");
    EXPECT_EQ(data.game_version, "1.12.0");
    EXPECT_EQ(data.device_os, DeviceWin10);
    EXPECT_EQ(data.language_code, "en_UK");
    EXPECT_EQ(data.skin_geometry_name, "geometry.humanoid");
    EXPECT_EQ(Crypto::Base64Decode(data.skin_data).size(), 32u * 64u * 4u);
    EXPECT_NE(data.device_id, data.self_signed_id);
}

TEST_F(ClientDataTest, Defaults_ReproducibleWithSeed) {
    Random a(77);
    Random b(77);
    auto first = DefaultClientData("host:1", a);
    auto second = DefaultClientData("host:1", b);

    EXPECT_EQ(first.client_random_id, second.client_random_id);
    EXPECT_EQ(first.device_id, second.device_id);
    EXPECT_EQ(first.skin_id, second.skin_id);
}

TEST_F(ClientDataTest, Identity_UsesThirdPartyName) {
    Random random(3);
    auto data = DefaultClientData("host:1", random);
    data.third_party_name = "Notch";

    auto identity = DefaultIdentityData(data, random);
    EXPECT_EQ(identity.display_name, "Notch");
    EXPECT_EQ(identity.identity.size(), 36u);
    EXPECT_TRUE(identity.xuid.empty());
}

TEST_F(ClientDataTest, Json_UsesWireKeys) {
    ClientData data;
    data.client_random_id = -12;
    data.language_code = "de_DE";
    data.premium_skin = true;

    auto json = data.ToJson();
    EXPECT_EQ(json["ClientRandomId"].asInt64(), -12);
    EXPECT_EQ(json["LanguageCode"].asString(), "de_DE");
    EXPECT_TRUE(json["PremiumSkin"].asBool());
    EXPECT_EQ(json["DeviceOS"].asInt(), 7);

    auto parsed = ClientData::FromJson(json);
    EXPECT_EQ(parsed.client_random_id, -12);
    EXPECT_EQ(parsed.language_code, "de_DE");
    EXPECT_TRUE(parsed.premium_skin);
}

TEST_F(ClientDataTest, FromJson_MissingFieldsKeepDefaults) {
    Json::Value partial;
    partial["SkinId"] = "custom";

    auto data = ClientData::FromJson(partial);
    EXPECT_EQ(data.skin_id, "custom");
    EXPECT_EQ(data.device_os, DeviceWin10);
    EXPECT_EQ(data.current_input_mode, 1);
}
