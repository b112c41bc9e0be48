#include "client/client_data.h"
#include "client/protocol/game_packet.h"
#include "common/crypto/crypto.h"

Json::Value MCBE::ClientData::ToJson() const
{
	Json::Value v;
	v["ClientRandomId"] = static_cast<Json::Int64>(client_random_id);
	v["CurrentInputMode"] = current_input_mode;
	v["DefaultInputMode"] = default_input_mode;
	v["DeviceModel"] = device_model;
	v["DeviceOS"] = device_os;
	v["DeviceId"] = device_id;
	v["GameVersion"] = game_version;
	v["GuiScale"] = gui_scale;
	v["LanguageCode"] = language_code;
	v["PlatformOfflineId"] = platform_offline_id;
	v["PlatformOnlineId"] = platform_online_id;
	v["PremiumSkin"] = premium_skin;
	v["SelfSignedId"] = self_signed_id;
	v["ServerAddress"] = server_address;
	v["SkinId"] = skin_id;
	v["SkinData"] = skin_data;
	v["CapeData"] = cape_data;
	v["SkinGeometryName"] = skin_geometry_name;
	v["SkinGeometry"] = skin_geometry;
	v["ThirdPartyName"] = third_party_name;
	v["UIProfile"] = ui_profile;
	return v;
}

MCBE::ClientData MCBE::ClientData::FromJson(const Json::Value &value)
{
	ClientData d;
	d.client_random_id = value.get("ClientRandomId", 0).asInt64();
	d.current_input_mode = value.get("CurrentInputMode", d.current_input_mode).asInt();
	d.default_input_mode = value.get("DefaultInputMode", d.default_input_mode).asInt();
	d.device_model = value.get("DeviceModel", "").asString();
	d.device_os = value.get("DeviceOS", d.device_os).asInt();
	d.device_id = value.get("DeviceId", "").asString();
	d.game_version = value.get("GameVersion", "").asString();
	d.gui_scale = value.get("GuiScale", 0).asInt();
	d.language_code = value.get("LanguageCode", "").asString();
	d.platform_offline_id = value.get("PlatformOfflineId", "").asString();
	d.platform_online_id = value.get("PlatformOnlineId", "").asString();
	d.premium_skin = value.get("PremiumSkin", false).asBool();
	d.self_signed_id = value.get("SelfSignedId", "").asString();
	d.server_address = value.get("ServerAddress", "").asString();
	d.skin_id = value.get("SkinId", "").asString();
	d.skin_data = value.get("SkinData", "").asString();
	d.cape_data = value.get("CapeData", "").asString();
	d.skin_geometry_name = value.get("SkinGeometryName", "").asString();
	d.skin_geometry = value.get("SkinGeometry", "").asString();
	d.third_party_name = value.get("ThirdPartyName", "").asString();
	d.ui_profile = value.get("UIProfile", 0).asInt();
	return d;
}

MCBE::ClientData MCBE::DefaultClientData(const std::string &server_address, Random &random)
{
	ClientData d;
	d.client_random_id = random.Int64();
	d.device_os = DeviceWin10;
	d.game_version = Protocol::CurrentVersion;
	d.device_id = random.Uuid();
	d.language_code = "en_UK";
	d.third_party_name = "Steve";
	d.self_signed_id = random.Uuid();
	d.skin_geometry_name = "geometry.humanoid";
	d.server_address = server_address;
	d.skin_id = random.Uuid();
	// blank 64x32 RGBA skin
	d.skin_data = Crypto::Base64Encode(std::string(32 * 64 * 4, '\0'));
	return d;
}

MCBE::IdentityData MCBE::DefaultIdentityData(const ClientData &client_data, Random &random)
{
	IdentityData id;
	id.display_name = client_data.third_party_name;
	id.identity = random.Uuid();
	return id;
}
