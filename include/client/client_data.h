#pragma once

#include "common/util/random.h"
#include <json/json.h>
#include <cstdint>
#include <string>

namespace MCBE
{
	enum DeviceOS {
		DeviceAndroid = 1,
		DeviceIOS = 2,
		DeviceOSX = 3,
		DeviceFireOS = 4,
		DeviceGearVR = 5,
		DeviceHololens = 6,
		DeviceWin10 = 7,
		DeviceWin32 = 8,
		DeviceDedicated = 9,
		DeviceTVOS = 10,
		DeviceOrbis = 11,
		DeviceNX = 12,
		DeviceXBOX = 13
	};

	// Client metadata signed into the second half of the login request
	struct ClientData
	{
		ClientData() : client_random_id(0), current_input_mode(1), default_input_mode(1), device_os(DeviceWin10),
			gui_scale(0), premium_skin(false), ui_profile(0) { }

		int64_t client_random_id;
		int current_input_mode;
		int default_input_mode;
		std::string device_model;
		int device_os;
		std::string device_id;
		std::string game_version;
		int gui_scale;
		std::string language_code;
		std::string platform_offline_id;
		std::string platform_online_id;
		bool premium_skin;
		std::string self_signed_id;
		std::string server_address;
		std::string skin_id;
		std::string skin_data;
		std::string cape_data;
		std::string skin_geometry_name;
		std::string skin_geometry;
		std::string third_party_name;
		int ui_profile;

		Json::Value ToJson() const;
		static ClientData FromJson(const Json::Value &value);
	};

	// Identity claims of an unauthenticated login
	struct IdentityData
	{
		std::string display_name;
		std::string identity;
		std::string xuid;
	};

	ClientData DefaultClientData(const std::string &server_address, Random &random);
	IdentityData DefaultIdentityData(const ClientData &client_data, Random &random);
}
