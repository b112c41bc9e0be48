#pragma once

#include "client/auth.h"
#include "client/client_data.h"
#include "client/connection.h"
#include "common/net/transport.h"
#include "common/util/random.h"
#include <json/json.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace MCBE
{
	struct DialerConfig
	{
		DialerConfig() : chunk_radius(16), download_resource_packs(true) { }

		// Receives fatal session errors; LOG_ERROR when unset
		ErrorSink error_sink;
		// Sent instead of the generated default when set
		std::optional<MCBE::ClientData> client_data;
		// An empty email means an unauthenticated login
		std::string email;
		std::string password;
		std::shared_ptr<AuthProvider> auth_provider;
		PacketObserver packet_observer;
		// Used for every network when set; required for "raknet"
		Net::TransportFactory transport_factory;
		std::optional<uint64_t> random_seed;
		int32_t chunk_radius;
		bool download_resource_packs;

		// Reads the "dialer" section; callbacks and providers are left untouched
		void LoadFromJson(const Json::Value &root);
	};

	// Loads the "dialer" section of a JSON file and applies its "logging" section
	DialerConfig LoadDialerConfig(const std::string &filename);

	class Dialer
	{
	public:
		Dialer();
		explicit Dialer(const DialerConfig &config);

		// Returns once the server spawned the player. Throws Net::TransportError when the
		// dial fails, Net::AuthError when authentication fails and Net::ConnectionTimeout
		// when the session closes before login completes.
		std::unique_ptr<Connection> Dial(const std::string &network, const std::string &address);

		const DialerConfig& Config() const { return m_config; }
	private:
		DialerConfig m_config;
		Random m_random;
	};

	std::unique_ptr<Connection> Dial(const std::string &network, const std::string &address);
}
