#include <json/json.h>
#include "client/dialer.h"
#include "client/protocol/packets.h"
#include "common/net/errors.h"
#include "common/util/json_config.h"
#include "common/logging.h"
#include <fmt/format.h>

void MCBE::DialerConfig::LoadFromJson(const Json::Value &root)
{
	JsonConfigFile config(root);

	email = config.GetVariableString("dialer", "email", email);
	password = config.GetVariableString("dialer", "password", password);
	chunk_radius = config.GetVariableInt("dialer", "chunk_radius", chunk_radius);
	download_resource_packs = config.GetVariableBool("dialer", "download_resource_packs", download_resource_packs);

	if (!root.isObject() || !root["dialer"].isObject()) {
		return;
	}

	const auto &section = root["dialer"];
	if (section["random_seed"].isIntegral()) {
		random_seed = section["random_seed"].asUInt64();
	}

	if (section["client_data"].isObject()) {
		client_data = MCBE::ClientData::FromJson(section["client_data"]);
	}
}

MCBE::DialerConfig MCBE::LoadDialerConfig(const std::string &filename)
{
	DialerConfig config;
	auto file = JsonConfigFile::Load(filename);

	const auto &root = file.RawHandle();
	if (root.isObject()) {
		InitLoggingFromJson(root);
	}

	config.LoadFromJson(root);
	LOG_DEBUG(MOD_CONFIG, "Loaded dialer config from {}", filename);
	return config;
}

MCBE::Dialer::Dialer()
{
}

MCBE::Dialer::Dialer(const DialerConfig &config) : m_config(config)
{
	if (m_config.random_seed) {
		m_random.Reseed(*m_config.random_seed);
	}
}

std::unique_ptr<MCBE::Connection> MCBE::Dialer::Dial(const std::string &network, const std::string &address)
{
	LOG_INFO(MOD_NET, "Dialing {} {}", network, address);

	std::unique_ptr<Net::Transport> transport;
	if (m_config.transport_factory) {
		transport = m_config.transport_factory(network, address);
		if (!transport) {
			throw Net::TransportError(fmt::format("dial {} {}: transport factory returned no connection", network, address));
		}
	}
	else {
		transport = Net::DialTransport(network, address);
	}

	auto key = Crypto::KeyPair::Generate();

	std::string chain;
	if (!m_config.email.empty()) {
		if (!m_config.auth_provider) {
			throw Net::AuthError(Net::AuthStageLiveToken, "an email was configured but no auth provider is set");
		}
		chain = AuthChain(*m_config.auth_provider, m_config.email, m_config.password, key);
	}

	MCBE::ClientData client_data = m_config.client_data ? *m_config.client_data : DefaultClientData(address, m_random);
	IdentityData identity = DefaultIdentityData(client_data, m_random);

	ConnectionOptions options;
	options.error_sink = m_config.error_sink;
	options.packet_observer = m_config.packet_observer;
	options.chunk_radius = m_config.chunk_radius;
	options.download_resource_packs = m_config.download_resource_packs;

	std::unique_ptr<Connection> conn(new Connection(std::move(transport), std::move(key), client_data, options));
	conn->Expect({ Protocol::IDServerToClientHandshake, Protocol::IDPlayStatus, Protocol::IDDisconnect });
	conn->Start();

	try {
		conn->SendLogin(chain, identity);
	}
	catch (Net::ConnectionClosed &ex) {
		throw Net::ConnectionTimeout(fmt::format("connection timeout: {}", ex.what()));
	}

	if (!conn->WaitConnected()) {
		throw Net::ConnectionTimeout(fmt::format("connection timeout: {}", conn->CloseReason()));
	}

	LOG_INFO(MOD_NET, "Connected to {} {}", network, address);
	return conn;
}

std::unique_ptr<MCBE::Connection> MCBE::Dial(const std::string &network, const std::string &address)
{
	Dialer dialer;
	return dialer.Dial(network, address);
}
