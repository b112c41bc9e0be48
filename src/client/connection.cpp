#include "client/connection.h"
#include "client/login_request.h"
#include "client/protocol/packets.h"
#include "common/net/errors.h"
#include "common/logging.h"
#include <fmt/format.h>

MCBE::Connection::Connection(std::unique_ptr<Net::Transport> transport, Crypto::KeyPair key, const MCBE::ClientData &client_data,
	const ConnectionOptions &options, Protocol::PacketPool pool)
	: m_transport(std::move(transport)), m_key(std::move(key)), m_client_data(client_data), m_options(options), m_pool(std::move(pool))
{
	m_local_address = m_transport->LocalAddress();
	m_remote_address = m_transport->RemoteAddress();
	m_started_game = false;
	m_expect_any = false;
	m_logged_in = false;
	m_connected = false;
	m_closed = false;
}

MCBE::Connection::~Connection()
{
	Close();

	// Still joinable only when destroyed from the error sink, which the listener calls
	// after it is done with the connection
	std::lock_guard<std::mutex> lock(m_join_mutex);
	if (m_listener.joinable()) {
		m_listener.detach();
	}
}

void MCBE::Connection::Expect(std::initializer_list<uint32_t> ids)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_expected = std::set<uint32_t>(ids);
}

void MCBE::Connection::Start()
{
	LOG_DEBUG(MOD_NET, "Starting listener for {}", m_remote_address);

	std::lock_guard<std::mutex> join_lock(m_join_mutex);
	std::lock_guard<std::mutex> lock(m_mutex);
	m_listener = std::thread([this] {
		Listen();

		ErrorSink sink;
		std::string error;
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			sink = m_options.error_sink;
			error = m_listener_error;
		}

		// The sink may destroy the connection; nothing below touches it
		if (!error.empty()) {
			ReportError(sink, error);
		}
	});
	m_listener_id = m_listener.get_id();
}

void MCBE::Connection::SendLogin(const std::string &minecraft_chain, const IdentityData &identity)
{
	Protocol::Login login;
	login.client_protocol = Protocol::CurrentProtocol;
	login.connection_request = Login::EncodeRequest(minecraft_chain, m_client_data, identity, m_key);

	LOG_INFO(MOD_LOGIN, "Sending {} login to {} with protocol {}",
		minecraft_chain.empty() ? "unauthenticated" : "authenticated", m_remote_address, login.client_protocol);
	WritePacket(login);
}

bool MCBE::Connection::WaitConnected()
{
	std::unique_lock<std::mutex> lock(m_mutex);
	m_cond.wait(lock, [this] { return m_connected || m_closed; });
	return m_connected;
}

void MCBE::Connection::WritePacket(const Protocol::GamePacket &pk)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_closed) {
			throw Net::ConnectionClosed(m_close_reason);
		}
	}

	Protocol::PacketHeader header(pk.ID());
	Net::DynamicPacket payload;
	Net::PacketWriter payload_writer(payload);
	pk.Marshal(payload_writer);

	Net::DynamicPacket data;
	Net::PacketWriter writer(data);
	header.Write(writer);
	writer.Bytes(payload.Bytes());

	Observe(header, payload.Bytes(), m_local_address, m_remote_address);
	LOG_TRACE(MOD_NET_PACKET, "-> {} ({} bytes)", Protocol::PacketName(header.packet_id), payload.Length());

	try {
		std::lock_guard<std::mutex> lock(m_write_mutex);
		std::vector<Net::DynamicPacket> batch;
		batch.push_back(std::move(data));
		m_transport->Send(m_encoder.Encode(batch));
	}
	catch (Net::TransportError &ex) {
		Fail(fmt::format("error writing to connection: {}", ex.what()));
		throw;
	}
}

std::unique_ptr<MCBE::Protocol::GamePacket> MCBE::Connection::ReadPacket()
{
	std::unique_lock<std::mutex> lock(m_mutex);
	m_cond.wait(lock, [this] { return !m_inbound.empty() || m_closed; });

	if (!m_inbound.empty()) {
		auto pk = std::move(m_inbound.front());
		m_inbound.pop_front();
		return pk;
	}

	throw Net::ConnectionClosed(m_close_reason);
}

void MCBE::Connection::Close()
{
	CloseWithReason("connection closed");
	JoinListener();
}

void MCBE::Connection::JoinListener()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_listener_id == std::this_thread::get_id()) {
			return;
		}
	}

	std::lock_guard<std::mutex> lock(m_join_mutex);
	if (m_listener.joinable()) {
		m_listener.join();
	}
}

bool MCBE::Connection::IsClosed() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_closed;
}

bool MCBE::Connection::IsLoggedIn() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_logged_in;
}

std::string MCBE::Connection::CloseReason() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_close_reason;
}

MCBE::GameData MCBE::Connection::GetGameData() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_game_data;
}

std::shared_ptr<MCBE::ResourcePackQueue> MCBE::Connection::GetResourcePacks() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_resource_packs;
}

bool MCBE::Connection::CloseWithReason(const std::string &reason)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_closed) {
			return false;
		}
		m_closed = true;
		m_close_reason = reason;
	}
	m_cond.notify_all();

	LOG_DEBUG(MOD_NET, "Closing connection to {}: {}", m_remote_address, reason);
	m_transport->Close();
	return true;
}

void MCBE::Connection::Fail(const std::string &reason)
{
	if (!CloseWithReason(reason)) {
		return;
	}

	// The listener reports once it has returned
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_listener_id == std::this_thread::get_id()) {
			m_listener_error = reason;
			return;
		}
	}

	ReportError(m_options.error_sink, reason);
}

void MCBE::Connection::ReportError(const ErrorSink &sink, const std::string &reason)
{
	if (!sink) {
		LOG_ERROR(MOD_NET, "{}", reason);
		return;
	}

	try {
		sink(reason);
	}
	catch (std::exception &ex) {
		LOG_WARN(MOD_NET, "Error sink failed on '{}': {}", reason, ex.what());
	}
}

void MCBE::Connection::Observe(const Protocol::PacketHeader &header, const std::string &payload, const std::string &src, const std::string &dst)
{
	if (!m_options.packet_observer) {
		return;
	}

	try {
		m_options.packet_observer(header, payload, src, dst);
	}
	catch (std::exception &ex) {
		LOG_WARN(MOD_NET, "Packet observer failed on {}: {}", Protocol::PacketName(header.packet_id), ex.what());
	}
}

void MCBE::Connection::Listen()
{
	try {
		Net::DynamicPacket frame;
		while (m_transport->Receive(frame)) {
			auto packets = m_decoder.Decode(frame);
			for (auto &p : packets) {
				if (IsClosed()) {
					return;
				}
				HandleIncoming(p);
			}
		}

		CloseWithReason("connection closed by remote");
	}
	catch (Net::TransportError &ex) {
		Fail(fmt::format("error reading from connection: {}", ex.what()));
	}
	catch (Net::ProtocolError &ex) {
		Fail(ex.what());
	}
	catch (Net::ConnectionClosed &ex) {
		LOG_DEBUG(MOD_NET, "Listener for {} stopped after close: {}", m_remote_address, ex.what());
	}
	catch (std::out_of_range &ex) {
		Fail(fmt::format("malformed packet: {}", ex.what()));
	}
	catch (std::exception &ex) {
		Fail(fmt::format("error handling packet: {}", ex.what()));
	}
}

void MCBE::Connection::HandleIncoming(const Net::Packet &data)
{
	Protocol::PacketHeader header;
	std::string payload;
	auto pk = Protocol::DecodePacket(data, m_pool, header, payload);

	Observe(header, payload, m_remote_address, m_local_address);
	LOG_TRACE(MOD_NET_PACKET, "<- {} ({} bytes)", Protocol::PacketName(header.packet_id), payload.length());

	{
		std::lock_guard<std::mutex> lock(m_mutex);
		bool expected = m_expected.count(header.packet_id) != 0;

		if (m_logged_in || (!expected && m_expect_any)) {
			m_inbound.push_back(std::move(pk));
			m_cond.notify_all();
			return;
		}

		if (!expected) {
			throw Net::ProtocolError(fmt::format("unexpected packet {} during login", Protocol::PacketName(header.packet_id)));
		}
	}

	HandleLoginPacket(*pk);
}

void MCBE::Connection::HandleLoginPacket(Protocol::GamePacket &pk)
{
	switch (pk.ID()) {
	case Protocol::IDServerToClientHandshake:
		HandleServerToClientHandshake(static_cast<Protocol::ServerToClientHandshake&>(pk));
		break;
	case Protocol::IDPlayStatus:
		HandlePlayStatus(static_cast<Protocol::PlayStatus&>(pk));
		break;
	case Protocol::IDDisconnect:
		HandleDisconnect(static_cast<Protocol::Disconnect&>(pk));
		break;
	case Protocol::IDResourcePacksInfo:
		HandleResourcePacksInfo(static_cast<Protocol::ResourcePacksInfo&>(pk));
		break;
	case Protocol::IDResourcePackDataInfo:
		HandleResourcePackDataInfo(static_cast<Protocol::ResourcePackDataInfo&>(pk));
		break;
	case Protocol::IDResourcePackChunkData:
		HandleResourcePackChunkData(static_cast<Protocol::ResourcePackChunkData&>(pk));
		break;
	case Protocol::IDResourcePackStack:
		HandleResourcePackStack(static_cast<Protocol::ResourcePackStack&>(pk));
		break;
	case Protocol::IDStartGame:
		HandleStartGame(static_cast<Protocol::StartGame&>(pk));
		break;
	case Protocol::IDChunkRadiusUpdated:
		HandleChunkRadiusUpdated(static_cast<Protocol::ChunkRadiusUpdated&>(pk));
		break;
	default:
		throw Net::ProtocolError(fmt::format("no login handler for {}", Protocol::PacketName(pk.ID())));
	}
}

void MCBE::Connection::HandleServerToClientHandshake(const Protocol::ServerToClientHandshake &pk)
{
	if (!m_key_material.empty()) {
		throw Net::ProtocolError("server handshake received twice");
	}

	try {
		m_key_material = Login::ParseServerHandshake(pk.jwt, m_key);
	}
	catch (Crypto::CryptoError &ex) {
		throw Net::ProtocolError(fmt::format("invalid server handshake: {}", ex.what()));
	}

	m_decoder.EnableEncryption(m_key_material);
	{
		std::lock_guard<std::mutex> lock(m_write_mutex);
		m_encoder.EnableEncryption(m_key_material);
	}
	LOG_INFO(MOD_CRYPTO, "Encryption enabled for {}", m_remote_address);

	Expect({ Protocol::IDPlayStatus, Protocol::IDDisconnect });
	WritePacket(Protocol::ClientToServerHandshake());
}

void MCBE::Connection::HandlePlayStatus(const Protocol::PlayStatus &pk)
{
	switch (pk.status) {
	case Protocol::PlayStatusLoginSuccess:
		LOG_INFO(MOD_LOGIN, "Login accepted by {}", m_remote_address);
		Expect({ Protocol::IDResourcePacksInfo, Protocol::IDDisconnect });
		break;
	case Protocol::PlayStatusPlayerSpawn:
		if (!m_started_game) {
			throw Net::ProtocolError("player spawn status before StartGame");
		}
		WritePacket(Protocol::SetLocalPlayerAsInitialised(GetGameData().entity_runtime_id));
		SetLoggedIn();
		break;
	default:
		throw Net::ProtocolError(fmt::format("login rejected by server: {} ({})", Protocol::PlayStatusName(pk.status), pk.status));
	}
}

void MCBE::Connection::HandleDisconnect(const Protocol::Disconnect &pk)
{
	LOG_INFO(MOD_LOGIN, "Disconnected by {} during login: {}", m_remote_address, pk.message);
	CloseWithReason(fmt::format("disconnected by server: {}", pk.message));
}

void MCBE::Connection::HandleResourcePacksInfo(const Protocol::ResourcePacksInfo &pk)
{
	std::vector<std::shared_ptr<ResourcePack>> catalog;
	auto add = [&catalog](const std::vector<Protocol::ResourcePackInfoEntry> &entries) {
		for (auto &e : entries) {
			auto pack = std::make_shared<ResourcePack>(e.uuid, e.version, e.size);
			pack->SetContentKey(e.content_key);
			pack->SetSubPackName(e.sub_pack_name);
			pack->SetHasScripts(e.has_scripts);
			catalog.push_back(pack);
		}
	};
	add(pk.behaviour_packs);
	add(pk.texture_packs);

	auto queue = std::make_shared<ResourcePackQueue>(catalog);
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_resource_packs = queue;
	}

	LOG_INFO(MOD_RESOURCE, "Server offers {} behaviour and {} texture packs", pk.behaviour_packs.size(), pk.texture_packs.size());

	if (!m_options.download_resource_packs || catalog.empty()) {
		Expect({ Protocol::IDResourcePackStack, Protocol::IDDisconnect });
		WritePacket(Protocol::ResourcePackClientResponse(Protocol::PackResponseAllPacksDownloaded));
		return;
	}

	std::vector<std::string> ids;
	for (auto &pack : catalog) {
		ids.push_back(pack->Identifier());
	}
	queue->Request(ids);

	Expect({ Protocol::IDResourcePackDataInfo, Protocol::IDResourcePackChunkData,
		Protocol::IDResourcePackStack, Protocol::IDDisconnect });

	Protocol::ResourcePackClientResponse response(Protocol::PackResponseSendPacks);
	response.packs_to_download = ids;
	WritePacket(response);
}

void MCBE::Connection::HandleResourcePackDataInfo(const Protocol::ResourcePackDataInfo &pk)
{
	auto queue = GetResourcePacks();
	if (!queue) {
		throw Net::ProtocolError(fmt::format("data info for resource pack {} before any packs were offered", pk.uuid));
	}

	PackDataInfo info;
	info.uuid = pk.uuid;
	info.chunk_size = pk.data_chunk_size;
	info.chunk_count = pk.chunk_count;
	info.size = pk.size;
	info.hash = pk.hash;
	m_awaiting_packs.push_back(info);

	if (!queue->CurrentPack()) {
		BeginNextDownload();
	}
}

void MCBE::Connection::BeginNextDownload()
{
	auto queue = GetResourcePacks();

	while (!m_awaiting_packs.empty()) {
		auto info = m_awaiting_packs.front();
		m_awaiting_packs.pop_front();

		auto result = queue->BeginDownload(info);
		if (result.complete) {
			OnPackDownloaded(result);
			continue;
		}

		WritePacket(Protocol::ResourcePackChunkRequest(info.uuid, 0));
		return;
	}
}

void MCBE::Connection::HandleResourcePackChunkData(const Protocol::ResourcePackChunkData &pk)
{
	auto queue = GetResourcePacks();
	if (!queue) {
		throw Net::ProtocolError(fmt::format("chunk for resource pack {} before any packs were offered", pk.uuid));
	}

	auto result = queue->DeliverChunk(pk.uuid, pk.chunk_index, pk.data_offset, pk.data);
	if (!result.complete) {
		WritePacket(Protocol::ResourcePackChunkRequest(pk.uuid, result.next_index));
		return;
	}

	OnPackDownloaded(result);
	BeginNextDownload();
}

void MCBE::Connection::OnPackDownloaded(const ChunkResult &result)
{
	LOG_INFO(MOD_RESOURCE, "Downloaded resource pack {} ({} bytes)", result.pack->Identifier(), result.pack->Size());

	if (result.all_downloaded) {
		LOG_INFO(MOD_RESOURCE, "All resource packs downloaded");
		WritePacket(Protocol::ResourcePackClientResponse(Protocol::PackResponseAllPacksDownloaded));
	}
}

void MCBE::Connection::HandleResourcePackStack(const Protocol::ResourcePackStack &pk)
{
	auto queue = GetResourcePacks();
	if (queue && !queue->AllDownloaded()) {
		throw Net::ProtocolError("resource pack stack received before all packs were downloaded");
	}

	LOG_DEBUG(MOD_RESOURCE, "Resource pack stack with {} behaviour and {} texture packs",
		pk.behaviour_packs.size(), pk.texture_packs.size());

	Expect({ Protocol::IDStartGame, Protocol::IDDisconnect });
	WritePacket(Protocol::ResourcePackClientResponse(Protocol::PackResponseCompleted));
}

void MCBE::Connection::HandleStartGame(const Protocol::StartGame &pk)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_game_data.entity_unique_id = pk.entity_unique_id;
		m_game_data.entity_runtime_id = pk.entity_runtime_id;
		// world packets sent ahead of the spawn status go to the caller
		m_expected = { Protocol::IDChunkRadiusUpdated, Protocol::IDPlayStatus, Protocol::IDDisconnect };
		m_expect_any = true;
	}
	m_started_game = true;

	LOG_INFO(MOD_LOGIN, "Game started, runtime id {}, requesting chunk radius {}", pk.entity_runtime_id, m_options.chunk_radius);
	WritePacket(Protocol::RequestChunkRadius(m_options.chunk_radius));
}

void MCBE::Connection::HandleChunkRadiusUpdated(const Protocol::ChunkRadiusUpdated &pk)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	m_game_data.chunk_radius = pk.chunk_radius;
	LOG_DEBUG(MOD_LOGIN, "Chunk radius set to {}", pk.chunk_radius);
}

void MCBE::Connection::SetLoggedIn()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_closed) {
			return;
		}
		m_logged_in = true;
		m_connected = true;
		m_expected.clear();
		m_expect_any = false;
	}
	m_cond.notify_all();

	LOG_INFO(MOD_LOGIN, "Logged in to {}", m_remote_address);
}
