#pragma once

#include "client/client_data.h"
#include "client/resource_pack_queue.h"
#include "client/protocol/game_packet.h"
#include "common/crypto/crypto.h"
#include "common/net/batch_codec.h"
#include "common/net/transport.h"
#include <condition_variable>
#include <deque>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace MCBE
{
	namespace Protocol
	{
		class ServerToClientHandshake;
		class PlayStatus;
		class Disconnect;
		class ResourcePacksInfo;
		class ResourcePackDataInfo;
		class ResourcePackChunkData;
		class ResourcePackStack;
		class StartGame;
		class ChunkRadiusUpdated;
	}

	// Called for every packet read or written, with the source and destination address
	typedef std::function<void(const Protocol::PacketHeader &header, const std::string &payload,
		const std::string &src, const std::string &dst)> PacketObserver;
	typedef std::function<void(const std::string &message)> ErrorSink;

	struct GameData
	{
		GameData() : entity_unique_id(0), entity_runtime_id(0), chunk_radius(0) { }

		int64_t entity_unique_id;
		uint64_t entity_runtime_id;
		int32_t chunk_radius;
	};

	struct ConnectionOptions
	{
		ConnectionOptions() : download_resource_packs(true), chunk_radius(16) { }

		ErrorSink error_sink;
		PacketObserver packet_observer;
		bool download_resource_packs;
		int32_t chunk_radius;
	};

	// One client session. A listener thread decodes every frame the transport yields and
	// runs the login sequence; once logged in, packets queue up for ReadPacket in arrival
	// order. Any transport, decode or protocol error closes the session for good.
	//
	// The error sink runs on the listener thread after it has stopped touching the
	// connection, so the sink may destroy it. The packet observer must not.
	class Connection
	{
	public:
		Connection(std::unique_ptr<Net::Transport> transport, Crypto::KeyPair key, const ClientData &client_data,
			const ConnectionOptions &options, Protocol::PacketPool pool = Protocol::PacketPool::Default());
		~Connection();

		Connection(const Connection &) = delete;
		Connection& operator=(const Connection &) = delete;

		// Packet IDs accepted next during login
		void Expect(std::initializer_list<uint32_t> ids);

		// Starts the listener thread. Called once, before anything is written.
		void Start();

		void SendLogin(const std::string &minecraft_chain, const IdentityData &identity);

		// Blocks until logged in (true) or closed (false)
		bool WaitConnected();

		// Throws Net::ConnectionClosed once closed, Net::TransportError when the write fails
		void WritePacket(const Protocol::GamePacket &pk);

		// Blocks for the next packet. Packets received before the close are still returned;
		// after that it throws Net::ConnectionClosed.
		std::unique_ptr<Protocol::GamePacket> ReadPacket();

		// Idempotent and safe from any thread, releases blocked readers. Returns once the
		// listener has stopped, unless called from the listener itself.
		void Close();

		bool IsClosed() const;
		bool IsLoggedIn() const;
		std::string CloseReason() const;

		MCBE::GameData GetGameData() const;
		const MCBE::ClientData& GetClientData() const { return m_client_data; }
		std::shared_ptr<ResourcePackQueue> GetResourcePacks() const;
		const Crypto::KeyPair& GetKey() const { return m_key; }

		std::string LocalAddress() const { return m_local_address; }
		std::string RemoteAddress() const { return m_remote_address; }

	private:
		void Listen();
		void HandleIncoming(const Net::Packet &data);
		void HandleLoginPacket(Protocol::GamePacket &pk);

		void HandleServerToClientHandshake(const Protocol::ServerToClientHandshake &pk);
		void HandlePlayStatus(const Protocol::PlayStatus &pk);
		void HandleDisconnect(const Protocol::Disconnect &pk);
		void HandleResourcePacksInfo(const Protocol::ResourcePacksInfo &pk);
		void HandleResourcePackDataInfo(const Protocol::ResourcePackDataInfo &pk);
		void HandleResourcePackChunkData(const Protocol::ResourcePackChunkData &pk);
		void HandleResourcePackStack(const Protocol::ResourcePackStack &pk);
		void HandleStartGame(const Protocol::StartGame &pk);
		void HandleChunkRadiusUpdated(const Protocol::ChunkRadiusUpdated &pk);

		void BeginNextDownload();
		void OnPackDownloaded(const ChunkResult &result);
		void SetLoggedIn();

		void Observe(const Protocol::PacketHeader &header, const std::string &payload, const std::string &src, const std::string &dst);
		void Fail(const std::string &reason);
		static void ReportError(const ErrorSink &sink, const std::string &reason);
		void JoinListener();
		// true if this call closed the session
		bool CloseWithReason(const std::string &reason);

		std::unique_ptr<Net::Transport> m_transport;
		Crypto::KeyPair m_key;
		MCBE::ClientData m_client_data;
		ConnectionOptions m_options;
		Protocol::PacketPool m_pool;
		std::string m_local_address;
		std::string m_remote_address;

		// guards the encoder and the order of frames on the transport
		std::mutex m_write_mutex;
		Net::Encoder m_encoder;

		// listener thread only
		Net::Decoder m_decoder;
		std::string m_key_material;
		bool m_started_game;
		std::deque<PackDataInfo> m_awaiting_packs;
		std::string m_listener_error;

		// serialises joining the listener
		std::mutex m_join_mutex;
		std::thread m_listener;

		mutable std::mutex m_mutex;
		std::condition_variable m_cond;
		std::thread::id m_listener_id;
		std::set<uint32_t> m_expected;
		bool m_expect_any;
		bool m_logged_in;
		bool m_connected;
		bool m_closed;
		std::string m_close_reason;
		std::deque<std::unique_ptr<Protocol::GamePacket>> m_inbound;
		MCBE::GameData m_game_data;
		std::shared_ptr<ResourcePackQueue> m_resource_packs;
	};
}
