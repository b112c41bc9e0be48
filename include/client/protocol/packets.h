#pragma once

#include "client/protocol/game_packet.h"
#include <vector>

namespace MCBE
{
	namespace Protocol
	{
		enum PlayStatusValues : int32_t {
			PlayStatusLoginSuccess = 0,
			PlayStatusLoginFailedClient = 1,
			PlayStatusLoginFailedServer = 2,
			PlayStatusPlayerSpawn = 3,
			PlayStatusLoginFailedInvalidTenant = 4,
			PlayStatusLoginFailedVanillaEdu = 5,
			PlayStatusLoginFailedEduVanilla = 6,
			PlayStatusLoginFailedServerFull = 7
		};

		enum PackResponseValues : uint8_t {
			PackResponseRefused = 1,
			PackResponseSendPacks = 2,
			PackResponseAllPacksDownloaded = 3,
			PackResponseCompleted = 4
		};

		const char *PlayStatusName(int32_t status);

		class Login : public GamePacket
		{
		public:
			Login() : client_protocol(0) { }

			uint32_t ID() const override { return IDLogin; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			int32_t client_protocol;
			std::string connection_request;
		};

		class PlayStatus : public GamePacket
		{
		public:
			PlayStatus() : status(0) { }
			explicit PlayStatus(int32_t s) : status(s) { }

			uint32_t ID() const override { return IDPlayStatus; }
			void Marshal(Net::PacketWriter &w) const override { w.Int32BE(status); }
			void Unmarshal(Net::PacketReader &r) override { status = r.Int32BE(); }

			int32_t status;
		};

		class ServerToClientHandshake : public GamePacket
		{
		public:
			uint32_t ID() const override { return IDServerToClientHandshake; }
			void Marshal(Net::PacketWriter &w) const override { w.String(jwt); }
			void Unmarshal(Net::PacketReader &r) override { jwt = r.String(); }

			std::string jwt;
		};

		class ClientToServerHandshake : public GamePacket
		{
		public:
			uint32_t ID() const override { return IDClientToServerHandshake; }
			void Marshal(Net::PacketWriter &w) const override { }
			void Unmarshal(Net::PacketReader &r) override { }
		};

		class Disconnect : public GamePacket
		{
		public:
			Disconnect() : hide_disconnection_screen(false) { }

			uint32_t ID() const override { return IDDisconnect; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			bool hide_disconnection_screen;
			std::string message;
		};

		struct ResourcePackInfoEntry
		{
			ResourcePackInfoEntry() : size(0), has_scripts(false) { }

			std::string uuid;
			std::string version;
			uint64_t size;
			std::string content_key;
			std::string sub_pack_name;
			std::string content_identity;
			bool has_scripts;
		};

		class ResourcePacksInfo : public GamePacket
		{
		public:
			ResourcePacksInfo() : texture_pack_required(false), has_scripts(false) { }

			uint32_t ID() const override { return IDResourcePacksInfo; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			bool texture_pack_required;
			bool has_scripts;
			std::vector<ResourcePackInfoEntry> behaviour_packs;
			std::vector<ResourcePackInfoEntry> texture_packs;
		};

		struct StackResourcePack
		{
			std::string uuid;
			std::string version;
			std::string sub_pack_name;
		};

		class ResourcePackStack : public GamePacket
		{
		public:
			ResourcePackStack() : texture_pack_required(false), experimental(false) { }

			uint32_t ID() const override { return IDResourcePackStack; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			bool texture_pack_required;
			std::vector<StackResourcePack> behaviour_packs;
			std::vector<StackResourcePack> texture_packs;
			bool experimental;
		};

		class ResourcePackClientResponse : public GamePacket
		{
		public:
			ResourcePackClientResponse() : response(0) { }
			explicit ResourcePackClientResponse(uint8_t r) : response(r) { }

			uint32_t ID() const override { return IDResourcePackClientResponse; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			uint8_t response;
			// "<uuid>_<version>" identifiers
			std::vector<std::string> packs_to_download;
		};

		// Only the entity IDs are decoded; the rest of the world settings stay raw
		class StartGame : public GamePacket
		{
		public:
			StartGame() : entity_unique_id(0), entity_runtime_id(0) { }

			uint32_t ID() const override { return IDStartGame; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			int64_t entity_unique_id;
			uint64_t entity_runtime_id;
			std::string world_data;
		};

		class RequestChunkRadius : public GamePacket
		{
		public:
			RequestChunkRadius() : chunk_radius(0) { }
			explicit RequestChunkRadius(int32_t radius) : chunk_radius(radius) { }

			uint32_t ID() const override { return IDRequestChunkRadius; }
			void Marshal(Net::PacketWriter &w) const override { w.VarInt32(chunk_radius); }
			void Unmarshal(Net::PacketReader &r) override { chunk_radius = r.VarInt32(); }

			int32_t chunk_radius;
		};

		class ChunkRadiusUpdated : public GamePacket
		{
		public:
			ChunkRadiusUpdated() : chunk_radius(0) { }
			explicit ChunkRadiusUpdated(int32_t radius) : chunk_radius(radius) { }

			uint32_t ID() const override { return IDChunkRadiusUpdated; }
			void Marshal(Net::PacketWriter &w) const override { w.VarInt32(chunk_radius); }
			void Unmarshal(Net::PacketReader &r) override { chunk_radius = r.VarInt32(); }

			int32_t chunk_radius;
		};

		class ResourcePackDataInfo : public GamePacket
		{
		public:
			ResourcePackDataInfo() : data_chunk_size(0), chunk_count(0), size(0) { }

			uint32_t ID() const override { return IDResourcePackDataInfo; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			std::string uuid;
			uint32_t data_chunk_size;
			uint32_t chunk_count;
			uint64_t size;
			// raw sha256 of the pack content
			std::string hash;
		};

		class ResourcePackChunkData : public GamePacket
		{
		public:
			ResourcePackChunkData() : chunk_index(0), data_offset(0) { }

			uint32_t ID() const override { return IDResourcePackChunkData; }
			void Marshal(Net::PacketWriter &w) const override;
			void Unmarshal(Net::PacketReader &r) override;

			std::string uuid;
			uint32_t chunk_index;
			uint64_t data_offset;
			std::string data;
		};

		class ResourcePackChunkRequest : public GamePacket
		{
		public:
			ResourcePackChunkRequest() : chunk_index(0) { }
			ResourcePackChunkRequest(const std::string &id, uint32_t index) : uuid(id), chunk_index(index) { }

			uint32_t ID() const override { return IDResourcePackChunkRequest; }
			void Marshal(Net::PacketWriter &w) const override { w.String(uuid); w.UInt32(chunk_index); }
			void Unmarshal(Net::PacketReader &r) override { uuid = r.String(); chunk_index = r.UInt32(); }

			std::string uuid;
			uint32_t chunk_index;
		};

		class SetLocalPlayerAsInitialised : public GamePacket
		{
		public:
			SetLocalPlayerAsInitialised() : entity_runtime_id(0) { }
			explicit SetLocalPlayerAsInitialised(uint64_t id) : entity_runtime_id(id) { }

			uint32_t ID() const override { return IDSetLocalPlayerAsInitialised; }
			void Marshal(Net::PacketWriter &w) const override { w.VarUInt64(entity_runtime_id); }
			void Unmarshal(Net::PacketReader &r) override { entity_runtime_id = r.VarUInt64(); }

			uint64_t entity_runtime_id;
		};
	}
}
