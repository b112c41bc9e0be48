#pragma once

#include "common/net/packet.h"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <string>

namespace MCBE
{
	namespace Protocol
	{
		const int32_t CurrentProtocol = 361;
		const char *const CurrentVersion = "1.12.0";

		// Bedrock packet IDs used by the session layer
		enum PacketIDs : uint32_t {
			IDLogin = 0x01,
			IDPlayStatus = 0x02,
			IDServerToClientHandshake = 0x03,
			IDClientToServerHandshake = 0x04,
			IDDisconnect = 0x05,
			IDResourcePacksInfo = 0x06,
			IDResourcePackStack = 0x07,
			IDResourcePackClientResponse = 0x08,
			IDStartGame = 0x0b,
			IDRequestChunkRadius = 0x45,
			IDChunkRadiusUpdated = 0x46,
			IDResourcePackDataInfo = 0x52,
			IDResourcePackChunkData = 0x53,
			IDResourcePackChunkRequest = 0x54,
			IDSetLocalPlayerAsInitialised = 0x71
		};

		// varuint32 in front of every packet: ID in the low 10 bits, then two bits each
		// for the sender and target sub-client
		struct PacketHeader
		{
			PacketHeader() : packet_id(0), sender_sub_client(0), target_sub_client(0) { }
			explicit PacketHeader(uint32_t id) : packet_id(id), sender_sub_client(0), target_sub_client(0) { }

			void Write(Net::PacketWriter &w) const;
			void Read(Net::PacketReader &r);

			uint32_t packet_id;
			uint8_t sender_sub_client;
			uint8_t target_sub_client;
		};

		class GamePacket
		{
		public:
			virtual ~GamePacket() { }

			virtual uint32_t ID() const = 0;
			virtual void Marshal(Net::PacketWriter &w) const = 0;
			// Throws std::out_of_range on truncated payloads
			virtual void Unmarshal(Net::PacketReader &r) = 0;
		};

		// Payload of a packet without a registered decoder, kept verbatim
		class UnknownPacket : public GamePacket
		{
		public:
			UnknownPacket() : m_id(0) { }
			explicit UnknownPacket(uint32_t id) : m_id(id) { }

			uint32_t ID() const override { return m_id; }
			void Marshal(Net::PacketWriter &w) const override { w.Bytes(payload); }
			void Unmarshal(Net::PacketReader &r) override { payload = r.Remaining(); }

			std::string payload;
		private:
			uint32_t m_id;
		};

		// Registry of packet decoders keyed by ID. Read only once a session is using it.
		class PacketPool
		{
		public:
			typedef std::function<std::unique_ptr<GamePacket>()> Factory;

			PacketPool() { }

			// Pool with every packet type the session layer handles
			static PacketPool Default();

			void Register(uint32_t id, Factory factory) { m_factories[id] = std::move(factory); }
			bool Registered(uint32_t id) const { return m_factories.count(id) != 0; }

			// UnknownPacket for unregistered IDs
			std::unique_ptr<GamePacket> Create(uint32_t id) const;
		private:
			std::map<uint32_t, Factory> m_factories;
		};

		// Header followed by the marshalled payload
		Net::DynamicPacket EncodePacket(const GamePacket &pk, const PacketHeader &header);

		// Reads the header and unmarshals the payload; throws std::out_of_range on truncation
		std::unique_ptr<GamePacket> DecodePacket(const Net::Packet &data, const PacketPool &pool, PacketHeader &header, std::string &payload);

		std::string PacketName(uint32_t id);
	}
}
