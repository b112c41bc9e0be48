#include "client/protocol/game_packet.h"
#include "client/protocol/packets.h"
#include <fmt/format.h>

void MCBE::Protocol::PacketHeader::Write(Net::PacketWriter &w) const
{
	w.VarUInt32((packet_id & 0x3ff) |
		(static_cast<uint32_t>(sender_sub_client & 0x3) << 10) |
		(static_cast<uint32_t>(target_sub_client & 0x3) << 12));
}

void MCBE::Protocol::PacketHeader::Read(Net::PacketReader &r)
{
	uint32_t value = r.VarUInt32();
	packet_id = value & 0x3ff;
	sender_sub_client = static_cast<uint8_t>((value >> 10) & 0x3);
	target_sub_client = static_cast<uint8_t>((value >> 12) & 0x3);
}

namespace {
	template<typename T>
	void RegisterType(MCBE::Protocol::PacketPool &pool)
	{
		pool.Register(T().ID(), []() { return std::unique_ptr<MCBE::Protocol::GamePacket>(new T()); });
	}
}

MCBE::Protocol::PacketPool MCBE::Protocol::PacketPool::Default()
{
	PacketPool pool;
	RegisterType<Login>(pool);
	RegisterType<PlayStatus>(pool);
	RegisterType<ServerToClientHandshake>(pool);
	RegisterType<ClientToServerHandshake>(pool);
	RegisterType<Disconnect>(pool);
	RegisterType<ResourcePacksInfo>(pool);
	RegisterType<ResourcePackStack>(pool);
	RegisterType<ResourcePackClientResponse>(pool);
	RegisterType<StartGame>(pool);
	RegisterType<RequestChunkRadius>(pool);
	RegisterType<ChunkRadiusUpdated>(pool);
	RegisterType<ResourcePackDataInfo>(pool);
	RegisterType<ResourcePackChunkData>(pool);
	RegisterType<ResourcePackChunkRequest>(pool);
	RegisterType<SetLocalPlayerAsInitialised>(pool);
	return pool;
}

std::unique_ptr<MCBE::Protocol::GamePacket> MCBE::Protocol::PacketPool::Create(uint32_t id) const
{
	auto iter = m_factories.find(id);
	if (iter == m_factories.end()) {
		return std::unique_ptr<GamePacket>(new UnknownPacket(id));
	}

	return iter->second();
}

MCBE::Net::DynamicPacket MCBE::Protocol::EncodePacket(const GamePacket &pk, const PacketHeader &header)
{
	Net::DynamicPacket out;
	Net::PacketWriter w(out);
	header.Write(w);
	pk.Marshal(w);
	return out;
}

std::unique_ptr<MCBE::Protocol::GamePacket> MCBE::Protocol::DecodePacket(const Net::Packet &data, const PacketPool &pool, PacketHeader &header, std::string &payload)
{
	Net::PacketReader r(data);
	header.Read(r);

	Net::PacketReader payload_reader(data, r.Offset());
	payload = payload_reader.Remaining();

	auto pk = pool.Create(header.packet_id);
	pk->Unmarshal(r);
	return pk;
}

std::string MCBE::Protocol::PacketName(uint32_t id)
{
	switch (id) {
	case IDLogin: return "Login";
	case IDPlayStatus: return "PlayStatus";
	case IDServerToClientHandshake: return "ServerToClientHandshake";
	case IDClientToServerHandshake: return "ClientToServerHandshake";
	case IDDisconnect: return "Disconnect";
	case IDResourcePacksInfo: return "ResourcePacksInfo";
	case IDResourcePackStack: return "ResourcePackStack";
	case IDResourcePackClientResponse: return "ResourcePackClientResponse";
	case IDStartGame: return "StartGame";
	case IDRequestChunkRadius: return "RequestChunkRadius";
	case IDChunkRadiusUpdated: return "ChunkRadiusUpdated";
	case IDResourcePackDataInfo: return "ResourcePackDataInfo";
	case IDResourcePackChunkData: return "ResourcePackChunkData";
	case IDResourcePackChunkRequest: return "ResourcePackChunkRequest";
	case IDSetLocalPlayerAsInitialised: return "SetLocalPlayerAsInitialised";
	default: return fmt::format("Unknown({:#04x})", id);
	}
}
