#include "client/protocol/packets.h"
#include <fmt/format.h>
#include <stdexcept>

namespace {
	void WriteInfoEntries(MCBE::Net::PacketWriter &w, const std::vector<MCBE::Protocol::ResourcePackInfoEntry> &entries)
	{
		w.Int16(static_cast<int16_t>(entries.size()));
		for (auto &e : entries) {
			w.String(e.uuid);
			w.String(e.version);
			w.UInt64(e.size);
			w.String(e.content_key);
			w.String(e.sub_pack_name);
			w.String(e.content_identity);
			w.Bool(e.has_scripts);
		}
	}

	void ReadInfoEntries(MCBE::Net::PacketReader &r, std::vector<MCBE::Protocol::ResourcePackInfoEntry> &entries)
	{
		int16_t count = r.Int16();
		if (count < 0) {
			throw std::out_of_range(fmt::format("negative resource pack count {}", count));
		}

		entries.clear();
		for (int16_t i = 0; i < count; ++i) {
			MCBE::Protocol::ResourcePackInfoEntry e;
			e.uuid = r.String();
			e.version = r.String();
			e.size = r.UInt64();
			e.content_key = r.String();
			e.sub_pack_name = r.String();
			e.content_identity = r.String();
			e.has_scripts = r.Bool();
			entries.push_back(e);
		}
	}

	void WriteStackEntries(MCBE::Net::PacketWriter &w, const std::vector<MCBE::Protocol::StackResourcePack> &entries)
	{
		w.VarUInt32(static_cast<uint32_t>(entries.size()));
		for (auto &e : entries) {
			w.String(e.uuid);
			w.String(e.version);
			w.String(e.sub_pack_name);
		}
	}

	void ReadStackEntries(MCBE::Net::PacketReader &r, std::vector<MCBE::Protocol::StackResourcePack> &entries)
	{
		uint32_t count = r.VarUInt32();
		if (count > r.Left()) {
			throw std::out_of_range(fmt::format("resource pack stack count {} exceeds payload", count));
		}

		entries.clear();
		for (uint32_t i = 0; i < count; ++i) {
			MCBE::Protocol::StackResourcePack e;
			e.uuid = r.String();
			e.version = r.String();
			e.sub_pack_name = r.String();
			entries.push_back(e);
		}
	}
}

const char *MCBE::Protocol::PlayStatusName(int32_t status)
{
	switch (status) {
	case PlayStatusLoginSuccess: return "login success";
	case PlayStatusLoginFailedClient: return "outdated client";
	case PlayStatusLoginFailedServer: return "outdated server";
	case PlayStatusPlayerSpawn: return "player spawn";
	case PlayStatusLoginFailedInvalidTenant: return "invalid education edition tenant";
	case PlayStatusLoginFailedVanillaEdu: return "education edition client on vanilla server";
	case PlayStatusLoginFailedEduVanilla: return "vanilla client on education edition server";
	case PlayStatusLoginFailedServerFull: return "server full";
	default: return "unknown status";
	}
}

void MCBE::Protocol::Login::Marshal(Net::PacketWriter &w) const
{
	w.Int32BE(client_protocol);
	w.String(connection_request);
}

void MCBE::Protocol::Login::Unmarshal(Net::PacketReader &r)
{
	client_protocol = r.Int32BE();
	connection_request = r.String();
}

void MCBE::Protocol::Disconnect::Marshal(Net::PacketWriter &w) const
{
	w.Bool(hide_disconnection_screen);
	if (!hide_disconnection_screen) {
		w.String(message);
	}
}

void MCBE::Protocol::Disconnect::Unmarshal(Net::PacketReader &r)
{
	hide_disconnection_screen = r.Bool();
	if (!hide_disconnection_screen) {
		message = r.String();
	}
}

void MCBE::Protocol::ResourcePacksInfo::Marshal(Net::PacketWriter &w) const
{
	w.Bool(texture_pack_required);
	w.Bool(has_scripts);
	WriteInfoEntries(w, behaviour_packs);
	WriteInfoEntries(w, texture_packs);
}

void MCBE::Protocol::ResourcePacksInfo::Unmarshal(Net::PacketReader &r)
{
	texture_pack_required = r.Bool();
	has_scripts = r.Bool();
	ReadInfoEntries(r, behaviour_packs);
	ReadInfoEntries(r, texture_packs);
}

void MCBE::Protocol::ResourcePackStack::Marshal(Net::PacketWriter &w) const
{
	w.Bool(texture_pack_required);
	WriteStackEntries(w, behaviour_packs);
	WriteStackEntries(w, texture_packs);
	w.Bool(experimental);
}

void MCBE::Protocol::ResourcePackStack::Unmarshal(Net::PacketReader &r)
{
	texture_pack_required = r.Bool();
	ReadStackEntries(r, behaviour_packs);
	ReadStackEntries(r, texture_packs);
	experimental = r.Bool();
}

void MCBE::Protocol::ResourcePackClientResponse::Marshal(Net::PacketWriter &w) const
{
	w.UInt8(response);
	w.Int16(static_cast<int16_t>(packs_to_download.size()));
	for (auto &id : packs_to_download) {
		w.String(id);
	}
}

void MCBE::Protocol::ResourcePackClientResponse::Unmarshal(Net::PacketReader &r)
{
	response = r.UInt8();
	int16_t count = r.Int16();
	if (count < 0) {
		throw std::out_of_range(fmt::format("negative pack response count {}", count));
	}

	packs_to_download.clear();
	for (int16_t i = 0; i < count; ++i) {
		packs_to_download.push_back(r.String());
	}
}

void MCBE::Protocol::StartGame::Marshal(Net::PacketWriter &w) const
{
	w.VarInt64(entity_unique_id);
	w.VarUInt64(entity_runtime_id);
	w.Bytes(world_data);
}

void MCBE::Protocol::StartGame::Unmarshal(Net::PacketReader &r)
{
	entity_unique_id = r.VarInt64();
	entity_runtime_id = r.VarUInt64();
	world_data = r.Remaining();
}

void MCBE::Protocol::ResourcePackDataInfo::Marshal(Net::PacketWriter &w) const
{
	w.String(uuid);
	w.UInt32(data_chunk_size);
	w.UInt32(chunk_count);
	w.UInt64(size);
	w.String(hash);
}

void MCBE::Protocol::ResourcePackDataInfo::Unmarshal(Net::PacketReader &r)
{
	uuid = r.String();
	data_chunk_size = r.UInt32();
	chunk_count = r.UInt32();
	size = r.UInt64();
	hash = r.String();
}

void MCBE::Protocol::ResourcePackChunkData::Marshal(Net::PacketWriter &w) const
{
	w.String(uuid);
	w.UInt32(chunk_index);
	w.UInt64(data_offset);
	w.String(data);
}

void MCBE::Protocol::ResourcePackChunkData::Unmarshal(Net::PacketReader &r)
{
	uuid = r.String();
	chunk_index = r.UInt32();
	data_offset = r.UInt64();
	data = r.String();
}
