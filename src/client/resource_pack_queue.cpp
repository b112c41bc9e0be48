#include "client/resource_pack_queue.h"
#include "common/crypto/crypto.h"
#include "common/net/errors.h"
#include "common/logging.h"
#include <fmt/format.h>

const char *MCBE::PackStateName(PackState state)
{
	switch (state) {
	case PackStateOffered: return "offered";
	case PackStateRequested: return "requested";
	case PackStateDownloading: return "downloading";
	case PackStateVerified: return "verified";
	default: return "unknown";
	}
}

MCBE::ResourcePackQueue::ResourcePackQueue(const std::vector<std::shared_ptr<ResourcePack>> &catalog, uint32_t chunk_size)
{
	if (chunk_size == 0) {
		throw std::invalid_argument("resource pack chunk size must be positive");
	}

	m_catalog = catalog;
	m_chunk_size = chunk_size;

	for (auto &pack : m_catalog) {
		m_states[pack->Identifier()] = PackStateOffered;
	}
}

std::shared_ptr<MCBE::ResourcePack> MCBE::ResourcePackQueue::FindPack(const std::string &id) const
{
	for (auto &pack : m_catalog) {
		if (pack->Identifier() == id) {
			return pack;
		}
	}

	return nullptr;
}

void MCBE::ResourcePackQueue::Request(const std::vector<std::string> &ids)
{
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<std::shared_ptr<ResourcePack>> resolved;
	for (auto &id : ids) {
		auto pack = FindPack(id);
		if (!pack) {
			throw Net::ProtocolError(fmt::format("could not find resource pack {}", id));
		}
		resolved.push_back(pack);
	}

	for (auto &pack : resolved) {
		auto &state = m_states[pack->Identifier()];
		if (state != PackStateOffered) {
			continue;
		}

		state = PackStateRequested;
		m_pending.push_back(pack);
		LOG_DEBUG(MOD_RESOURCE, "Requested resource pack {}", pack->Identifier());
	}
}

bool MCBE::ResourcePackQueue::NextPack(PackDataInfo &info)
{
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_pending.empty()) {
		return false;
	}

	if (m_downloading) {
		throw Net::ProtocolError(fmt::format("resource pack {} is still being transferred", m_downloading->pack->Identifier()));
	}

	auto pack = m_pending.front();
	if (!pack->HasContent()) {
		throw Net::ProtocolError(fmt::format("resource pack {} has no content to send", pack->Identifier()));
	}
	m_pending.pop_front();

	auto checksum = pack->Checksum();
	info.uuid = pack->UUID();
	info.chunk_size = m_chunk_size;
	info.chunk_count = pack->DataChunkCount(m_chunk_size);
	info.size = pack->Size();
	info.hash = checksum;

	StartLocked(pack, m_chunk_size, pack->Size(), checksum);
	return true;
}

MCBE::ChunkResult MCBE::ResourcePackQueue::BeginDownload(const PackDataInfo &info)
{
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_downloading) {
		throw Net::ProtocolError(fmt::format("resource pack {} sent while {} is still downloading",
			info.uuid, m_downloading->pack->Identifier()));
	}

	auto iter = m_pending.begin();
	for (; iter != m_pending.end(); ++iter) {
		if ((*iter)->UUID() == info.uuid || (*iter)->Identifier() == info.uuid) {
			break;
		}
	}

	if (iter == m_pending.end()) {
		throw Net::ProtocolError(fmt::format("data info for resource pack {} which was not requested", info.uuid));
	}

	if (info.size > MaxPackSize) {
		throw Net::ProtocolError(fmt::format("resource pack {} declares {} bytes, limit is {}", info.uuid, info.size, MaxPackSize));
	}

	if ((*iter)->Size() != info.size) {
		throw Net::ProtocolError(fmt::format("resource pack {} was offered at {} bytes but is sent as {} bytes",
			(*iter)->Identifier(), (*iter)->Size(), info.size));
	}

	if (info.size > 0 && info.chunk_size == 0) {
		throw Net::ProtocolError(fmt::format("resource pack {} declares a zero chunk size", info.uuid));
	}

	if (info.size > 0) {
		uint64_t expected_chunks = (info.size + info.chunk_size - 1) / info.chunk_size;
		if (expected_chunks != info.chunk_count) {
			throw Net::ProtocolError(fmt::format("resource pack {} declares {} chunks for {} bytes of {} byte chunks",
				info.uuid, info.chunk_count, info.size, info.chunk_size));
		}
	}

	auto pack = *iter;
	m_pending.erase(iter);
	return StartLocked(pack, info.chunk_size, info.size, info.hash);
}

MCBE::ChunkResult MCBE::ResourcePackQueue::StartLocked(const std::shared_ptr<ResourcePack> &pack, uint32_t chunk_size, uint64_t size, const std::string &hash)
{
	m_downloading.reset(new DownloadingPack());
	m_downloading->pack = pack;
	m_downloading->chunk_size = chunk_size;
	m_downloading->chunk_count = chunk_size == 0 ? 0 : static_cast<uint32_t>((size + chunk_size - 1) / chunk_size);
	m_downloading->size = size;
	m_downloading->expected_index = 0;
	m_downloading->hash = hash;
	m_states[pack->Identifier()] = PackStateDownloading;

	LOG_INFO(MOD_RESOURCE, "Downloading resource pack {}: {} bytes in {} chunks",
		pack->Identifier(), size, m_downloading->chunk_count);

	if (size == 0) {
		return FinishLocked();
	}

	return ChunkResult();
}

MCBE::ChunkResult MCBE::ResourcePackQueue::DeliverChunk(const std::string &uuid, uint32_t index, uint64_t offset, const std::string &data)
{
	std::lock_guard<std::mutex> lock(m_mutex);

	if (!m_downloading || (m_downloading->pack->UUID() != uuid && m_downloading->pack->Identifier() != uuid)) {
		throw Net::ProtocolError(fmt::format("chunk {} for resource pack {} which is not being downloaded", index, uuid));
	}

	auto &d = *m_downloading;
	if (index != d.expected_index) {
		throw Net::ProtocolError(fmt::format("resource pack {}: expected chunk {}, got {}", uuid, d.expected_index, index));
	}

	if (offset != d.buffer.length()) {
		throw Net::ProtocolError(fmt::format("resource pack {}: chunk {} at offset {}, expected offset {}", uuid, index, offset, d.buffer.length()));
	}

	if (data.length() > d.chunk_size) {
		throw Net::ProtocolError(fmt::format("resource pack {}: chunk {} carries {} bytes, chunk size is {}", uuid, index, data.length(), d.chunk_size));
	}

	if (d.buffer.length() + data.length() > d.size) {
		throw Net::ProtocolError(fmt::format("resource pack {}: chunk {} overruns the declared size of {} bytes", uuid, index, d.size));
	}

	d.buffer.append(data);
	d.expected_index++;
	LOG_TRACE(MOD_RESOURCE, "Resource pack {} chunk {}/{} ({} of {} bytes)", uuid, index + 1, d.chunk_count, d.buffer.length(), d.size);

	if (d.buffer.length() < d.size) {
		if (d.expected_index >= d.chunk_count) {
			throw Net::ProtocolError(fmt::format("resource pack {}: all {} chunks received but only {} of {} bytes",
				uuid, d.chunk_count, d.buffer.length(), d.size));
		}

		ChunkResult result;
		result.next_index = d.expected_index;
		return result;
	}

	return FinishLocked();
}

MCBE::ChunkResult MCBE::ResourcePackQueue::FinishLocked()
{
	auto &d = *m_downloading;
	if (Crypto::Sha256(d.buffer) != d.hash) {
		throw Net::ProtocolError(fmt::format("resource pack {}: checksum mismatch, transfer is corrupted", d.pack->Identifier()));
	}

	auto pack = std::make_shared<ResourcePack>(d.pack->UUID(), d.pack->Version(), d.buffer);
	pack->SetName(d.pack->Name());
	pack->SetContentKey(d.pack->ContentKey());
	pack->SetSubPackName(d.pack->SubPackName());
	pack->SetHasScripts(d.pack->HasScripts());

	m_states[pack->Identifier()] = PackStateVerified;
	m_downloaded.push_back(pack);
	m_downloading.reset();

	LOG_INFO(MOD_RESOURCE, "Resource pack {} verified ({} bytes)", pack->Identifier(), pack->Size());

	ChunkResult result;
	result.complete = true;
	result.pack = pack;
	result.all_downloaded = AllDownloadedLocked();
	return result;
}

bool MCBE::ResourcePackQueue::AllDownloadedLocked() const
{
	for (auto &state : m_states) {
		if (state.second == PackStateRequested || state.second == PackStateDownloading) {
			return false;
		}
	}

	return true;
}

bool MCBE::ResourcePackQueue::AllDownloaded() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return AllDownloadedLocked();
}

MCBE::PackState MCBE::ResourcePackQueue::GetState(const std::string &id) const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	auto iter = m_states.find(id);
	if (iter == m_states.end()) {
		return PackStateUnknown;
	}

	return iter->second;
}

std::vector<std::shared_ptr<MCBE::ResourcePack>> MCBE::ResourcePackQueue::Downloaded() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_downloaded;
}

size_t MCBE::ResourcePackQueue::PendingCount() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_pending.size();
}

std::shared_ptr<MCBE::ResourcePack> MCBE::ResourcePackQueue::CurrentPack() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_downloading ? m_downloading->pack : nullptr;
}

uint64_t MCBE::ResourcePackQueue::CurrentOffset() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_downloading ? m_downloading->buffer.length() : 0;
}
