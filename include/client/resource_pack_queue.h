#pragma once

#include "client/resource_pack.h"
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace MCBE
{
	enum PackState {
		PackStateUnknown,
		PackStateOffered,
		PackStateRequested,
		PackStateDownloading,
		PackStateVerified
	};

	const char *PackStateName(PackState state);

	// Transfer parameters of one pack, as carried by ResourcePackDataInfo
	struct PackDataInfo
	{
		PackDataInfo() : chunk_size(0), chunk_count(0), size(0) { }

		std::string uuid;
		uint32_t chunk_size;
		uint32_t chunk_count;
		uint64_t size;
		std::string hash;
	};

	struct ChunkResult
	{
		ChunkResult() : complete(false), next_index(0), all_downloaded(false) { }

		// The current pack reached its declared size and its checksum matched
		bool complete;
		std::shared_ptr<ResourcePack> pack;
		uint32_t next_index;
		bool all_downloaded;
	};

	// Tracks the packs a peer asked for and reassembles them one at a time. Chunks must
	// arrive in index order starting at zero. Requested packs are downloaded in the order
	// they were requested.
	class ResourcePackQueue
	{
	public:
		explicit ResourcePackQueue(const std::vector<std::shared_ptr<ResourcePack>> &catalog, uint32_t chunk_size = DefaultChunkSize);

		// All or nothing. Throws Net::ProtocolError naming the first identifier missing from
		// the catalog. Packs already requested are not queued twice.
		void Request(const std::vector<std::string> &ids);

		// Starts sending the next requested pack from the catalog. False when none remain.
		bool NextPack(PackDataInfo &info);

		// Starts receiving a requested pack the peer described. The declared size must match
		// the size the pack was offered at.
		ChunkResult BeginDownload(const PackDataInfo &info);

		// Appends the next chunk of the current pack at the given byte offset. Throws
		// Net::ProtocolError on an unexpected pack, an out of order index or offset, an
		// oversized chunk, an overrun or a checksum mismatch.
		ChunkResult DeliverChunk(const std::string &uuid, uint32_t index, uint64_t offset, const std::string &data);

		bool AllDownloaded() const;
		PackState GetState(const std::string &id) const;
		std::vector<std::shared_ptr<ResourcePack>> Downloaded() const;
		size_t PendingCount() const;

		std::shared_ptr<ResourcePack> CurrentPack() const;
		uint64_t CurrentOffset() const;

		const std::vector<std::shared_ptr<ResourcePack>>& Catalog() const { return m_catalog; }
		uint32_t ChunkSize() const { return m_chunk_size; }

		static constexpr uint32_t DefaultChunkSize = 1024 * 1024;
		static constexpr uint64_t MaxPackSize = 1ULL << 30;
	private:
		struct DownloadingPack
		{
			std::shared_ptr<ResourcePack> pack;
			std::string buffer;
			uint32_t chunk_size;
			uint32_t chunk_count;
			uint64_t size;
			uint32_t expected_index;
			std::string hash;
		};

		std::shared_ptr<ResourcePack> FindPack(const std::string &id) const;
		ChunkResult StartLocked(const std::shared_ptr<ResourcePack> &pack, uint32_t chunk_size, uint64_t size, const std::string &hash);
		ChunkResult FinishLocked();
		bool AllDownloadedLocked() const;

		mutable std::mutex m_mutex;
		std::vector<std::shared_ptr<ResourcePack>> m_catalog;
		uint32_t m_chunk_size;

		std::map<std::string, PackState> m_states;
		std::deque<std::shared_ptr<ResourcePack>> m_pending;
		std::unique_ptr<DownloadingPack> m_downloading;
		std::vector<std::shared_ptr<ResourcePack>> m_downloaded;
	};
}
