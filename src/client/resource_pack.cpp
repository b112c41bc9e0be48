#include "client/resource_pack.h"
#include "common/crypto/crypto.h"
#include <fmt/format.h>
#include <stdexcept>

MCBE::ResourcePack::ResourcePack(const std::string &uuid, const std::string &version, const std::string &content)
{
	m_uuid = uuid;
	m_version = version;
	m_content = content;
	m_size = content.length();
	m_has_scripts = false;
}

MCBE::ResourcePack::ResourcePack(const std::string &uuid, const std::string &version, uint64_t size)
{
	m_uuid = uuid;
	m_version = version;
	m_size = size;
	m_has_scripts = false;
}

std::string MCBE::ResourcePack::Checksum() const
{
	return Crypto::Sha256(m_content);
}

uint32_t MCBE::ResourcePack::DataChunkCount(uint32_t chunk_size) const
{
	if (chunk_size == 0) {
		throw std::invalid_argument("chunk size must be positive");
	}

	return static_cast<uint32_t>((m_size + chunk_size - 1) / chunk_size);
}

std::string MCBE::ResourcePack::ReadChunk(uint32_t index, uint32_t chunk_size) const
{
	if (index >= DataChunkCount(chunk_size)) {
		throw std::out_of_range(fmt::format("chunk {} of pack {} out of range", index, Identifier()));
	}

	if (m_content.length() != m_size) {
		throw std::out_of_range(fmt::format("pack {} has no content to read", Identifier()));
	}

	return m_content.substr(static_cast<size_t>(index) * chunk_size, chunk_size);
}

bool MCBE::SplitPackIdentifier(const std::string &id, std::string &uuid, std::string &version)
{
	auto sep = id.find('_');
	if (sep == std::string::npos) {
		return false;
	}

	uuid = id.substr(0, sep);
	version = id.substr(sep + 1);
	return true;
}
