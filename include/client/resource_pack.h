#pragma once

#include <cstdint>
#include <string>

namespace MCBE
{
	// A resource or behaviour pack. Packs offered by a server start without content and get
	// it once their download verifies.
	class ResourcePack
	{
	public:
		ResourcePack() : m_size(0), m_has_scripts(false) { }
		ResourcePack(const std::string &uuid, const std::string &version, const std::string &content);
		ResourcePack(const std::string &uuid, const std::string &version, uint64_t size);

		const std::string& UUID() const { return m_uuid; }
		const std::string& Version() const { return m_version; }
		// "<uuid>_<version>", the form peers use to request a pack
		std::string Identifier() const { return m_uuid + "_" + m_version; }

		uint64_t Size() const { return m_size; }
		bool HasContent() const { return !m_content.empty() || m_size == 0; }
		const std::string& Content() const { return m_content; }

		// raw sha256 of the content
		std::string Checksum() const;

		uint32_t DataChunkCount(uint32_t chunk_size) const;
		// Throws std::out_of_range past the last chunk
		std::string ReadChunk(uint32_t index, uint32_t chunk_size) const;

		const std::string& Name() const { return m_name; }
		void SetName(const std::string &name) { m_name = name; }
		const std::string& ContentKey() const { return m_content_key; }
		void SetContentKey(const std::string &key) { m_content_key = key; }
		const std::string& SubPackName() const { return m_sub_pack_name; }
		void SetSubPackName(const std::string &name) { m_sub_pack_name = name; }
		bool HasScripts() const { return m_has_scripts; }
		void SetHasScripts(bool v) { m_has_scripts = v; }

	private:
		std::string m_uuid;
		std::string m_version;
		std::string m_name;
		uint64_t m_size;
		std::string m_content;
		std::string m_content_key;
		std::string m_sub_pack_name;
		bool m_has_scripts;
	};

	// Parses "<uuid>_<version>"; false if there is no separator
	bool SplitPackIdentifier(const std::string &id, std::string &uuid, std::string &version);
}
