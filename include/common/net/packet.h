#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include <utility>

namespace MCBE
{
	namespace Net
	{
		// Byte buffer with offset based accessors. Fixed width values are little endian
		// unless the accessor name says otherwise. Reads past the end throw std::out_of_range.
		class Packet
		{
		public:
			Packet() { }
			virtual ~Packet() { }

			virtual const void *Data() const = 0;
			virtual void *Data() = 0;
			virtual size_t Length() const = 0;
			virtual bool Resize(size_t new_size) = 0;
			virtual void Clear() = 0;
			virtual void Reserve(size_t new_size) = 0;

			void PutInt8(size_t offset, int8_t value);
			void PutUInt8(size_t offset, uint8_t value);
			void PutBool(size_t offset, bool value) { PutUInt8(offset, value ? 1 : 0); }
			void PutInt16(size_t offset, int16_t value);
			void PutUInt16(size_t offset, uint16_t value);
			void PutInt32(size_t offset, int32_t value);
			void PutUInt32(size_t offset, uint32_t value);
			void PutInt32BE(size_t offset, int32_t value);
			void PutUInt64(size_t offset, uint64_t value);
			void PutString(size_t offset, const std::string &str);
			void PutData(size_t offset, const void *data, size_t length);
			void PutPacket(size_t offset, const Packet &p);

			// Variable length encodings return the number of bytes written
			size_t PutVarUInt32(size_t offset, uint32_t value);
			size_t PutVarInt32(size_t offset, int32_t value);
			size_t PutVarUInt64(size_t offset, uint64_t value);
			size_t PutVarInt64(size_t offset, int64_t value);
			size_t PutLengthString(size_t offset, const std::string &str);

			int8_t GetInt8(size_t offset) const;
			uint8_t GetUInt8(size_t offset) const;
			int16_t GetInt16(size_t offset) const;
			uint16_t GetUInt16(size_t offset) const;
			int32_t GetInt32(size_t offset) const;
			uint32_t GetUInt32(size_t offset) const;
			int32_t GetInt32BE(size_t offset) const;
			uint64_t GetUInt64(size_t offset) const;
			std::string GetString(size_t offset, size_t length) const;

			// Variable length decodings return the number of bytes consumed
			size_t GetVarUInt32(size_t offset, uint32_t &value) const;
			size_t GetVarInt32(size_t offset, int32_t &value) const;
			size_t GetVarUInt64(size_t offset, uint64_t &value) const;
			size_t GetVarInt64(size_t offset, int64_t &value) const;

			std::string ToString() const;
			std::string ToString(size_t max_bytes) const;

		protected:
			void Ensure(size_t offset, size_t length);
			void Check(size_t offset, size_t length) const;
		};

		class StaticPacket : public Packet
		{
		public:
			StaticPacket(void *data, size_t size) { m_data = data; m_data_length = size; m_max_data_length = size; }
			virtual ~StaticPacket() { }
			StaticPacket(const StaticPacket &o) { m_data = o.m_data; m_data_length = o.m_data_length; m_max_data_length = o.m_max_data_length; }
			StaticPacket& operator=(const StaticPacket &o) { m_data = o.m_data; m_data_length = o.m_data_length; m_max_data_length = o.m_max_data_length; return *this; }

			virtual const void *Data() const { return m_data; }
			virtual void *Data() { return m_data; }
			virtual size_t Length() const { return m_data_length; }
			virtual bool Resize(size_t new_size);
			virtual void Clear() { m_data_length = 0; }
			virtual void Reserve(size_t new_size) { }

		protected:
			void *m_data;
			size_t m_data_length;
			size_t m_max_data_length;
		};

		class DynamicPacket : public Packet
		{
		public:
			DynamicPacket() { }
			DynamicPacket(const void *data, size_t size) { PutData(0, data, size); }
			explicit DynamicPacket(const std::string &bytes) { PutString(0, bytes); }
			virtual ~DynamicPacket() { }
			DynamicPacket(DynamicPacket &&o) noexcept : m_data(std::move(o.m_data)) { }
			DynamicPacket(const DynamicPacket &o) : m_data(o.m_data) { }
			DynamicPacket& operator=(const DynamicPacket &o) { m_data = o.m_data; return *this; }
			DynamicPacket& operator=(DynamicPacket &&o) noexcept { m_data = std::move(o.m_data); return *this; }

			virtual const void *Data() const { return m_data.data(); }
			virtual void *Data() { return m_data.data(); }
			virtual size_t Length() const { return m_data.size(); }
			virtual bool Resize(size_t new_size) { m_data.resize(new_size); return true; }
			virtual void Clear() { m_data.clear(); }
			virtual void Reserve(size_t new_size) { m_data.reserve(new_size); }

			std::string Bytes() const { return std::string(m_data.begin(), m_data.end()); }

		protected:
			std::vector<char> m_data;
		};

		// Sequential cursor over a packet, used by the typed packet decoders
		class PacketReader
		{
		public:
			PacketReader(const Packet &p, size_t offset = 0) : m_packet(p), m_offset(offset) { }

			uint8_t UInt8();
			bool Bool() { return UInt8() != 0; }
			int16_t Int16();
			uint16_t UInt16();
			int32_t Int32();
			uint32_t UInt32();
			int32_t Int32BE();
			uint64_t UInt64();
			uint32_t VarUInt32();
			int32_t VarInt32();
			uint64_t VarUInt64();
			int64_t VarInt64();
			std::string String();
			std::string Bytes(size_t length);
			std::string Remaining();

			size_t Offset() const { return m_offset; }
			size_t Left() const { return m_packet.Length() > m_offset ? m_packet.Length() - m_offset : 0; }
			bool Empty() const { return Left() == 0; }

		private:
			const Packet &m_packet;
			size_t m_offset;
		};

		// Appends to the end of a packet, used by the typed packet encoders
		class PacketWriter
		{
		public:
			explicit PacketWriter(Packet &p) : m_packet(p) { }

			void UInt8(uint8_t v) { m_packet.PutUInt8(m_packet.Length(), v); }
			void Bool(bool v) { m_packet.PutBool(m_packet.Length(), v); }
			void Int16(int16_t v) { m_packet.PutInt16(m_packet.Length(), v); }
			void UInt16(uint16_t v) { m_packet.PutUInt16(m_packet.Length(), v); }
			void Int32(int32_t v) { m_packet.PutInt32(m_packet.Length(), v); }
			void UInt32(uint32_t v) { m_packet.PutUInt32(m_packet.Length(), v); }
			void Int32BE(int32_t v) { m_packet.PutInt32BE(m_packet.Length(), v); }
			void UInt64(uint64_t v) { m_packet.PutUInt64(m_packet.Length(), v); }
			void VarUInt32(uint32_t v) { m_packet.PutVarUInt32(m_packet.Length(), v); }
			void VarInt32(int32_t v) { m_packet.PutVarInt32(m_packet.Length(), v); }
			void VarUInt64(uint64_t v) { m_packet.PutVarUInt64(m_packet.Length(), v); }
			void VarInt64(int64_t v) { m_packet.PutVarInt64(m_packet.Length(), v); }
			void String(const std::string &v) { m_packet.PutLengthString(m_packet.Length(), v); }
			void Bytes(const std::string &v) { m_packet.PutString(m_packet.Length(), v); }

		private:
			Packet &m_packet;
		};
	}
}
