#include "common/net/packet.h"
#include <cstring>
#include <stdexcept>
#include <fmt/format.h>

// Bedrock varints are at most 5 bytes for 32 bit values and 10 bytes for 64 bit values
constexpr int MAX_VARINT32_BYTES = 5;
constexpr int MAX_VARINT64_BYTES = 10;

void MCBE::Net::Packet::Ensure(size_t offset, size_t length)
{
	if (Length() < offset + length) {
		if (!Resize(offset + length)) {
			throw std::out_of_range(fmt::format("Packet write of {} bytes at {} exceeds capacity", length, offset));
		}
	}
}

void MCBE::Net::Packet::Check(size_t offset, size_t length) const
{
	if (offset + length > Length() || offset + length < offset) {
		throw std::out_of_range(fmt::format("Packet read of {} bytes at {} exceeds length {}", length, offset, Length()));
	}
}

void MCBE::Net::Packet::PutInt8(size_t offset, int8_t value)
{
	PutUInt8(offset, static_cast<uint8_t>(value));
}

void MCBE::Net::Packet::PutUInt8(size_t offset, uint8_t value)
{
	Ensure(offset, 1);
	static_cast<uint8_t*>(Data())[offset] = value;
}

void MCBE::Net::Packet::PutInt16(size_t offset, int16_t value)
{
	PutUInt16(offset, static_cast<uint16_t>(value));
}

void MCBE::Net::Packet::PutUInt16(size_t offset, uint16_t value)
{
	Ensure(offset, 2);
	auto d = static_cast<uint8_t*>(Data()) + offset;
	d[0] = value & 0xff;
	d[1] = (value >> 8) & 0xff;
}

void MCBE::Net::Packet::PutInt32(size_t offset, int32_t value)
{
	PutUInt32(offset, static_cast<uint32_t>(value));
}

void MCBE::Net::Packet::PutUInt32(size_t offset, uint32_t value)
{
	Ensure(offset, 4);
	auto d = static_cast<uint8_t*>(Data()) + offset;
	for (int i = 0; i < 4; ++i) {
		d[i] = (value >> (8 * i)) & 0xff;
	}
}

void MCBE::Net::Packet::PutInt32BE(size_t offset, int32_t value)
{
	Ensure(offset, 4);
	auto v = static_cast<uint32_t>(value);
	auto d = static_cast<uint8_t*>(Data()) + offset;
	for (int i = 0; i < 4; ++i) {
		d[i] = (v >> (8 * (3 - i))) & 0xff;
	}
}

void MCBE::Net::Packet::PutUInt64(size_t offset, uint64_t value)
{
	Ensure(offset, 8);
	auto d = static_cast<uint8_t*>(Data()) + offset;
	for (int i = 0; i < 8; ++i) {
		d[i] = (value >> (8 * i)) & 0xff;
	}
}

void MCBE::Net::Packet::PutString(size_t offset, const std::string &str)
{
	PutData(offset, str.data(), str.length());
}

void MCBE::Net::Packet::PutData(size_t offset, const void *data, size_t length)
{
	if (length == 0) {
		return;
	}

	Ensure(offset, length);
	memcpy(static_cast<char*>(Data()) + offset, data, length);
}

void MCBE::Net::Packet::PutPacket(size_t offset, const Packet &p)
{
	PutData(offset, p.Data(), p.Length());
}

size_t MCBE::Net::Packet::PutVarUInt32(size_t offset, uint32_t value)
{
	size_t written = 0;
	do {
		uint8_t b = value & 0x7f;
		value >>= 7;
		if (value != 0) {
			b |= 0x80;
		}
		PutUInt8(offset + written, b);
		written++;
	} while (value != 0);

	return written;
}

size_t MCBE::Net::Packet::PutVarInt32(size_t offset, int32_t value)
{
	auto zigzag = (static_cast<uint32_t>(value) << 1) ^ static_cast<uint32_t>(value >> 31);
	return PutVarUInt32(offset, zigzag);
}

size_t MCBE::Net::Packet::PutVarUInt64(size_t offset, uint64_t value)
{
	size_t written = 0;
	do {
		uint8_t b = value & 0x7f;
		value >>= 7;
		if (value != 0) {
			b |= 0x80;
		}
		PutUInt8(offset + written, b);
		written++;
	} while (value != 0);

	return written;
}

size_t MCBE::Net::Packet::PutVarInt64(size_t offset, int64_t value)
{
	auto zigzag = (static_cast<uint64_t>(value) << 1) ^ static_cast<uint64_t>(value >> 63);
	return PutVarUInt64(offset, zigzag);
}

size_t MCBE::Net::Packet::PutLengthString(size_t offset, const std::string &str)
{
	auto prefix = PutVarUInt32(offset, static_cast<uint32_t>(str.length()));
	PutString(offset + prefix, str);
	return prefix + str.length();
}

int8_t MCBE::Net::Packet::GetInt8(size_t offset) const
{
	return static_cast<int8_t>(GetUInt8(offset));
}

uint8_t MCBE::Net::Packet::GetUInt8(size_t offset) const
{
	Check(offset, 1);
	return static_cast<const uint8_t*>(Data())[offset];
}

int16_t MCBE::Net::Packet::GetInt16(size_t offset) const
{
	return static_cast<int16_t>(GetUInt16(offset));
}

uint16_t MCBE::Net::Packet::GetUInt16(size_t offset) const
{
	Check(offset, 2);
	auto d = static_cast<const uint8_t*>(Data()) + offset;
	return static_cast<uint16_t>(d[0] | (d[1] << 8));
}

int32_t MCBE::Net::Packet::GetInt32(size_t offset) const
{
	return static_cast<int32_t>(GetUInt32(offset));
}

uint32_t MCBE::Net::Packet::GetUInt32(size_t offset) const
{
	Check(offset, 4);
	auto d = static_cast<const uint8_t*>(Data()) + offset;
	uint32_t value = 0;
	for (int i = 0; i < 4; ++i) {
		value |= static_cast<uint32_t>(d[i]) << (8 * i);
	}
	return value;
}

int32_t MCBE::Net::Packet::GetInt32BE(size_t offset) const
{
	Check(offset, 4);
	auto d = static_cast<const uint8_t*>(Data()) + offset;
	uint32_t value = 0;
	for (int i = 0; i < 4; ++i) {
		value = (value << 8) | d[i];
	}
	return static_cast<int32_t>(value);
}

uint64_t MCBE::Net::Packet::GetUInt64(size_t offset) const
{
	Check(offset, 8);
	auto d = static_cast<const uint8_t*>(Data()) + offset;
	uint64_t value = 0;
	for (int i = 0; i < 8; ++i) {
		value |= static_cast<uint64_t>(d[i]) << (8 * i);
	}
	return value;
}

std::string MCBE::Net::Packet::GetString(size_t offset, size_t length) const
{
	Check(offset, length);
	return std::string(static_cast<const char*>(Data()) + offset, length);
}

size_t MCBE::Net::Packet::GetVarUInt32(size_t offset, uint32_t &value) const
{
	value = 0;
	for (int i = 0; i < MAX_VARINT32_BYTES; ++i) {
		auto b = GetUInt8(offset + i);
		value |= static_cast<uint32_t>(b & 0x7f) << (7 * i);
		if ((b & 0x80) == 0) {
			return i + 1;
		}
	}

	throw std::out_of_range(fmt::format("varuint32 at {} does not terminate", offset));
}

size_t MCBE::Net::Packet::GetVarInt32(size_t offset, int32_t &value) const
{
	uint32_t raw = 0;
	auto read = GetVarUInt32(offset, raw);
	value = static_cast<int32_t>((raw >> 1) ^ (~(raw & 1) + 1));
	return read;
}

size_t MCBE::Net::Packet::GetVarUInt64(size_t offset, uint64_t &value) const
{
	value = 0;
	for (int i = 0; i < MAX_VARINT64_BYTES; ++i) {
		auto b = GetUInt8(offset + i);
		value |= static_cast<uint64_t>(b & 0x7f) << (7 * i);
		if ((b & 0x80) == 0) {
			return i + 1;
		}
	}

	throw std::out_of_range(fmt::format("varuint64 at {} does not terminate", offset));
}

size_t MCBE::Net::Packet::GetVarInt64(size_t offset, int64_t &value) const
{
	uint64_t raw = 0;
	auto read = GetVarUInt64(offset, raw);
	value = static_cast<int64_t>((raw >> 1) ^ (~(raw & 1) + 1));
	return read;
}

std::string MCBE::Net::Packet::ToString() const
{
	return ToString(Length());
}

std::string MCBE::Net::Packet::ToString(size_t max_bytes) const
{
	std::string hex;
	auto d = static_cast<const uint8_t*>(Data());
	auto len = Length() < max_bytes ? Length() : max_bytes;
	hex.reserve(len * 3 + 3);

	for (size_t i = 0; i < len; ++i) {
		hex += fmt::format("{:02x} ", d[i]);
	}

	if (Length() > max_bytes) {
		hex += "...";
	}

	return hex;
}

bool MCBE::Net::StaticPacket::Resize(size_t new_size)
{
	if (new_size > m_max_data_length) {
		return false;
	}

	m_data_length = new_size;
	return true;
}

uint8_t MCBE::Net::PacketReader::UInt8()
{
	auto v = m_packet.GetUInt8(m_offset);
	m_offset += 1;
	return v;
}

int16_t MCBE::Net::PacketReader::Int16()
{
	auto v = m_packet.GetInt16(m_offset);
	m_offset += 2;
	return v;
}

uint16_t MCBE::Net::PacketReader::UInt16()
{
	auto v = m_packet.GetUInt16(m_offset);
	m_offset += 2;
	return v;
}

int32_t MCBE::Net::PacketReader::Int32()
{
	auto v = m_packet.GetInt32(m_offset);
	m_offset += 4;
	return v;
}

uint32_t MCBE::Net::PacketReader::UInt32()
{
	auto v = m_packet.GetUInt32(m_offset);
	m_offset += 4;
	return v;
}

int32_t MCBE::Net::PacketReader::Int32BE()
{
	auto v = m_packet.GetInt32BE(m_offset);
	m_offset += 4;
	return v;
}

uint64_t MCBE::Net::PacketReader::UInt64()
{
	auto v = m_packet.GetUInt64(m_offset);
	m_offset += 8;
	return v;
}

uint32_t MCBE::Net::PacketReader::VarUInt32()
{
	uint32_t v = 0;
	m_offset += m_packet.GetVarUInt32(m_offset, v);
	return v;
}

int32_t MCBE::Net::PacketReader::VarInt32()
{
	int32_t v = 0;
	m_offset += m_packet.GetVarInt32(m_offset, v);
	return v;
}

uint64_t MCBE::Net::PacketReader::VarUInt64()
{
	uint64_t v = 0;
	m_offset += m_packet.GetVarUInt64(m_offset, v);
	return v;
}

int64_t MCBE::Net::PacketReader::VarInt64()
{
	int64_t v = 0;
	m_offset += m_packet.GetVarInt64(m_offset, v);
	return v;
}

std::string MCBE::Net::PacketReader::String()
{
	auto length = VarUInt32();
	return Bytes(length);
}

std::string MCBE::Net::PacketReader::Bytes(size_t length)
{
	auto v = m_packet.GetString(m_offset, length);
	m_offset += length;
	return v;
}

std::string MCBE::Net::PacketReader::Remaining()
{
	return Bytes(Left());
}
