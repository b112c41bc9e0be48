#include "common/net/batch_codec.h"
#include "common/net/errors.h"
#include "common/crypto/crypto.h"
#include "common/logging.h"
#include <zlib.h>
#include <cstring>
#include <fmt/format.h>

std::string MCBE::Net::ZlibCompression::Compress(const std::string &data)
{
	z_stream zstream;
	memset(&zstream, 0, sizeof(zstream));

	if (deflateInit(&zstream, m_level) != Z_OK) {
		throw ProtocolError("deflate init failed");
	}

	std::string out(deflateBound(&zstream, static_cast<uLong>(data.length())), '\0');
	zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
	zstream.avail_in = static_cast<uInt>(data.length());
	zstream.next_out = reinterpret_cast<Bytef*>(&out[0]);
	zstream.avail_out = static_cast<uInt>(out.length());

	int zerror = deflate(&zstream, Z_FINISH);
	if (zerror != Z_STREAM_END) {
		deflateEnd(&zstream);
		throw ProtocolError(fmt::format("deflate failed: {}", zerror));
	}

	out.resize(zstream.total_out);
	deflateEnd(&zstream);
	return out;
}

std::string MCBE::Net::ZlibCompression::Decompress(const std::string &data)
{
	z_stream zstream;
	memset(&zstream, 0, sizeof(zstream));

	if (inflateInit(&zstream) != Z_OK) {
		throw ProtocolError("inflate init failed");
	}

	zstream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
	zstream.avail_in = static_cast<uInt>(data.length());

	std::string out;
	char buffer[16384];
	int zerror = Z_OK;
	while (zerror != Z_STREAM_END) {
		zstream.next_out = reinterpret_cast<Bytef*>(buffer);
		zstream.avail_out = sizeof(buffer);

		zerror = inflate(&zstream, Z_NO_FLUSH);
		if (zerror != Z_OK && zerror != Z_STREAM_END) {
			std::string msg = zstream.msg ? zstream.msg : fmt::format("error {}", zerror);
			inflateEnd(&zstream);
			throw ProtocolError(fmt::format("inflate batch: {}", msg));
		}

		out.append(buffer, sizeof(buffer) - zstream.avail_out);
		if (out.length() > MaxDecompressedSize) {
			inflateEnd(&zstream);
			throw ProtocolError(fmt::format("inflate batch: output exceeds {} bytes", MaxDecompressedSize));
		}

		if (zerror == Z_OK && zstream.avail_in == 0 && zstream.avail_out != 0) {
			inflateEnd(&zstream);
			throw ProtocolError("inflate batch: truncated stream");
		}
	}

	inflateEnd(&zstream);
	return out;
}

MCBE::Net::AesCfb8Encryption::AesCfb8Encryption(const std::string &key)
{
	if (key.length() != KeyLength) {
		throw ProtocolError(fmt::format("encryption key must be {} bytes, got {}", KeyLength, key.length()));
	}

	m_key = key;
	m_send_counter = 0;
	m_receive_counter = 0;
	m_encrypt = EVP_CIPHER_CTX_new();
	m_decrypt = EVP_CIPHER_CTX_new();

	auto k = reinterpret_cast<const unsigned char*>(m_key.data());
	if (!m_encrypt || !m_decrypt ||
		EVP_EncryptInit_ex(m_encrypt, EVP_aes_256_cfb8(), nullptr, k, k) != 1 ||
		EVP_DecryptInit_ex(m_decrypt, EVP_aes_256_cfb8(), nullptr, k, k) != 1) {
		EVP_CIPHER_CTX_free(m_encrypt);
		EVP_CIPHER_CTX_free(m_decrypt);
		throw ProtocolError("failed to initialise AES-256-CFB8");
	}
}

MCBE::Net::AesCfb8Encryption::~AesCfb8Encryption()
{
	EVP_CIPHER_CTX_free(m_encrypt);
	EVP_CIPHER_CTX_free(m_decrypt);
}

std::string MCBE::Net::AesCfb8Encryption::Checksum(uint64_t counter, const char *data, size_t length) const
{
	std::string input;
	input.reserve(8 + length + m_key.length());
	for (int i = 0; i < 8; ++i) {
		input.push_back(static_cast<char>((counter >> (8 * i)) & 0xff));
	}
	input.append(data, length);
	input.append(m_key);

	return Crypto::Sha256(input).substr(0, ChecksumLength);
}

std::string MCBE::Net::AesCfb8Encryption::Encrypt(const std::string &data)
{
	std::string plain = data + Checksum(m_send_counter, data.data(), data.length());
	m_send_counter++;

	std::string out(plain.length(), '\0');
	int written = 0;
	if (EVP_EncryptUpdate(m_encrypt, reinterpret_cast<unsigned char*>(&out[0]), &written,
		reinterpret_cast<const unsigned char*>(plain.data()), static_cast<int>(plain.length())) != 1) {
		throw ProtocolError("batch encryption failed");
	}

	out.resize(written);
	return out;
}

std::string MCBE::Net::AesCfb8Encryption::Decrypt(const std::string &data)
{
	std::string plain(data.length(), '\0');
	int written = 0;
	if (EVP_DecryptUpdate(m_decrypt, reinterpret_cast<unsigned char*>(&plain[0]), &written,
		reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.length())) != 1) {
		throw ProtocolError("batch decryption failed");
	}
	plain.resize(written);

	if (plain.length() < ChecksumLength) {
		throw ProtocolError(fmt::format("encrypted batch of {} bytes is too short for its checksum", plain.length()));
	}

	size_t body_length = plain.length() - ChecksumLength;
	auto expected = Checksum(m_receive_counter, plain.data(), body_length);
	m_receive_counter++;

	if (plain.compare(body_length, ChecksumLength, expected) != 0) {
		throw ProtocolError(fmt::format("batch checksum mismatch at counter {}", m_receive_counter - 1));
	}

	plain.resize(body_length);
	return plain;
}

MCBE::Net::Encoder::Encoder()
{
	m_compression.reset(new ZlibCompression());
}

MCBE::Net::DynamicPacket MCBE::Net::Encoder::Encode(const std::vector<DynamicPacket> &packets)
{
	DynamicPacket body;
	size_t offset = 0;
	for (auto &p : packets) {
		offset += body.PutVarUInt32(offset, static_cast<uint32_t>(p.Length()));
		body.PutPacket(offset, p);
		offset += p.Length();
	}

	std::string data = body.Bytes();
	if (m_compression) {
		data = m_compression->Compress(data);
	}

	if (m_encryption) {
		data = m_encryption->Encrypt(data);
	}

	DynamicPacket frame;
	frame.PutUInt8(0, BatchHeader);
	frame.PutString(1, data);
	return frame;
}

void MCBE::Net::Encoder::EnableEncryption(const std::string &key)
{
	if (m_encryption) {
		throw ProtocolError("encryption is already enabled");
	}

	m_encryption.reset(new AesCfb8Encryption(key));
}

MCBE::Net::Decoder::Decoder()
{
	m_compression.reset(new ZlibCompression());
}

std::vector<MCBE::Net::DynamicPacket> MCBE::Net::Decoder::Decode(const Packet &frame)
{
	if (frame.Length() == 0) {
		return std::vector<DynamicPacket>();
	}

	if (frame.GetUInt8(0) != BatchHeader) {
		throw ProtocolError(fmt::format("invalid batch header {:#04x}", frame.GetUInt8(0)));
	}

	std::string data = frame.GetString(1, frame.Length() - 1);
	if (m_encryption) {
		data = m_encryption->Decrypt(data);
	}

	if (m_compression) {
		data = m_compression->Decompress(data);
	}

	DynamicPacket body(data);
	PacketReader reader(body);
	std::vector<DynamicPacket> packets;

	try {
		while (!reader.Empty()) {
			if (packets.size() >= MaxBatchPackets) {
				throw ProtocolError(fmt::format("batch holds more than {} packets", MaxBatchPackets));
			}

			uint32_t length = reader.VarUInt32();
			packets.emplace_back(reader.Bytes(length));
		}
	}
	catch (std::out_of_range &ex) {
		throw ProtocolError(fmt::format("truncated batch: {}", ex.what()));
	}

	LOG_TRACE(MOD_NET_PACKET, "Decoded batch of {} bytes into {} packets", frame.Length(), packets.size());
	return packets;
}

void MCBE::Net::Decoder::EnableEncryption(const std::string &key)
{
	if (m_encryption) {
		throw ProtocolError("encryption is already enabled");
	}

	m_encryption.reset(new AesCfb8Encryption(key));
}
