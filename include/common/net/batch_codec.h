#pragma once

#include "common/net/packet.h"
#include <openssl/evp.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace MCBE
{
	namespace Net
	{
		class CompressionStage
		{
		public:
			virtual ~CompressionStage() { }
			virtual std::string Compress(const std::string &data) = 0;
			// Throws ProtocolError on corrupt input or output over the size limit
			virtual std::string Decompress(const std::string &data) = 0;
		};

		class ZlibCompression : public CompressionStage
		{
		public:
			explicit ZlibCompression(int level = 6) : m_level(level) { }

			std::string Compress(const std::string &data) override;
			std::string Decompress(const std::string &data) override;

			static constexpr size_t MaxDecompressedSize = 64 * 1024 * 1024;
		private:
			int m_level;
		};

		class EncryptionStage
		{
		public:
			virtual ~EncryptionStage() { }
			// Appends the trailing checksum and encrypts
			virtual std::string Encrypt(const std::string &data) = 0;
			// Decrypts and verifies then strips the trailing checksum
			virtual std::string Decrypt(const std::string &data) = 0;
		};

		// AES-256-CFB8, IV is the first 16 bytes of the key. Every batch carries
		// sha256(counter || data || key)[:8] with a per direction counter.
		class AesCfb8Encryption : public EncryptionStage
		{
		public:
			explicit AesCfb8Encryption(const std::string &key);
			~AesCfb8Encryption();
			AesCfb8Encryption(const AesCfb8Encryption &) = delete;
			AesCfb8Encryption& operator=(const AesCfb8Encryption &) = delete;

			std::string Encrypt(const std::string &data) override;
			std::string Decrypt(const std::string &data) override;

			static constexpr size_t KeyLength = 32;
			static constexpr size_t ChecksumLength = 8;
		private:
			std::string Checksum(uint64_t counter, const char *data, size_t length) const;

			std::string m_key;
			EVP_CIPHER_CTX *m_encrypt;
			EVP_CIPHER_CTX *m_decrypt;
			uint64_t m_send_counter;
			uint64_t m_receive_counter;
		};

		// A frame is 0xFE followed by the batch body: varuint32 length prefixed packets,
		// compressed and then, once enabled, encrypted.
		class Encoder
		{
		public:
			Encoder();

			DynamicPacket Encode(const std::vector<DynamicPacket> &packets);
			void EnableEncryption(const std::string &key);
			bool EncryptionEnabled() const { return m_encryption != nullptr; }

			void SetCompression(std::unique_ptr<CompressionStage> stage) { m_compression = std::move(stage); }
			void SetEncryption(std::unique_ptr<EncryptionStage> stage) { m_encryption = std::move(stage); }
		private:
			std::unique_ptr<CompressionStage> m_compression;
			std::unique_ptr<EncryptionStage> m_encryption;
		};

		class Decoder
		{
		public:
			Decoder();

			// Throws ProtocolError on a malformed frame
			std::vector<DynamicPacket> Decode(const Packet &frame);
			void EnableEncryption(const std::string &key);
			bool EncryptionEnabled() const { return m_encryption != nullptr; }

			void SetCompression(std::unique_ptr<CompressionStage> stage) { m_compression = std::move(stage); }
			void SetEncryption(std::unique_ptr<EncryptionStage> stage) { m_encryption = std::move(stage); }

			static constexpr size_t MaxBatchPackets = 512;
		private:
			std::unique_ptr<CompressionStage> m_compression;
			std::unique_ptr<EncryptionStage> m_encryption;
		};

		const uint8_t BatchHeader = 0xFE;
	}
}
