#pragma once

#include <openssl/evp.h>
#include <stdexcept>
#include <string>

namespace MCBE
{
	namespace Crypto
	{
		class CryptoError : public std::runtime_error
		{
		public:
			explicit CryptoError(const std::string &what) : std::runtime_error(what) { }
		};

		// Raw 32 byte digest
		std::string Sha256(const std::string &data);
		std::string Sha256(const void *data, size_t length);

		std::string Base64Encode(const std::string &data);
		std::string Base64Decode(const std::string &text);

		// RFC 4648 url alphabet without padding, as used by JWT segments
		std::string Base64UrlEncode(const std::string &data);
		std::string Base64UrlDecode(const std::string &text);

		// NIST P-384 key. A key parsed from a peer's public key can verify and serve as the
		// peer in key agreement but cannot sign.
		class KeyPair
		{
		public:
			KeyPair() : m_key(nullptr), m_private(false) { }
			~KeyPair();
			KeyPair(KeyPair &&o) noexcept;
			KeyPair& operator=(KeyPair &&o) noexcept;
			KeyPair(const KeyPair &) = delete;
			KeyPair& operator=(const KeyPair &) = delete;

			static KeyPair Generate();
			static KeyPair FromPublicKeyDer(const std::string &der);
			static KeyPair FromPublicKeyBase64(const std::string &text);

			bool Valid() const { return m_key != nullptr; }
			bool HasPrivateKey() const { return m_private; }

			// SubjectPublicKeyInfo DER, the form carried in JWT x5u headers
			std::string PublicKeyDer() const;
			std::string PublicKeyBase64() const;

			// ECDH with the peer's public key
			std::string DeriveSharedSecret(const KeyPair &peer) const;

			// ES384: ECDSA over SHA-384, signature as fixed width r || s
			std::string Sign(const std::string &data) const;
			bool Verify(const std::string &data, const std::string &signature) const;

			static constexpr size_t SignatureLength = 96;
		private:
			KeyPair(EVP_PKEY *key, bool has_private) : m_key(key), m_private(has_private) { }

			EVP_PKEY *m_key;
			bool m_private;
		};
	}
}
