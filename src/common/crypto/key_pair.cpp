#include "common/crypto/crypto.h"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/x509.h>
#include <fmt/format.h>

namespace {
	std::string LastError()
	{
		char buffer[256] = { 0 };
		ERR_error_string_n(ERR_get_error(), buffer, sizeof(buffer));
		return buffer;
	}

	const size_t CoordinateLength = MCBE::Crypto::KeyPair::SignatureLength / 2;
}

MCBE::Crypto::KeyPair::~KeyPair()
{
	if (m_key) {
		EVP_PKEY_free(m_key);
	}
}

MCBE::Crypto::KeyPair::KeyPair(KeyPair &&o) noexcept
{
	m_key = o.m_key;
	m_private = o.m_private;
	o.m_key = nullptr;
	o.m_private = false;
}

MCBE::Crypto::KeyPair& MCBE::Crypto::KeyPair::operator=(KeyPair &&o) noexcept
{
	if (this != &o) {
		if (m_key) {
			EVP_PKEY_free(m_key);
		}
		m_key = o.m_key;
		m_private = o.m_private;
		o.m_key = nullptr;
		o.m_private = false;
	}
	return *this;
}

MCBE::Crypto::KeyPair MCBE::Crypto::KeyPair::Generate()
{
	EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
	if (!ctx) {
		throw CryptoError(fmt::format("key context: {}", LastError()));
	}

	EVP_PKEY *key = nullptr;
	if (EVP_PKEY_keygen_init(ctx) != 1 ||
		EVP_PKEY_CTX_set_ec_paramgen_curve_nid(ctx, NID_secp384r1) != 1 ||
		EVP_PKEY_keygen(ctx, &key) != 1) {
		EVP_PKEY_CTX_free(ctx);
		throw CryptoError(fmt::format("generate P-384 key: {}", LastError()));
	}

	EVP_PKEY_CTX_free(ctx);
	return KeyPair(key, true);
}

MCBE::Crypto::KeyPair MCBE::Crypto::KeyPair::FromPublicKeyDer(const std::string &der)
{
	auto data = reinterpret_cast<const unsigned char*>(der.data());
	EVP_PKEY *key = d2i_PUBKEY(nullptr, &data, static_cast<long>(der.length()));
	if (!key) {
		throw CryptoError(fmt::format("parse public key: {}", LastError()));
	}

	if (EVP_PKEY_base_id(key) != EVP_PKEY_EC) {
		EVP_PKEY_free(key);
		throw CryptoError("parse public key: not an elliptic curve key");
	}

	return KeyPair(key, false);
}

MCBE::Crypto::KeyPair MCBE::Crypto::KeyPair::FromPublicKeyBase64(const std::string &text)
{
	return FromPublicKeyDer(Base64Decode(text));
}

std::string MCBE::Crypto::KeyPair::PublicKeyDer() const
{
	if (!m_key) {
		throw CryptoError("public key of empty key pair");
	}

	int length = i2d_PUBKEY(m_key, nullptr);
	if (length <= 0) {
		throw CryptoError(fmt::format("encode public key: {}", LastError()));
	}

	std::string der(static_cast<size_t>(length), '\0');
	auto out = reinterpret_cast<unsigned char*>(&der[0]);
	i2d_PUBKEY(m_key, &out);
	return der;
}

std::string MCBE::Crypto::KeyPair::PublicKeyBase64() const
{
	return Base64Encode(PublicKeyDer());
}

std::string MCBE::Crypto::KeyPair::DeriveSharedSecret(const KeyPair &peer) const
{
	if (!m_private || !peer.m_key) {
		throw CryptoError("key agreement needs a private key and a peer public key");
	}

	EVP_PKEY_CTX *ctx = EVP_PKEY_CTX_new(m_key, nullptr);
	if (!ctx) {
		throw CryptoError(fmt::format("derive context: {}", LastError()));
	}

	size_t length = 0;
	if (EVP_PKEY_derive_init(ctx) != 1 ||
		EVP_PKEY_derive_set_peer(ctx, peer.m_key) != 1 ||
		EVP_PKEY_derive(ctx, nullptr, &length) != 1) {
		EVP_PKEY_CTX_free(ctx);
		throw CryptoError(fmt::format("derive shared secret: {}", LastError()));
	}

	std::string secret(length, '\0');
	if (EVP_PKEY_derive(ctx, reinterpret_cast<unsigned char*>(&secret[0]), &length) != 1) {
		EVP_PKEY_CTX_free(ctx);
		throw CryptoError(fmt::format("derive shared secret: {}", LastError()));
	}

	EVP_PKEY_CTX_free(ctx);
	secret.resize(length);
	return secret;
}

std::string MCBE::Crypto::KeyPair::Sign(const std::string &data) const
{
	if (!m_private) {
		throw CryptoError("signing needs a private key");
	}

	EVP_MD_CTX *ctx = EVP_MD_CTX_new();
	if (!ctx) {
		throw CryptoError(fmt::format("digest context: {}", LastError()));
	}

	size_t der_length = 0;
	if (EVP_DigestSignInit(ctx, nullptr, EVP_sha384(), nullptr, m_key) != 1 ||
		EVP_DigestSign(ctx, nullptr, &der_length, reinterpret_cast<const unsigned char*>(data.data()), data.length()) != 1) {
		EVP_MD_CTX_free(ctx);
		throw CryptoError(fmt::format("sign: {}", LastError()));
	}

	std::string der(der_length, '\0');
	if (EVP_DigestSign(ctx, reinterpret_cast<unsigned char*>(&der[0]), &der_length,
		reinterpret_cast<const unsigned char*>(data.data()), data.length()) != 1) {
		EVP_MD_CTX_free(ctx);
		throw CryptoError(fmt::format("sign: {}", LastError()));
	}
	EVP_MD_CTX_free(ctx);

	auto p = reinterpret_cast<const unsigned char*>(der.data());
	ECDSA_SIG *sig = d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(der_length));
	if (!sig) {
		throw CryptoError(fmt::format("decode signature: {}", LastError()));
	}

	const BIGNUM *r = nullptr;
	const BIGNUM *s = nullptr;
	ECDSA_SIG_get0(sig, &r, &s);

	std::string raw(SignatureLength, '\0');
	auto out = reinterpret_cast<unsigned char*>(&raw[0]);
	BN_bn2binpad(r, out, CoordinateLength);
	BN_bn2binpad(s, out + CoordinateLength, CoordinateLength);
	ECDSA_SIG_free(sig);

	return raw;
}

bool MCBE::Crypto::KeyPair::Verify(const std::string &data, const std::string &signature) const
{
	if (!m_key || signature.length() != SignatureLength) {
		return false;
	}

	auto raw = reinterpret_cast<const unsigned char*>(signature.data());
	ECDSA_SIG *sig = ECDSA_SIG_new();
	BIGNUM *r = BN_bin2bn(raw, CoordinateLength, nullptr);
	BIGNUM *s = BN_bin2bn(raw + CoordinateLength, CoordinateLength, nullptr);
	if (!sig || !r || !s || ECDSA_SIG_set0(sig, r, s) != 1) {
		BN_free(r);
		BN_free(s);
		ECDSA_SIG_free(sig);
		throw CryptoError(fmt::format("encode signature: {}", LastError()));
	}

	unsigned char *der = nullptr;
	int der_length = i2d_ECDSA_SIG(sig, &der);
	ECDSA_SIG_free(sig);
	if (der_length <= 0) {
		throw CryptoError(fmt::format("encode signature: {}", LastError()));
	}

	EVP_MD_CTX *ctx = EVP_MD_CTX_new();
	bool valid = ctx &&
		EVP_DigestVerifyInit(ctx, nullptr, EVP_sha384(), nullptr, m_key) == 1 &&
		EVP_DigestVerify(ctx, der, static_cast<size_t>(der_length),
			reinterpret_cast<const unsigned char*>(data.data()), data.length()) == 1;

	EVP_MD_CTX_free(ctx);
	OPENSSL_free(der);
	ERR_clear_error();
	return valid;
}
