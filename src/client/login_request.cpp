#include "client/login_request.h"
#include "common/crypto/jwt.h"
#include "common/logging.h"
#include <chrono>
#include <fmt/format.h>

namespace {
	const int64_t TokenLifetimeSeconds = 6 * 60 * 60;

	int64_t UnixNow()
	{
		return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
	}

	void PutLittleEndian32(std::string &out, uint32_t v)
	{
		for (int i = 0; i < 4; ++i) {
			out.push_back(static_cast<char>((v >> (8 * i)) & 0xff));
		}
	}

	std::string ReadLittleEndianString(const std::string &data, size_t &offset)
	{
		if (offset + 4 > data.length()) {
			throw MCBE::Crypto::CryptoError("login request truncated in length prefix");
		}

		uint32_t length = 0;
		for (int i = 0; i < 4; ++i) {
			length |= static_cast<uint32_t>(static_cast<uint8_t>(data[offset + i])) << (8 * i);
		}
		offset += 4;

		if (length > data.length() - offset) {
			throw MCBE::Crypto::CryptoError(fmt::format("login request field of {} bytes exceeds remaining {}", length, data.length() - offset));
		}

		auto v = data.substr(offset, length);
		offset += length;
		return v;
	}
}

std::string MCBE::Login::EncodeRequest(const std::string &minecraft_chain, const ClientData &client_data,
	const IdentityData &identity, const Crypto::KeyPair &key)
{
	auto now = UnixNow();
	Json::Value chain(Json::arrayValue);

	if (minecraft_chain.empty()) {
		Json::Value claims;
		claims["extraData"]["XUID"] = identity.xuid;
		claims["extraData"]["identity"] = identity.identity;
		claims["extraData"]["displayName"] = identity.display_name;
		claims["identityPublicKey"] = key.PublicKeyBase64();
		claims["nbf"] = static_cast<Json::Int64>(now - 60);
		claims["exp"] = static_cast<Json::Int64>(now + TokenLifetimeSeconds);

		chain.append(Crypto::SignJwt(claims, key));
	}
	else {
		auto minecraft = Crypto::ParseJson(minecraft_chain);
		if (!minecraft["chain"].isArray() || minecraft["chain"].empty()) {
			throw Crypto::CryptoError("minecraft chain has no tokens");
		}

		auto first = Crypto::ParseJwt(minecraft["chain"][0].asString());

		Json::Value claims;
		claims["certificateAuthority"] = true;
		claims["identityPublicKey"] = first.header["x5u"];
		claims["nbf"] = static_cast<Json::Int64>(now - 60);
		claims["exp"] = static_cast<Json::Int64>(now + TokenLifetimeSeconds);

		chain.append(Crypto::SignJwt(claims, key));
		for (auto &token : minecraft["chain"]) {
			chain.append(token);
		}
	}

	Json::Value chain_doc;
	chain_doc["chain"] = chain;

	auto chain_json = Crypto::WriteCompactJson(chain_doc);
	auto client_jwt = Crypto::SignJwt(client_data.ToJson(), key);

	std::string out;
	PutLittleEndian32(out, static_cast<uint32_t>(chain_json.length()));
	out.append(chain_json);
	PutLittleEndian32(out, static_cast<uint32_t>(client_jwt.length()));
	out.append(client_jwt);

	LOG_DEBUG(MOD_LOGIN, "Encoded login request with {} chain tokens, {} bytes", chain.size(), out.length());
	return out;
}

MCBE::Login::Request MCBE::Login::DecodeRequest(const std::string &data)
{
	size_t offset = 0;
	auto chain_json = ReadLittleEndianString(data, offset);
	auto client_jwt = ReadLittleEndianString(data, offset);

	auto doc = Crypto::ParseJson(chain_json);
	if (!doc["chain"].isArray()) {
		throw Crypto::CryptoError("login request chain is not an array");
	}

	Request request;
	for (auto &token : doc["chain"]) {
		request.chain.push_back(token.asString());
	}
	request.client_data_jwt = client_jwt;
	return request;
}

MCBE::Crypto::KeyPair MCBE::Login::RequestPublicKey(const Request &request)
{
	return Crypto::JwtSigner(Crypto::ParseJwt(request.client_data_jwt));
}

std::string MCBE::Login::DeriveSessionKey(const std::string &salt, const std::string &shared_secret)
{
	return Crypto::Sha256(salt + shared_secret);
}

std::string MCBE::Login::ParseServerHandshake(const std::string &jwt, const Crypto::KeyPair &client_key)
{
	auto token = Crypto::ParseJwt(jwt);
	auto server_key = Crypto::JwtSigner(token);

	if (!Crypto::VerifyJwt(token, server_key)) {
		throw Crypto::CryptoError("server handshake signature is invalid");
	}

	if (!token.payload["salt"].isString()) {
		throw Crypto::CryptoError("server handshake has no salt");
	}

	auto salt = Crypto::Base64Decode(token.payload["salt"].asString());
	LOG_DEBUG(MOD_CRYPTO, "Server handshake salt of {} bytes", salt.length());

	return DeriveSessionKey(salt, client_key.DeriveSharedSecret(server_key));
}

std::string MCBE::Login::EncodeServerHandshake(const Crypto::KeyPair &server_key, const std::string &salt)
{
	Json::Value claims;
	claims["salt"] = Crypto::Base64Encode(salt);
	return Crypto::SignJwt(claims, server_key);
}
