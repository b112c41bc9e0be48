#include "common/crypto/jwt.h"
#include <fmt/format.h>
#include <memory>

std::string MCBE::Crypto::WriteCompactJson(const Json::Value &value)
{
	Json::StreamWriterBuilder builder;
	builder["indentation"] = "";
	return Json::writeString(builder, value);
}

Json::Value MCBE::Crypto::ParseJson(const std::string &text)
{
	Json::CharReaderBuilder builder;
	std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

	Json::Value value;
	std::string errors;
	if (!reader->parse(text.data(), text.data() + text.length(), &value, &errors)) {
		throw CryptoError(fmt::format("invalid JSON: {}", errors));
	}

	return value;
}

std::string MCBE::Crypto::SignJwt(const Json::Value &payload, const KeyPair &key)
{
	Json::Value header;
	header["alg"] = "ES384";
	header["x5u"] = key.PublicKeyBase64();

	auto signing_input = Base64UrlEncode(WriteCompactJson(header)) + "." + Base64UrlEncode(WriteCompactJson(payload));
	return signing_input + "." + Base64UrlEncode(key.Sign(signing_input));
}

MCBE::Crypto::Jwt MCBE::Crypto::ParseJwt(const std::string &token)
{
	auto first = token.find('.');
	auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
	if (second == std::string::npos || token.find('.', second + 1) != std::string::npos) {
		throw CryptoError("malformed JWT: expected three segments");
	}

	Jwt jwt;
	jwt.header = ParseJson(Base64UrlDecode(token.substr(0, first)));
	jwt.payload = ParseJson(Base64UrlDecode(token.substr(first + 1, second - first - 1)));
	jwt.signing_input = token.substr(0, second);
	jwt.signature = Base64UrlDecode(token.substr(second + 1));

	if (!jwt.header.isObject() || !jwt.payload.isObject()) {
		throw CryptoError("malformed JWT: header and payload must be objects");
	}

	return jwt;
}

MCBE::Crypto::KeyPair MCBE::Crypto::JwtSigner(const Jwt &token)
{
	if (token.header["alg"].asString() != "ES384") {
		throw CryptoError(fmt::format("unsupported JWT algorithm '{}'", token.header["alg"].asString()));
	}

	if (!token.header["x5u"].isString()) {
		throw CryptoError("JWT header has no x5u key");
	}

	return KeyPair::FromPublicKeyBase64(token.header["x5u"].asString());
}

bool MCBE::Crypto::VerifyJwt(const Jwt &token, const KeyPair &key)
{
	return key.Verify(token.signing_input, token.signature);
}
