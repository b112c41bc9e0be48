#pragma once

#include "common/crypto/crypto.h"
#include <json/json.h>
#include <string>

namespace MCBE
{
	namespace Crypto
	{
		struct Jwt
		{
			Json::Value header;
			Json::Value payload;
			std::string signing_input;
			std::string signature;
		};

		// ES384 token whose header carries the signer's public key in "x5u"
		std::string SignJwt(const Json::Value &payload, const KeyPair &key);

		// Splits and decodes a token without checking its signature; throws CryptoError
		Jwt ParseJwt(const std::string &token);

		// Key named by the token's x5u header
		KeyPair JwtSigner(const Jwt &token);

		bool VerifyJwt(const Jwt &token, const KeyPair &key);

		std::string WriteCompactJson(const Json::Value &value);
		Json::Value ParseJson(const std::string &text);
	}
}
