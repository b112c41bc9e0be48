#pragma once

#include "client/client_data.h"
#include "common/crypto/crypto.h"
#include <string>
#include <vector>

namespace MCBE
{
	namespace Login
	{
		struct Request
		{
			std::vector<std::string> chain;
			std::string client_data_jwt;
		};

		// Connection request carried by the Login packet: int32 LE length + chain JSON, then
		// int32 LE length + client data JWT. An empty minecraft_chain produces a self signed
		// identity; otherwise the chain is prefixed with a token vouching for its first key.
		std::string EncodeRequest(const std::string &minecraft_chain, const ClientData &client_data,
			const IdentityData &identity, const Crypto::KeyPair &key);

		// Throws Crypto::CryptoError on malformed input
		Request DecodeRequest(const std::string &data);

		// Key from the x5u header of the client data token
		Crypto::KeyPair RequestPublicKey(const Request &request);

		// sha256(salt || ecdh secret)
		std::string DeriveSessionKey(const std::string &salt, const std::string &shared_secret);

		// Verifies the ServerToClientHandshake token and returns the 32 byte session key.
		// Throws Crypto::CryptoError when the token is malformed or its signature is invalid.
		std::string ParseServerHandshake(const std::string &jwt, const Crypto::KeyPair &client_key);

		std::string EncodeServerHandshake(const Crypto::KeyPair &server_key, const std::string &salt);
	}
}
