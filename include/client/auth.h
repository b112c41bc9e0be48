#pragma once

#include "common/crypto/crypto.h"
#include <memory>
#include <string>

namespace MCBE
{
	// The three token exchanges behind an authenticated login. Implementations perform the
	// HTTP requests; each stage throws on rejection.
	class AuthProvider
	{
	public:
		virtual ~AuthProvider() { }

		virtual std::string RequestLiveToken(const std::string &email, const std::string &password) = 0;
		virtual std::string RequestXSTSToken(const std::string &live_token) = 0;
		// Returns the {"chain":[...]} document signed for key's public half
		virtual std::string RequestMinecraftChain(const std::string &xsts_token, const Crypto::KeyPair &key) = 0;
	};

	// Runs the exchanges in order. Any failure is rethrown as Net::AuthError naming the stage.
	std::string AuthChain(AuthProvider &provider, const std::string &email, const std::string &password, const Crypto::KeyPair &key);
}
