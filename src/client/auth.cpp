#include "client/auth.h"
#include "common/net/errors.h"
#include "common/logging.h"
#include <fmt/format.h>

std::string MCBE::AuthChain(AuthProvider &provider, const std::string &email, const std::string &password, const Crypto::KeyPair &key)
{
	std::string live_token;
	try {
		live_token = provider.RequestLiveToken(email, password);
	}
	catch (std::exception &ex) {
		throw Net::AuthError(Net::AuthStageLiveToken, fmt::format("error obtaining Live token: {}", ex.what()));
	}
	LOG_DEBUG(MOD_AUTH, "Obtained Live token for {}", email);

	std::string xsts;
	try {
		xsts = provider.RequestXSTSToken(live_token);
	}
	catch (std::exception &ex) {
		throw Net::AuthError(Net::AuthStageXSTSToken, fmt::format("error obtaining XSTS token: {}", ex.what()));
	}
	LOG_DEBUG(MOD_AUTH, "Obtained XSTS token");

	std::string chain;
	try {
		chain = provider.RequestMinecraftChain(xsts, key);
	}
	catch (std::exception &ex) {
		throw Net::AuthError(Net::AuthStageMinecraftChain, fmt::format("error obtaining Minecraft auth chain: {}", ex.what()));
	}

	if (chain.empty()) {
		throw Net::AuthError(Net::AuthStageMinecraftChain, "error obtaining Minecraft auth chain: empty chain");
	}

	LOG_INFO(MOD_AUTH, "Authenticated {} ({} byte chain)", email, chain.length());
	return chain;
}
