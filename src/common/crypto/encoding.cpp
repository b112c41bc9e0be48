#include "common/crypto/crypto.h"
#include <openssl/evp.h>
#include <algorithm>
#include <fmt/format.h>

std::string MCBE::Crypto::Sha256(const std::string &data)
{
	return Sha256(data.data(), data.length());
}

std::string MCBE::Crypto::Sha256(const void *data, size_t length)
{
	unsigned char digest[EVP_MAX_MD_SIZE];
	unsigned int digest_length = 0;

	if (EVP_Digest(data, length, digest, &digest_length, EVP_sha256(), nullptr) != 1) {
		throw CryptoError("sha256 digest failed");
	}

	return std::string(reinterpret_cast<char*>(digest), digest_length);
}

std::string MCBE::Crypto::Base64Encode(const std::string &data)
{
	if (data.empty()) {
		return std::string();
	}

	std::string out(4 * ((data.length() + 2) / 3) + 1, '\0');
	int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
		reinterpret_cast<const unsigned char*>(data.data()), static_cast<int>(data.length()));
	out.resize(written);
	return out;
}

std::string MCBE::Crypto::Base64Decode(const std::string &text)
{
	std::string input = text;
	input.erase(std::remove_if(input.begin(), input.end(), [](char c) { return c == '\n' || c == '\r'; }), input.end());
	if (input.empty()) {
		return std::string();
	}

	while (input.length() % 4 != 0) {
		input.push_back('=');
	}

	size_t padding = 0;
	if (input[input.length() - 1] == '=') {
		padding++;
		if (input[input.length() - 2] == '=') {
			padding++;
		}
	}

	std::string out(3 * input.length() / 4, '\0');
	int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
		reinterpret_cast<const unsigned char*>(input.data()), static_cast<int>(input.length()));
	if (written < 0) {
		throw CryptoError(fmt::format("invalid base64 input of {} bytes", text.length()));
	}

	out.resize(static_cast<size_t>(written) - padding);
	return out;
}

std::string MCBE::Crypto::Base64UrlEncode(const std::string &data)
{
	auto out = Base64Encode(data);
	for (auto &c : out) {
		if (c == '+') {
			c = '-';
		}
		else if (c == '/') {
			c = '_';
		}
	}

	while (!out.empty() && out.back() == '=') {
		out.pop_back();
	}

	return out;
}

std::string MCBE::Crypto::Base64UrlDecode(const std::string &text)
{
	std::string input = text;
	for (auto &c : input) {
		if (c == '-') {
			c = '+';
		}
		else if (c == '_') {
			c = '/';
		}
	}

	return Base64Decode(input);
}
