#include "common/net/transport.h"
#include "common/net/stream_transport.h"
#include "common/net/errors.h"
#include <fmt/format.h>

namespace {
	// Splits "host:port" and "[v6 host]:port"
	void SplitHostPort(const std::string &address, std::string &host, int &port)
	{
		auto colon = address.rfind(':');
		if (colon == std::string::npos || colon + 1 >= address.length()) {
			throw MCBE::Net::TransportError(fmt::format("address {}: missing port", address));
		}

		host = address.substr(0, colon);
		if (host.length() >= 2 && host.front() == '[' && host.back() == ']') {
			host = host.substr(1, host.length() - 2);
		}

		try {
			port = std::stoi(address.substr(colon + 1));
		}
		catch (const std::logic_error &) {
			throw MCBE::Net::TransportError(fmt::format("address {}: invalid port", address));
		}

		if (port <= 0 || port > 65535) {
			throw MCBE::Net::TransportError(fmt::format("address {}: invalid port", address));
		}
	}
}

std::unique_ptr<MCBE::Net::Transport> MCBE::Net::DialTransport(const std::string &network, const std::string &address)
{
	int family;
	if (network == "tcp") {
		family = AF_UNSPEC;
	}
	else if (network == "tcp4") {
		family = AF_INET;
	}
	else if (network == "tcp6") {
		family = AF_INET6;
	}
	else {
		throw TransportError(fmt::format("dial {} {}: no transport registered for network", network, address));
	}

	std::string host;
	int port = 0;
	SplitHostPort(address, host, port);

	std::unique_ptr<StreamTransport> transport(new StreamTransport());
	transport->Connect(host, port, family);
	return std::unique_ptr<Transport>(transport.release());
}
