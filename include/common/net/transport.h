#pragma once

#include "common/net/packet.h"
#include <functional>
#include <memory>
#include <string>

namespace MCBE
{
	namespace Net
	{
		// Frame oriented connection to a server. Send may be called from any thread;
		// Receive is only ever called by the connection's listener thread.
		class Transport
		{
		public:
			virtual ~Transport() { }

			// Throws TransportError when the frame cannot be written
			virtual void Send(const Packet &frame) = 0;

			// Blocks until a frame is available. Returns false once the transport was closed
			// cleanly, throws TransportError when it failed.
			virtual bool Receive(DynamicPacket &frame) = 0;

			// Idempotent; wakes a blocked Receive
			virtual void Close() = 0;

			virtual std::string LocalAddress() const = 0;
			virtual std::string RemoteAddress() const = 0;
		};

		typedef std::function<std::unique_ptr<Transport>(const std::string &network, const std::string &address)> TransportFactory;

		// Built in networks: "tcp", "tcp4", "tcp6". Anything else needs a TransportFactory.
		std::unique_ptr<Transport> DialTransport(const std::string &network, const std::string &address);
	}
}
