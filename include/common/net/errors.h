#pragma once

#include <stdexcept>
#include <string>

namespace MCBE
{
	namespace Net
	{
		// Dial, read or write on the underlying transport failed
		class TransportError : public std::runtime_error
		{
		public:
			explicit TransportError(const std::string &what) : std::runtime_error(what) { }
		};

		// The peer broke the protocol: unexpected packet, out of order chunk, missing
		// resource pack, checksum mismatch, rejected login
		class ProtocolError : public std::runtime_error
		{
		public:
			explicit ProtocolError(const std::string &what) : std::runtime_error(what) { }
		};

		// Closed before the login sequence finished. Only thrown by Dial.
		class ConnectionTimeout : public std::runtime_error
		{
		public:
			explicit ConnectionTimeout(const std::string &what) : std::runtime_error(what) { }
		};

		// Read or write on a session that has been closed; what() holds the close reason
		class ConnectionClosed : public std::runtime_error
		{
		public:
			explicit ConnectionClosed(const std::string &what) : std::runtime_error(what) { }
		};

		enum AuthStage
		{
			AuthStageLiveToken,
			AuthStageXSTSToken,
			AuthStageMinecraftChain
		};

		class AuthError : public std::runtime_error
		{
		public:
			AuthError(AuthStage stage, const std::string &what) : std::runtime_error(what), m_stage(stage) { }

			AuthStage Stage() const { return m_stage; }
		private:
			AuthStage m_stage;
		};
	}
}
