#pragma once

#include "common/net/transport.h"
#include <uv.h>
#include <array>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace MCBE
{
	namespace Net
	{
		// TCP transport driven by a private libuv loop on its own thread. Frames travel with a
		// varuint32 length prefix since a stream keeps no message boundaries.
		class StreamTransport : public Transport
		{
		public:
			StreamTransport();
			~StreamTransport();

			// AF_UNSPEC, AF_INET or AF_INET6; throws TransportError
			void Connect(const std::string &host, int port, int family);

			void Send(const Packet &frame) override;
			bool Receive(DynamicPacket &frame) override;
			void Close() override;

			std::string LocalAddress() const override { return m_local_address; }
			std::string RemoteAddress() const override { return m_remote_address; }

			static constexpr size_t MaxFrameSize = 32 * 1024 * 1024;
		private:
			void Run();
			void ProcessWakeup();
			void ProcessRead(ssize_t nread);
			void ExtractFrames();
			void CloseHandles();
			void Finish(const std::string &error);

			uv_loop_t m_loop;
			uv_tcp_t m_socket;
			uv_async_t m_wakeup;
			bool m_loop_initialized;
			std::thread m_thread;

			std::mutex m_mutex;
			std::condition_variable m_cond;
			std::deque<DynamicPacket> m_frames;
			std::deque<std::string> m_outgoing;
			bool m_close_requested;
			bool m_closed;
			bool m_handles_closed;
			std::string m_error;

			// loop thread only
			std::array<char, 65536> m_read_chunk;
			std::string m_read_buffer;

			std::string m_local_address;
			std::string m_remote_address;
		};
	}
}
