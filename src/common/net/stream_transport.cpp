#include "common/net/stream_transport.h"
#include "common/net/errors.h"
#include "common/logging.h"
#include <cstring>
#include <fmt/format.h>

namespace {
	struct WriteRequest
	{
		uv_write_t req;
		std::string data;
	};

	std::string FormatAddress(const sockaddr_storage &addr)
	{
		char name[64] = { 0 };
		if (addr.ss_family == AF_INET6) {
			auto in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
			uv_ip6_name(in6, name, sizeof(name));
			return fmt::format("[{}]:{}", name, ntohs(in6->sin6_port));
		}

		auto in4 = reinterpret_cast<const sockaddr_in*>(&addr);
		uv_ip4_name(in4, name, sizeof(name));
		return fmt::format("{}:{}", name, ntohs(in4->sin_port));
	}
}

MCBE::Net::StreamTransport::StreamTransport()
{
	memset(&m_loop, 0, sizeof(uv_loop_t));
	memset(&m_socket, 0, sizeof(uv_tcp_t));
	memset(&m_wakeup, 0, sizeof(uv_async_t));
	m_loop_initialized = false;
	m_close_requested = false;
	m_closed = false;
	m_handles_closed = true;
}

MCBE::Net::StreamTransport::~StreamTransport()
{
	Close();

	if (m_thread.joinable()) {
		m_thread.join();
	}

	if (m_loop_initialized) {
		uv_loop_close(&m_loop);
	}
}

void MCBE::Net::StreamTransport::Connect(const std::string &host, int port, int family)
{
	int rc = uv_loop_init(&m_loop);
	if (rc < 0) {
		throw TransportError(fmt::format("dial tcp {}:{}: {}", host, port, uv_strerror(rc)));
	}
	m_loop_initialized = true;

	addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = family;
	hints.ai_socktype = SOCK_STREAM;

	uv_getaddrinfo_t resolver;
	auto service = std::to_string(port);
	rc = uv_getaddrinfo(&m_loop, &resolver, nullptr, host.c_str(), service.c_str(), &hints);
	if (rc < 0) {
		throw TransportError(fmt::format("dial tcp {}:{}: lookup failed: {}", host, port, uv_strerror(rc)));
	}

	uv_tcp_init(&m_loop, &m_socket);
	uv_async_init(&m_loop, &m_wakeup, [](uv_async_t *handle) {
		static_cast<StreamTransport*>(handle->data)->ProcessWakeup();
	});
	m_socket.data = this;
	m_wakeup.data = this;
	m_handles_closed = false;

	struct ConnectState
	{
		bool done = false;
		int status = 0;
	} state;

	uv_connect_t connect_req;
	connect_req.data = &state;
	rc = uv_tcp_connect(&connect_req, &m_socket, resolver.addrinfo->ai_addr, [](uv_connect_t *req, int status) {
		auto s = static_cast<ConnectState*>(req->data);
		s->done = true;
		s->status = status;
	});
	uv_freeaddrinfo(resolver.addrinfo);

	if (rc < 0) {
		state.done = true;
		state.status = rc;
	}

	while (!state.done) {
		uv_run(&m_loop, UV_RUN_ONCE);
	}

	if (state.status < 0) {
		CloseHandles();
		uv_run(&m_loop, UV_RUN_DEFAULT);
		uv_loop_close(&m_loop);
		m_loop_initialized = false;
		throw TransportError(fmt::format("dial tcp {}:{}: {}", host, port, uv_strerror(state.status)));
	}

	sockaddr_storage addr;
	int namelen = sizeof(addr);
	if (uv_tcp_getsockname(&m_socket, reinterpret_cast<sockaddr*>(&addr), &namelen) == 0) {
		m_local_address = FormatAddress(addr);
	}
	namelen = sizeof(addr);
	if (uv_tcp_getpeername(&m_socket, reinterpret_cast<sockaddr*>(&addr), &namelen) == 0) {
		m_remote_address = FormatAddress(addr);
	}

	uv_read_start(reinterpret_cast<uv_stream_t*>(&m_socket),
		[](uv_handle_t *handle, size_t suggested_size, uv_buf_t *buf) {
			auto self = static_cast<StreamTransport*>(handle->data);
			buf->base = self->m_read_chunk.data();
			buf->len = self->m_read_chunk.size();
		},
		[](uv_stream_t *stream, ssize_t nread, const uv_buf_t *buf) {
			static_cast<StreamTransport*>(stream->data)->ProcessRead(nread);
		});

	LOG_DEBUG(MOD_NET, "Stream transport connected {} -> {}", m_local_address, m_remote_address);

	m_thread = std::thread(&StreamTransport::Run, this);
}

void MCBE::Net::StreamTransport::Run()
{
	uv_run(&m_loop, UV_RUN_DEFAULT);
	LOG_TRACE(MOD_NET, "Stream transport loop for {} exited", m_remote_address);
}

void MCBE::Net::StreamTransport::Send(const Packet &frame)
{
	DynamicPacket out;
	auto prefix = out.PutVarUInt32(0, static_cast<uint32_t>(frame.Length()));
	out.PutPacket(prefix, frame);

	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_closed || m_handles_closed) {
		throw TransportError(fmt::format("write {}: {}", m_remote_address, m_error.empty() ? "use of closed connection" : m_error));
	}

	m_outgoing.push_back(out.Bytes());
	uv_async_send(&m_wakeup);
}

bool MCBE::Net::StreamTransport::Receive(DynamicPacket &frame)
{
	std::unique_lock<std::mutex> lock(m_mutex);
	m_cond.wait(lock, [this] { return !m_frames.empty() || m_closed; });

	if (!m_frames.empty()) {
		frame = std::move(m_frames.front());
		m_frames.pop_front();
		return true;
	}

	if (!m_error.empty() && !m_close_requested) {
		throw TransportError(fmt::format("read {}: {}", m_remote_address, m_error));
	}

	return false;
}

void MCBE::Net::StreamTransport::Close()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (!m_close_requested) {
			m_close_requested = true;
			m_closed = true;
			if (m_loop_initialized && !m_handles_closed) {
				uv_async_send(&m_wakeup);
			}
		}
	}
	m_cond.notify_all();

	if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
		m_thread.join();
	}
}

void MCBE::Net::StreamTransport::ProcessWakeup()
{
	std::deque<std::string> outgoing;
	bool close_requested;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		outgoing.swap(m_outgoing);
		close_requested = m_close_requested;
	}

	for (auto &data : outgoing) {
		auto req = new WriteRequest;
		req->data = std::move(data);
		req->req.data = req;

		uv_buf_t buf = uv_buf_init(&req->data[0], static_cast<unsigned int>(req->data.length()));
		int rc = uv_write(&req->req, reinterpret_cast<uv_stream_t*>(&m_socket), &buf, 1, [](uv_write_t *write_req, int status) {
			auto r = static_cast<WriteRequest*>(write_req->data);
			if (status < 0 && status != UV_ECANCELED) {
				auto self = static_cast<StreamTransport*>(write_req->handle->data);
				LOG_ERROR(MOD_NET, "Stream write to {} failed: {}", self->m_remote_address, uv_strerror(status));
				self->Finish(uv_strerror(status));
				self->CloseHandles();
			}
			delete r;
		});

		if (rc < 0) {
			delete req;
			Finish(uv_strerror(rc));
			CloseHandles();
			return;
		}
	}

	if (close_requested) {
		CloseHandles();
	}
}

void MCBE::Net::StreamTransport::ProcessRead(ssize_t nread)
{
	if (nread == 0) {
		return;
	}

	if (nread < 0) {
		if (nread == UV_EOF) {
			LOG_DEBUG(MOD_NET, "Stream transport {} closed by peer", m_remote_address);
			Finish("");
		}
		else {
			Finish(uv_strerror(static_cast<int>(nread)));
		}
		CloseHandles();
		return;
	}

	m_read_buffer.append(m_read_chunk.data(), static_cast<size_t>(nread));
	ExtractFrames();
}

void MCBE::Net::StreamTransport::ExtractFrames()
{
	size_t consumed = 0;
	std::deque<DynamicPacket> frames;

	while (consumed < m_read_buffer.length()) {
		uint32_t length = 0;
		size_t prefix = 0;
		bool complete = false;

		for (size_t i = 0; i < 5 && consumed + i < m_read_buffer.length(); ++i) {
			auto b = static_cast<uint8_t>(m_read_buffer[consumed + i]);
			length |= static_cast<uint32_t>(b & 0x7f) << (7 * i);
			if ((b & 0x80) == 0) {
				prefix = i + 1;
				complete = true;
				break;
			}
		}

		if (!complete) {
			if (m_read_buffer.length() - consumed >= 5) {
				Finish("malformed frame length");
				CloseHandles();
				return;
			}
			break;
		}

		if (length > MaxFrameSize) {
			Finish(fmt::format("frame of {} bytes exceeds limit", length));
			CloseHandles();
			return;
		}

		if (m_read_buffer.length() - consumed - prefix < length) {
			break;
		}

		frames.emplace_back(m_read_buffer.data() + consumed + prefix, length);
		consumed += prefix + length;
	}

	m_read_buffer.erase(0, consumed);

	if (!frames.empty()) {
		{
			std::lock_guard<std::mutex> lock(m_mutex);
			for (auto &f : frames) {
				m_frames.push_back(std::move(f));
			}
		}
		m_cond.notify_all();
	}
}

void MCBE::Net::StreamTransport::CloseHandles()
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_handles_closed) {
			return;
		}
		m_handles_closed = true;
	}

	if (!uv_is_closing(reinterpret_cast<uv_handle_t*>(&m_socket))) {
		uv_read_stop(reinterpret_cast<uv_stream_t*>(&m_socket));
		uv_close(reinterpret_cast<uv_handle_t*>(&m_socket), nullptr);
	}

	if (!uv_is_closing(reinterpret_cast<uv_handle_t*>(&m_wakeup))) {
		uv_close(reinterpret_cast<uv_handle_t*>(&m_wakeup), nullptr);
	}
}

void MCBE::Net::StreamTransport::Finish(const std::string &error)
{
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_closed = true;
		if (!error.empty() && m_error.empty()) {
			m_error = error;
		}
	}
	m_cond.notify_all();
}
