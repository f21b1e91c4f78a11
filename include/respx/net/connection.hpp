#pragma once
#include <asio.hpp>
#include <respx/buf/stream_buffer.hpp>
#include <respx/net/errors.hpp>
#include <respx/net/hello.hpp>
#include <respx/net/timed_stream.hpp>
#include <respx/proto/resp_codec.hpp>
#include <respx/proto/resp_value.hpp>
#include <chrono>
#include <cstddef>
#include <string>
#include <string_view>

namespace respx {

	struct ConnectionOptions {
		std::size_t buffer_capacity = StreamBuffer::kDefaultCapacity;
		std::chrono::milliseconds connect_timeout{ 0 };
		std::chrono::milliseconds read_timeout{ 0 };
		std::chrono::milliseconds write_timeout{ 0 };
		bool no_delay = true;
		bool keep_alive = true;
		std::size_t max_depth = resp::kDefaultMaxDepth;
	};

	// One blocking RESP connection: one socket, one StreamBuffer, one caller.
	//
	//   Unconnected --connect()--> Connected --error/close()--> Closed
	//
	// Requests are strictly sequential (write, then read exactly one reply).
	// IoError, ConnectionClosed and ProtocolError move the connection to
	// Closed; the caller reconnects with a new Connection.
	class Connection {
	public:
		enum class State { Unconnected, Connected, Closed };

		explicit Connection(ConnectionOptions opts = {});
		~Connection();

		Connection(const Connection&) = delete;
		Connection& operator=(const Connection&) = delete;

		// Opens the socket and performs the HELLO exchange. Returns the
		// server's handshake reply. Throws HandshakeRejected on an error reply.
		RespValue connect(const Address& addr, const Hello& hello);

		// Whitespace-split command text; no quoting.
		RespValue send(std::string_view command_text);
		// Pre-built Array of BulkStrings.
		RespValue send(const RespValue& command);

		void close();

		State state() const { return state_; }
		bool is_connected() const { return state_ == State::Connected; }
		const std::string& peer() const { return peer_; }

	private:
		RespValue read_reply();
		void flush();
		void require_connected() const;

		ConnectionOptions opts_;
		asio::io_context io_;
		asio::ip::tcp::socket socket_;
		TimedStream stream_;
		StreamBuffer buf_;
		State state_ = State::Unconnected;
		std::string peer_;
	};

	const char* state_name(Connection::State s);

} // namespace respx
