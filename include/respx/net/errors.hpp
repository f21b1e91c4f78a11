#pragma once
#include <stdexcept>
#include <string>
#include <system_error>

namespace respx {

	// Base for every failure that makes a Connection unusable.
	class Error : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Transport failure: reset, broken pipe, timeout, refused connect.
	class IoError : public Error {
	public:
		IoError(const std::string& what, std::error_code ec)
			: Error(what + ": " + ec.message()), code_(ec) {}

		const std::error_code& code() const noexcept { return code_; }

	private:
		std::error_code code_;
	};

	// Peer closed the stream while a reply was still expected.
	class ConnectionClosed : public Error {
	public:
		ConnectionClosed() : Error("connection closed by peer") {}
	};

	// Bytes on the wire violate the RESP grammar.
	class ProtocolError : public Error {
	public:
		explicit ProtocolError(const std::string& reason)
			: Error("protocol error: " + reason) {}
	};

	// Server answered the HELLO greeting with an error reply.
	class HandshakeRejected : public Error {
	public:
		explicit HandshakeRejected(std::string server_text)
			: Error("handshake rejected: " + server_text), server_text_(std::move(server_text)) {}

		const std::string& server_text() const noexcept { return server_text_; }

	private:
		std::string server_text_;
	};

} // namespace respx
