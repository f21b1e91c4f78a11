#pragma once
#include <asio.hpp>
#include <chrono>
#include <cstddef>

namespace respx {

	// Blocking read_some/write_some over a tcp socket with per-call deadlines.
	//
	// Each call starts one async operation and drives the private io_context
	// until it completes or the deadline passes; on expiry the operation is
	// cancelled and the call reports asio::error::timed_out. A zero timeout
	// waits forever. Satisfies SyncReadStream/SyncWriteStream, so it plugs
	// into StreamBuffer::fill_from/drain_to and asio::write.
	class TimedStream {
	public:
		TimedStream(asio::io_context& io, asio::ip::tcp::socket& sock,
			std::chrono::milliseconds read_timeout, std::chrono::milliseconds write_timeout)
			: io_(io), socket_(sock), read_timeout_(read_timeout), write_timeout_(write_timeout) {}

		template <class MutableBufferSequence>
		std::size_t read_some(const MutableBufferSequence& buffers, asio::error_code& ec) {
			std::size_t n = 0;
			socket_.async_read_some(buffers, [&](const asio::error_code& e, std::size_t k) {
				ec = e; n = k;
				});
			run(read_timeout_, ec);
			return n;
		}

		template <class ConstBufferSequence>
		std::size_t write_some(const ConstBufferSequence& buffers, asio::error_code& ec) {
			std::size_t n = 0;
			socket_.async_write_some(buffers, [&](const asio::error_code& e, std::size_t k) {
				ec = e; n = k;
				});
			run(write_timeout_, ec);
			return n;
		}

		template <class EndpointSequence>
		void connect(const EndpointSequence& endpoints, std::chrono::milliseconds timeout, asio::error_code& ec) {
			asio::async_connect(socket_, endpoints, [&](const asio::error_code& e, const asio::ip::tcp::endpoint&) {
				ec = e;
				});
			run(timeout, ec);
		}

	private:
		void run(std::chrono::milliseconds timeout, asio::error_code& ec) {
			io_.restart();
			if (timeout.count() <= 0) {
				io_.run();
				return;
			}
			io_.run_for(timeout);
			if (!io_.stopped()) {
				// deadline hit with the operation still pending
				asio::error_code ignored;
				socket_.cancel(ignored);
				io_.run();
				if (ec == asio::error::operation_aborted) ec = asio::error::timed_out;
			}
		}

		asio::io_context& io_;
		asio::ip::tcp::socket& socket_;
		std::chrono::milliseconds read_timeout_;
		std::chrono::milliseconds write_timeout_;
	};

} // namespace respx
