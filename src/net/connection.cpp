#include <respx/net/connection.hpp>
#include <respx/proto/command_line.hpp>
#include <respx/util/logger.hpp>
#include <stdexcept>

using asio::ip::tcp;

namespace respx {

    const char* state_name(Connection::State s) {
        switch (s) {
        case Connection::State::Unconnected: return "unconnected";
        case Connection::State::Connected:   return "connected";
        case Connection::State::Closed:      return "closed";
        }
        return "unknown";
    }

    Connection::Connection(ConnectionOptions opts)
        : opts_(opts)
        , io_()
        , socket_(io_)
        , stream_(io_, socket_, opts_.read_timeout, opts_.write_timeout)
        , buf_(opts_.buffer_capacity) {}

    Connection::~Connection() { close(); }

    void Connection::close() {
        if (socket_.is_open()) {
            asio::error_code ec;
            socket_.shutdown(tcp::socket::shutdown_both, ec);
            socket_.close(ec);
            if (ec) RESPX_LOG_DEBUG("close " << peer_ << ": " << ec.message());
        }
        if (state_ != State::Closed && state_ != State::Unconnected) {
            RESPX_LOG_INFO("connection to " << peer_ << " closed");
        }
        state_ = State::Closed;
    }

    void Connection::require_connected() const {
        if (state_ != State::Connected) {
            throw std::logic_error(std::string("send on a connection that is ") + state_name(state_));
        }
    }

    RespValue Connection::connect(const Address& addr, const Hello& hello) {
        if (state_ != State::Unconnected) {
            throw std::logic_error(std::string("connect on a connection that is ") + state_name(state_));
        }
        peer_ = addr.to_string();

        try {
            asio::error_code ec;
            tcp::resolver res(io_);
            auto eps = res.resolve(addr.host, std::to_string(addr.port), ec);
            if (ec) throw IoError("resolve " + addr.host, ec);

            stream_.connect(eps, opts_.connect_timeout, ec);
            if (ec) throw IoError("connect " + peer_, ec);

            socket_.set_option(tcp::no_delay(opts_.no_delay), ec);
            if (ec) throw IoError("set TCP_NODELAY", ec);
            socket_.set_option(asio::socket_base::keep_alive(opts_.keep_alive), ec);
            if (ec) throw IoError("set SO_KEEPALIVE", ec);
            RESPX_LOG_INFO("connected to " << peer_);

            // fixed literal command, not array-encoded
            buf_.put_slice(hello.encode());
            flush();

            RespValue reply = read_reply();
            if (reply.is_error()) throw HandshakeRejected(reply.str());
            state_ = State::Connected;
            RESPX_LOG_DEBUG("handshake with " << peer_ << " done (RESP" << hello.protocol() << ")");
            return reply;
        }
        catch (const Error& e) {
            RESPX_LOG_ERROR(e.what());
            close();
            throw;
        }
    }

    RespValue Connection::send(std::string_view command_text) {
        return send(command_from_line(command_text));
    }

    RespValue Connection::send(const RespValue& command) {
        require_connected();
        if (command.is(RespType::Array) && command.elements().empty()) {
            throw std::invalid_argument("empty command");
        }

        try {
            if (buf_.has_remaining()) {
                // no pipelining: anything left over means replies and requests are out of step
                throw ProtocolError(std::to_string(buf_.remaining()) + " unsolicited bytes before request");
            }
            // argument errors here (wrong shape, too large) leave the buffer untouched
            resp::encode(command, buf_);
            flush();
            return read_reply();
        }
        catch (const Error& e) {
            RESPX_LOG_ERROR(peer_ << ": " << e.what());
            close();
            throw;
        }
    }

    void Connection::flush() {
        std::size_t n = buf_.remaining();
        buf_.drain_to(stream_);
        RESPX_LOG_DEBUG("-> " << n << " bytes to " << peer_);
    }

    RespValue Connection::read_reply() {
        for (;;) {
            DecodeOutcome out = resp::decode(buf_, opts_.max_depth);
            if (out.complete()) {
                if (!buf_.has_remaining()) buf_.compact();
                return std::move(*out.value);
            }
            if (out.malformed()) throw ProtocolError(out.error);

            buf_.compact();
            if (buf_.writable() == 0) {
                throw ProtocolError("frame exceeds buffer capacity of " + std::to_string(buf_.capacity()) + " bytes");
            }
            std::size_t n = buf_.fill_from(stream_);
            if (n == 0) throw ConnectionClosed();
            RESPX_LOG_DEBUG("<- " << n << " bytes from " << peer_);
        }
    }

} // namespace respx
