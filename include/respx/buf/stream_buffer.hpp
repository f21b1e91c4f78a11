#pragma once
#include <asio.hpp>
#include <respx/net/errors.hpp>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace respx {

	// Fixed-capacity byte buffer with independent read/write cursors.
	//
	//   0 <= read_pos <= write_pos <= capacity
	//
	// [read_pos, write_pos) is unread data. Capacity never changes; it is the
	// ceiling on a single encoded value.
	class StreamBuffer {
	public:
		static constexpr std::size_t kDefaultCapacity = 4 * 1024 * 1024;

		explicit StreamBuffer(std::size_t capacity = kDefaultCapacity);

		StreamBuffer(const StreamBuffer&) = delete;
		StreamBuffer& operator=(const StreamBuffer&) = delete;
		StreamBuffer(StreamBuffer&&) = delete;
		StreamBuffer& operator=(StreamBuffer&&) = delete;

		// One read_some into [write_pos, capacity). Returns bytes read, 0 on EOF.
		template <class SyncReadStream>
		std::size_t fill_from(SyncReadStream& source);

		// Writes all of [read_pos, write_pos) then compacts.
		template <class SyncWriteStream>
		void drain_to(SyncWriteStream& sink);

		void mark() { mark_ = read_pos_; }
		void reset();

		// Unchecked: caller verifies availability first.
		unsigned char take_byte();
		std::string_view take_slice(std::size_t len);

		// Bytes before `delim`, delimiter consumed. nullopt means the delimiter
		// was not complete yet and read_pos is back where the scan began.
		std::optional<std::string_view> take_until(std::string_view delim);

		void put_byte(unsigned char b);
		void put_slice(std::string_view bytes);

		bool has_remaining() const { return read_pos_ < write_pos_; }
		bool remaining_at_least(std::size_t n) const { return write_pos_ - read_pos_ >= n; }
		std::size_t remaining() const { return write_pos_ - read_pos_; }
		std::size_t writable() const { return data_.size() - write_pos_; }

		void compact();

		// Restores read_pos to a snapshot taken earlier with read_pos().
		void rewind(std::size_t pos);

		std::string_view readable() const { return { data_.data() + read_pos_, remaining() }; }
		std::size_t read_pos() const { return read_pos_; }
		std::size_t write_pos() const { return write_pos_; }
		std::size_t capacity() const { return data_.size(); }
		bool has_mark() const { return mark_.has_value(); }

	private:
		std::vector<char> data_;
		std::size_t read_pos_ = 0;
		std::size_t write_pos_ = 0;
		std::optional<std::size_t> mark_;
	};

	template <class SyncReadStream>
	std::size_t StreamBuffer::fill_from(SyncReadStream& source) {
		if (writable() == 0) return 0;
		asio::error_code ec;
		std::size_t n = source.read_some(asio::buffer(data_.data() + write_pos_, writable()), ec);
		if (ec == asio::error::eof) return 0;
		if (ec) throw IoError("read failed", ec);
		write_pos_ += n;
		return n;
	}

	template <class SyncWriteStream>
	void StreamBuffer::drain_to(SyncWriteStream& sink) {
		asio::error_code ec;
		std::size_t want = remaining();
		std::size_t n = asio::write(sink, asio::buffer(data_.data() + read_pos_, want), ec);
		if (ec) throw IoError("write failed", ec);
		if (n != want) throw IoError("short write", asio::error::make_error_code(asio::error::broken_pipe));
		read_pos_ = write_pos_;
		compact();
	}

} // namespace respx
