#include <respx/buf/stream_buffer.hpp>
#include <cassert>
#include <cstring>
#include <stdexcept>

namespace respx {

    StreamBuffer::StreamBuffer(std::size_t capacity) : data_(capacity) {}

    void StreamBuffer::reset() {
        if (mark_) {
            read_pos_ = *mark_;
            mark_.reset();
        }
    }

    unsigned char StreamBuffer::take_byte() {
        assert(has_remaining());
        return static_cast<unsigned char>(data_[read_pos_++]);
    }

    std::string_view StreamBuffer::take_slice(std::size_t len) {
        assert(remaining_at_least(len));
        std::string_view v{ data_.data() + read_pos_, len };
        read_pos_ += len;
        return v;
    }

    std::optional<std::string_view> StreamBuffer::take_until(std::string_view delim) {
        mark();
        const std::size_t start = read_pos_;
        std::size_t matched = 0;

        while (has_remaining() && matched < delim.size()) {
            char c = data_[read_pos_++];
            if (c == delim[matched]) {
                ++matched;
            }
            else {
                // "\r\r\n": the mismatching byte may itself open the delimiter
                matched = (c == delim[0]) ? 1 : 0;
            }
        }

        if (matched != delim.size()) {
            reset();
            return std::nullopt;
        }

        mark_.reset();
        return std::string_view{ data_.data() + start, read_pos_ - start - delim.size() };
    }

    void StreamBuffer::put_byte(unsigned char b) {
        if (writable() < 1) throw std::length_error("stream buffer full");
        data_[write_pos_++] = static_cast<char>(b);
    }

    void StreamBuffer::put_slice(std::string_view bytes) {
        if (writable() < bytes.size()) throw std::length_error("stream buffer full");
        if (!bytes.empty()) std::memcpy(data_.data() + write_pos_, bytes.data(), bytes.size());
        write_pos_ += bytes.size();
    }

    void StreamBuffer::compact() {
        if (read_pos_ == write_pos_) {
            read_pos_ = 0;
            write_pos_ = 0;
        }
        else if (read_pos_ > 0) {
            std::size_t n = write_pos_ - read_pos_;
            std::memmove(data_.data(), data_.data() + read_pos_, n);
            write_pos_ = n;
            read_pos_ = 0;
        }
        // a mark taken before the shift no longer points at the same byte
        mark_.reset();
    }

    void StreamBuffer::rewind(std::size_t pos) {
        if (pos > read_pos_) throw std::logic_error("rewind past read position");
        read_pos_ = pos;
    }

} // namespace respx
