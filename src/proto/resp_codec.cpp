#include <respx/proto/resp_codec.hpp>
#include <limits>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace respx::resp {

    // ---------- helpers
    static inline unsigned long long parse_ull(std::string_view s, bool& ok) {
        ok = true;
        if (s.empty()) { ok = false; return 0; }
        unsigned long long v = 0;
        for (char c : s) {
            if (c < '0' || c > '9') { ok = false; return 0; }
            unsigned long long d = static_cast<unsigned long long>(c - '0');
            if (v > (std::numeric_limits<unsigned long long>::max() - d) / 10) { ok = false; return 0; }
            v = v * 10 + d;
        }
        return v;
    }

    static inline long long parse_ll(std::string_view s, bool& ok) {
        bool neg = !s.empty() && (s[0] == '-' || s[0] == '+');
        bool minus = neg && s[0] == '-';
        unsigned long long mag = parse_ull(neg ? s.substr(1) : s, ok);
        if (!ok) return 0;
        constexpr auto max = static_cast<unsigned long long>(std::numeric_limits<long long>::max());
        if (minus) {
            if (mag > max + 1) { ok = false; return 0; }
            return mag == max + 1 ? std::numeric_limits<long long>::min() : -static_cast<long long>(mag);
        }
        if (mag > max) { ok = false; return 0; }
        return static_cast<long long>(mag);
    }

    static std::string printable(unsigned char c) {
        if (c >= 0x20 && c < 0x7f) return std::string("'") + static_cast<char>(c) + "'";
        static const char* hex = "0123456789abcdef";
        return std::string("0x") + hex[c >> 4] + hex[c & 0xf];
    }

    // One step of the decoder: either a finished leaf value, or the header of
    // an aggregate whose children still have to be read.
    struct Item {
        RespValue value;
        bool aggregate = false;
        std::size_t children = 0;
    };

    static bool crlf_next(StreamBuffer& buf) {
        return buf.take_byte() == '\r' && buf.take_byte() == '\n';
    }

    static DecodeStatus parse_item(StreamBuffer& buf, Item& out, std::string& err) {
        if (!buf.has_remaining()) return DecodeStatus::Incomplete;

        unsigned char tag = buf.take_byte();
        switch (tag) {
        case '+':
        case '-': {
            auto line = buf.take_until(kTerminator);
            if (!line) return DecodeStatus::Incomplete;
            std::string text(*line);
            out.value = tag == '+' ? RespValue::simple_string(std::move(text))
                                   : RespValue::simple_error(std::move(text));
            return DecodeStatus::Complete;
        }
        case '$':
        case '!': {
            auto line = buf.take_until(kTerminator);
            if (!line) return DecodeStatus::Incomplete;
            if (tag == '$' && *line == "-1") {      // RESP2 null bulk string
                out.value = RespValue::null();
                return DecodeStatus::Complete;
            }
            bool ok = false;
            unsigned long long len = parse_ull(*line, ok);
            if (!ok || len > std::numeric_limits<std::size_t>::max() - kTerminatorLen) {
                err = "bad bulk length '" + std::string(*line) + "'";
                return DecodeStatus::Malformed;
            }
            auto n = static_cast<std::size_t>(len);
            if (!buf.remaining_at_least(n + kTerminatorLen)) return DecodeStatus::Incomplete;
            std::string payload(buf.take_slice(n));
            if (!crlf_next(buf)) {
                err = "bulk payload not terminated by CRLF";
                return DecodeStatus::Malformed;
            }
            out.value = tag == '$' ? RespValue::bulk_string(std::move(payload))
                                   : RespValue::bulk_error(std::move(payload));
            return DecodeStatus::Complete;
        }
        case ':': {
            auto line = buf.take_until(kTerminator);
            if (!line) return DecodeStatus::Incomplete;
            bool ok = false;
            long long v = parse_ll(*line, ok);
            if (!ok) {
                err = "bad integer '" + std::string(*line) + "'";
                return DecodeStatus::Malformed;
            }
            out.value = RespValue::integer(v);
            return DecodeStatus::Complete;
        }
        case '#': {
            if (!buf.remaining_at_least(1 + kTerminatorLen)) return DecodeStatus::Incomplete;
            unsigned char flag = buf.take_byte();
            if (flag != 't' && flag != 'f') {
                err = "bad boolean flag " + printable(flag);
                return DecodeStatus::Malformed;
            }
            if (!crlf_next(buf)) {
                err = "boolean not terminated by CRLF";
                return DecodeStatus::Malformed;
            }
            out.value = RespValue::boolean(flag == 't');
            return DecodeStatus::Complete;
        }
        case '_': {
            if (!buf.remaining_at_least(kTerminatorLen)) return DecodeStatus::Incomplete;
            if (!crlf_next(buf)) {
                err = "null not terminated by CRLF";
                return DecodeStatus::Malformed;
            }
            out.value = RespValue::null();
            return DecodeStatus::Complete;
        }
        case '*':
        case '%':
        case '~': {
            auto line = buf.take_until(kTerminator);
            if (!line) return DecodeStatus::Incomplete;
            if (tag == '*' && *line == "-1") {      // RESP2 null array
                out.value = RespValue::null();
                return DecodeStatus::Complete;
            }
            bool ok = false;
            unsigned long long count = parse_ull(*line, ok);
            std::size_t per = tag == '%' ? 2 : 1;
            if (!ok || count > std::numeric_limits<std::size_t>::max() / per) {
                err = "bad aggregate count '" + std::string(*line) + "'";
                return DecodeStatus::Malformed;
            }
            out.value = tag == '*' ? RespValue::array()
                      : tag == '%' ? RespValue::map()
                                   : RespValue::set();
            out.aggregate = true;
            out.children = static_cast<std::size_t>(count) * per;
            return DecodeStatus::Complete;
        }
        default:
            err = "unknown type byte " + printable(tag);
            return DecodeStatus::Malformed;
        }
    }

    // Pending aggregate on the work stack.
    struct Frame {
        RespValue value;
        std::size_t remaining;
    };

    static DecodeOutcome malformed(std::string reason) {
        DecodeOutcome r;
        r.status = DecodeStatus::Malformed;
        r.error = std::move(reason);
        return r;
    }

    DecodeOutcome decode(StreamBuffer& buf, std::size_t max_depth) {
        const std::size_t start = buf.read_pos();
        std::vector<Frame> stack;

        for (;;) {
            Item item;
            std::string err;
            DecodeStatus st = parse_item(buf, item, err);
            if (st == DecodeStatus::Incomplete) {
                // partial aggregates are never returned: restart from the first tag byte
                buf.rewind(start);
                return DecodeOutcome{};
            }
            if (st == DecodeStatus::Malformed) return malformed(std::move(err));

            if (item.aggregate && item.children > 0) {
                if (stack.size() >= max_depth) {
                    return malformed("aggregate nesting deeper than " + std::to_string(max_depth));
                }
                stack.push_back(Frame{ std::move(item.value), item.children });
                continue;
            }

            RespValue done = std::move(item.value);
            for (;;) {
                if (stack.empty()) {
                    DecodeOutcome r;
                    r.status = DecodeStatus::Complete;
                    r.value = std::move(done);
                    return r;
                }
                Frame& top = stack.back();
                top.value.push_back(std::move(done));
                if (--top.remaining > 0) break;
                done = std::move(top.value);
                stack.pop_back();
            }
        }
    }

    // ---------- encode
    static std::size_t bulk_size(const RespValue& v) {
        if (!v.is(RespType::BulkString)) {
            throw std::invalid_argument(std::string("cannot encode ") + type_name(v.type()) + " as a command argument");
        }
        return 1 + std::to_string(v.str().size()).size() + kTerminatorLen + v.str().size() + kTerminatorLen;
    }

    static std::size_t encoded_size(const RespValue& v) {
        if (!v.is(RespType::Array)) return bulk_size(v);
        std::size_t n = 1 + std::to_string(v.elements().size()).size() + kTerminatorLen;
        for (auto& e : v.elements()) n += bulk_size(e);
        return n;
    }

    static void put_bulk(const RespValue& v, StreamBuffer& buf) {
        buf.put_byte('$');
        buf.put_slice(std::to_string(v.str().size()));
        buf.put_slice(kTerminator);
        buf.put_slice(v.str());
        buf.put_slice(kTerminator);
    }

    void encode(const RespValue& v, StreamBuffer& buf) {
        // validate and size up front so a rejected value writes nothing
        if (encoded_size(v) > buf.writable()) throw std::length_error("encoded command exceeds buffer space");

        if (!v.is(RespType::Array)) {
            put_bulk(v, buf);
            return;
        }
        buf.put_byte('*');
        buf.put_slice(std::to_string(v.elements().size()));
        buf.put_slice(kTerminator);
        for (auto& e : v.elements()) put_bulk(e, buf);
    }

} // namespace respx::resp
