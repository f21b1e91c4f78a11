#include <respx/proto/resp_value.hpp>
#include <ostream>
#include <sstream>
#include <stdexcept>

namespace respx {

    const char* type_name(RespType t) {
        switch (t) {
        case RespType::SimpleString: return "simple-string";
        case RespType::BulkString:   return "bulk-string";
        case RespType::Integer:      return "integer";
        case RespType::Boolean:      return "boolean";
        case RespType::Null:         return "null";
        case RespType::SimpleError:  return "simple-error";
        case RespType::BulkError:    return "bulk-error";
        case RespType::Array:        return "array";
        case RespType::Map:          return "map";
        case RespType::Set:          return "set";
        }
        return "unknown";
    }

    // ---------- factories
    RespValue RespValue::simple_string(std::string s) {
        RespValue v(RespType::SimpleString); v.text_ = std::move(s); return v;
    }
    RespValue RespValue::bulk_string(std::string s) {
        RespValue v(RespType::BulkString); v.text_ = std::move(s); return v;
    }
    RespValue RespValue::integer(long long i) {
        RespValue v(RespType::Integer); v.int_ = i; return v;
    }
    RespValue RespValue::boolean(bool b) {
        RespValue v(RespType::Boolean); v.int_ = b ? 1 : 0; return v;
    }
    RespValue RespValue::null() { return RespValue(RespType::Null); }
    RespValue RespValue::simple_error(std::string s) {
        RespValue v(RespType::SimpleError); v.text_ = std::move(s); return v;
    }
    RespValue RespValue::bulk_error(std::string s) {
        RespValue v(RespType::BulkError); v.text_ = std::move(s); return v;
    }
    RespValue RespValue::array(std::vector<RespValue> items) {
        RespValue v(RespType::Array); v.elems_ = std::move(items); return v;
    }
    RespValue RespValue::set(std::vector<RespValue> items) {
        RespValue v(RespType::Set); v.elems_ = std::move(items); return v;
    }
    RespValue RespValue::map(std::vector<RespValue> flat_kv) {
        if (flat_kv.size() % 2 != 0) throw std::invalid_argument("map needs key/value pairs");
        RespValue v(RespType::Map); v.elems_ = std::move(flat_kv); return v;
    }

    bool operator==(const RespValue& a, const RespValue& b) {
        return a.type_ == b.type_ && a.text_ == b.text_ && a.int_ == b.int_ && a.elems_ == b.elems_;
    }

    // ---------- rendering
    static void indent(std::ostringstream& o, int depth) {
        for (int i = 0; i < depth; ++i) o << "  ";
    }

    static bool nested_block(const RespValue& v) {
        return v.is_aggregate() && !v.elements().empty();
    }

    static void render_into(std::ostringstream& o, const RespValue& v, int depth);

    static void render_scalar(std::ostringstream& o, const RespValue& v) {
        switch (v.type()) {
        case RespType::Integer: o << v.integer(); break;
        case RespType::Boolean: o << (v.boolean() ? "true" : "false"); break;
        case RespType::Null:    o << "nil"; break;
        case RespType::Array:   o << "[]"; break;
        case RespType::Set:     o << "#{}"; break;
        case RespType::Map:     o << "{}"; break;
        default:                o << v.str(); break;
        }
    }

    static void render_into(std::ostringstream& o, const RespValue& v, int depth) {
        if (!nested_block(v)) {
            indent(o, depth);
            render_scalar(o, v);
            return;
        }

        if (v.is(RespType::Map)) {
            for (std::size_t i = 0; i < v.map_size(); ++i) {
                if (i) o << '\n';
                const RespValue& key = v.key(i);
                if (nested_block(key)) {
                    // aggregate key: its block one level in, then ':' on its own line
                    render_into(o, key, depth + 1);
                    o << '\n';
                    indent(o, depth);
                }
                else {
                    indent(o, depth);
                    render_scalar(o, key);
                }
                o << ':';
                const RespValue& val = v.value(i);
                if (nested_block(val)) {
                    o << '\n';
                    render_into(o, val, depth + 1);
                }
                else {
                    o << ' ';
                    render_scalar(o, val);
                }
            }
            return;
        }

        const auto& items = v.elements();
        for (std::size_t i = 0; i < items.size(); ++i) {
            if (i) o << '\n';
            render_into(o, items[i], nested_block(items[i]) ? depth + 1 : depth);
        }
    }

    std::string render(const RespValue& v) {
        std::ostringstream o;
        render_into(o, v, 0);
        return o.str();
    }

    std::ostream& operator<<(std::ostream& os, const RespValue& v) {
        return os << render(v);
    }

} // namespace respx
