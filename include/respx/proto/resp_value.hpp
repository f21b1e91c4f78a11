#pragma once
#include <cstddef>
#include <iosfwd>
#include <string>
#include <utility>
#include <vector>

namespace respx {

	enum class RespType {
		SimpleString,   // +
		BulkString,     // $
		Integer,        // :
		Boolean,        // #
		Null,           // _
		SimpleError,    // -
		BulkError,      // !
		Array,          // *
		Map,            // %
		Set             // ~
	};

	const char* type_name(RespType t);

	// One decoded (or to-be-encoded) RESP value.
	//
	// Array and Set keep their children in elements(). Map keeps pairs
	// flattened as [key, value, key, value, ...] in server order; duplicate
	// keys are kept as sent.
	class RespValue {
	public:
		RespValue() = default;  // Null

		static RespValue simple_string(std::string s);
		static RespValue bulk_string(std::string s);
		static RespValue integer(long long v);
		static RespValue boolean(bool v);
		static RespValue null();
		static RespValue simple_error(std::string s);
		static RespValue bulk_error(std::string s);
		static RespValue array(std::vector<RespValue> items = {});
		static RespValue set(std::vector<RespValue> items = {});
		// flat_kv must hold an even number of values
		static RespValue map(std::vector<RespValue> flat_kv = {});

		RespType type() const { return type_; }
		bool is(RespType t) const { return type_ == t; }
		bool is_error() const { return type_ == RespType::SimpleError || type_ == RespType::BulkError; }
		bool is_null() const { return type_ == RespType::Null; }
		bool is_aggregate() const {
			return type_ == RespType::Array || type_ == RespType::Map || type_ == RespType::Set;
		}
		bool is_text() const {
			return type_ == RespType::SimpleString || type_ == RespType::BulkString || is_error();
		}

		// Payload of string and error variants; empty for everything else.
		const std::string& str() const { return text_; }
		long long integer() const { return int_; }
		bool boolean() const { return int_ != 0; }

		// Children of Array/Set, or the flattened pairs of a Map.
		const std::vector<RespValue>& elements() const { return elems_; }
		std::vector<RespValue>& elements() { return elems_; }

		std::size_t map_size() const { return elems_.size() / 2; }
		const RespValue& key(std::size_t i) const { return elems_.at(2 * i); }
		const RespValue& value(std::size_t i) const { return elems_.at(2 * i + 1); }

		// Appends a child to an aggregate (one value for Array/Set, one half of a pair for Map).
		void push_back(RespValue v) { elems_.push_back(std::move(v)); }

		friend bool operator==(const RespValue& a, const RespValue& b);
		friend bool operator!=(const RespValue& a, const RespValue& b) { return !(a == b); }

	private:
		explicit RespValue(RespType t) : type_(t) {}

		RespType type_ = RespType::Null;
		std::string text_;              // Simple/Bulk string, errors
		long long int_ = 0;             // Integer, Boolean (0/1)
		std::vector<RespValue> elems_;  // Array, Set, Map (flattened)
	};

	// Human-readable rendering for the presentation layer. Pure.
	std::string render(const RespValue& v);

	std::ostream& operator<<(std::ostream& os, const RespValue& v);

} // namespace respx
