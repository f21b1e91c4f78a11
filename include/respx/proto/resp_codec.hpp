#pragma once
#include <respx/buf/stream_buffer.hpp>
#include <respx/proto/resp_value.hpp>
#include <cstddef>
#include <optional>
#include <string>

namespace respx {

	enum class DecodeStatus { Complete, Incomplete, Malformed };

	// Result of trying to decode one value from a StreamBuffer.
	//   Complete   -> value present, read_pos moved past the frame
	//   Incomplete -> need more bytes; read_pos unchanged
	//   Malformed  -> error non-empty; buffer state unspecified
	struct DecodeOutcome {
		DecodeStatus status = DecodeStatus::Incomplete;
		std::optional<RespValue> value;
		std::string error;

		bool complete() const { return status == DecodeStatus::Complete; }
		bool incomplete() const { return status == DecodeStatus::Incomplete; }
		bool malformed() const { return status == DecodeStatus::Malformed; }
	};

	namespace resp {

		inline constexpr char kTerminator[] = "\r\n";
		inline constexpr std::size_t kTerminatorLen = 2;
		inline constexpr std::size_t kDefaultMaxDepth = 512;

		// Decodes exactly one value from the unread region of `buf`.
		// Aggregates deeper than `max_depth` are reported as Malformed.
		DecodeOutcome decode(StreamBuffer& buf, std::size_t max_depth = kDefaultMaxDepth);

		// Appends the wire form of a BulkString or an Array of BulkStrings.
		// Any other shape throws std::invalid_argument; a value that does not
		// fit the free space throws std::length_error.
		void encode(const RespValue& v, StreamBuffer& buf);

	} // namespace resp

} // namespace respx
