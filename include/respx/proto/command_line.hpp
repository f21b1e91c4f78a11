#pragma once
#include <respx/proto/resp_value.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace respx {

	// Splits on runs of ASCII whitespace. No quoting or escapes: an argument
	// containing a space cannot be expressed on one line.
	std::vector<std::string> tokenize(std::string_view line);

	// "set hello world" -> Array[Bulk("set"), Bulk("hello"), Bulk("world")]
	RespValue command_from_line(std::string_view line);

	// Array of BulkStrings from already separated arguments.
	RespValue command_from_args(const std::vector<std::string>& args);

} // namespace respx
