#pragma once
#include <respx/net/connection.hpp>
#include <respx/net/hello.hpp>
#include <respx/proto/resp_value.hpp>
#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace respx {

	struct ArgDoc {
		std::string name;
		std::string type = "string";
		bool optional = false;
	};

	struct CommandDoc {
		std::string summary;
		std::vector<ArgDoc> arguments;
	};

	using DocTable = std::unordered_map<std::string, CommandDoc>;

	// Builds a table from a COMMAND DOCS reply (RESP3 map or RESP2 flat
	// array). Keys are upper-cased command names.
	DocTable parse_command_docs(const RespValue& reply);

	// "summary - Arguments: <key> [EX]" or just the summary.
	std::string format_hint(const CommandDoc& doc);

	// Command documentation cache, filled once in the background.
	//
	// start() spawns a worker that opens its own Connection (the interactive
	// connection is never shared), sends COMMAND DOCS and stores the result.
	// lookup() only reads the table and never touches the network.
	class CommandDocs {
	public:
		CommandDocs() = default;
		~CommandDocs();

		CommandDocs(const CommandDocs&) = delete;
		CommandDocs& operator=(const CommandDocs&) = delete;

		void start(Address addr, Hello hello, ConnectionOptions opts);

		// Replaces the table, e.g. with docs parsed elsewhere.
		void populate(DocTable table);

		std::optional<CommandDoc> lookup(const std::string& command_name) const;

		bool ready() const { return ready_.load(); }
		std::size_t size() const;

	private:
		void fetch(const Address& addr, const Hello& hello, const ConnectionOptions& opts);

		mutable std::mutex mu_;
		DocTable table_;
		std::atomic<bool> ready_{ false };
		std::thread worker_;
	};

} // namespace respx
