#pragma once
#include <respx/net/connection.hpp>
#include <respx/net/hello.hpp>
#include <respx/util/logger.hpp>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace respx {

	class ConfigError : public std::runtime_error {
	public:
		using std::runtime_error::runtime_error;
	};

	// Settings for respx-cli. Sources, lowest precedence first: defaults,
	// --config file, command-line flags.
	struct CliConfig {
		Address address;
		std::optional<std::string> user;
		std::optional<std::string> password;
		std::string client_name = Hello::kDefaultClientName;
		int protocol = 3;
		std::size_t buffer_size = StreamBuffer::kDefaultCapacity;
		long long timeout_ms = 0;   // 0 = block until the OS gives up
		Logger::Level log_level = Logger::Level::Warn;
		bool docs = true;
		bool show_help = false;

		Hello hello() const;
		ConnectionOptions connection_options() const;
	};

	// Parse command-line arguments. Accepts flags and the positional form
	// `host [port [password]]`.
	CliConfig parse_args(int argc, const char* const argv[]);

	// Apply `key = value` lines from a file onto `cfg`.
	void load_config_file(const std::string& path, CliConfig& cfg);

	const char* usage();

} // namespace respx
