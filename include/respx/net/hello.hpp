#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace respx {

	// Server address. Kept apart from Hello so background connections can
	// reuse both.
	struct Address {
		std::string host = "127.0.0.1";
		uint16_t port = 6379;

		std::string to_string() const { return host + ":" + std::to_string(port); }
	};

	// Greeting sent once right after connect:
	//   HELLO <3|2> [AUTH <user> <pass>] SETNAME <name>\r\n
	// Construction throws std::invalid_argument for a field that is not a token.
	class Hello {
	public:
		static constexpr const char* kDefaultClientName = "respx-cli";
		static constexpr const char* kDefaultUser = "default";

		static Hello no_auth(std::string client_name = kDefaultClientName, int protocol = 3);
		static Hello with_password(std::string username, std::string password,
			std::string client_name = kDefaultClientName, int protocol = 3);

		// True for a non-empty word with no whitespace or control bytes, the
		// only shape the inline greeting can carry for a name, user or password.
		static bool is_token(std::string_view s);

		// Literal inline command, CRLF-terminated.
		std::string encode() const;

		const std::optional<std::string>& username() const { return username_; }
		const std::optional<std::string>& password() const { return password_; }
		const std::string& client_name() const { return client_name_; }
		int protocol() const { return protocol_; }

	private:
		Hello(std::optional<std::string> user, std::optional<std::string> pass, std::string name, int protocol);

		std::optional<std::string> username_;
		std::optional<std::string> password_;
		std::string client_name_;
		int protocol_;
	};

} // namespace respx
