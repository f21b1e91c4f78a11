#include <respx/net/hello.hpp>
#include <stdexcept>
#include <utility>

namespace respx {

    Hello::Hello(std::optional<std::string> user, std::optional<std::string> pass, std::string name, int protocol)
        : username_(std::move(user))
        , password_(std::move(pass))
        , client_name_(std::move(name))
        , protocol_(protocol) {
        if (protocol_ != 2 && protocol_ != 3) throw std::invalid_argument("protocol must be 2 or 3");
        if (!is_token(client_name_)) throw std::invalid_argument("client name must be one non-empty word");
        if (username_ && !is_token(*username_)) throw std::invalid_argument("username must be one non-empty word");
        if (password_ && !is_token(*password_)) throw std::invalid_argument("password must be one non-empty word");
    }

    bool Hello::is_token(std::string_view s) {
        if (s.empty()) return false;
        for (unsigned char c : s) {
            if (c <= ' ' || c == 0x7f) return false;
        }
        return true;
    }

    Hello Hello::no_auth(std::string client_name, int protocol) {
        return Hello(std::nullopt, std::nullopt, std::move(client_name), protocol);
    }

    Hello Hello::with_password(std::string username, std::string password, std::string client_name, int protocol) {
        if (username.empty()) username = kDefaultUser;
        return Hello(std::move(username), std::move(password), std::move(client_name), protocol);
    }

    std::string Hello::encode() const {
        std::string out = "HELLO " + std::to_string(protocol_);
        if (password_) {
            out += " AUTH ";
            out += username_.value_or(kDefaultUser);
            out += ' ';
            out += *password_;
        }
        out += " SETNAME ";
        out += client_name_;
        out += "\r\n";
        return out;
    }

} // namespace respx
