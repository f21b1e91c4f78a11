#include <respx/util/config.hpp>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <limits>
#include <vector>

namespace respx {

    static std::string trim(const std::string& s) {
        std::size_t b = 0, e = s.size();
        while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
        return s.substr(b, e - b);
    }

    static std::string lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    static long long to_number(const std::string& what, const std::string& s, long long lo, long long hi) {
        long long v = 0;
        std::size_t used = 0;
        try { v = std::stoll(s, &used); }
        catch (const std::exception&) { throw ConfigError(what + ": '" + s + "' is not a number"); }
        if (used != s.size()) throw ConfigError(what + ": '" + s + "' is not a number");
        if (v < lo || v > hi) {
            throw ConfigError(what + ": " + s + " out of range [" + std::to_string(lo) + ", " + std::to_string(hi) + "]");
        }
        return v;
    }

    static bool to_bool(const std::string& what, const std::string& s) {
        std::string v = lower(s);
        if (v == "yes" || v == "true" || v == "on" || v == "1") return true;
        if (v == "no" || v == "false" || v == "off" || v == "0") return false;
        throw ConfigError(what + ": '" + s + "' is not a boolean");
    }

    static Logger::Level to_level(const std::string& what, const std::string& s) {
        auto l = Logger::parse_level(lower(s));
        if (!l) throw ConfigError(what + ": unknown log level '" + s + "'");
        return *l;
    }

    static std::string to_token(const std::string& what, const std::string& s) {
        if (!Hello::is_token(s)) throw ConfigError(what + ": must be one non-empty word without spaces");
        return s;
    }

    // Shared by the flag parser and the config file.
    static void apply(CliConfig& cfg, const std::string& key, const std::string& value) {
        if (key == "host") cfg.address.host = value;
        else if (key == "port") cfg.address.port = static_cast<uint16_t>(to_number(key, value, 1, 65535));
        else if (key == "user") cfg.user = to_token(key, value);
        else if (key == "password") cfg.password = to_token(key, value);
        else if (key == "name") cfg.client_name = to_token(key, value);
        else if (key == "protocol") cfg.protocol = static_cast<int>(to_number(key, value, 2, 3));
        else if (key == "buffer_size") {
            cfg.buffer_size = static_cast<std::size_t>(to_number(key, value, 1024, std::numeric_limits<int>::max()));
        }
        else if (key == "timeout_ms") cfg.timeout_ms = to_number(key, value, 0, 24LL * 3600 * 1000);
        else if (key == "log_level") cfg.log_level = to_level(key, value);
        else if (key == "docs") cfg.docs = to_bool(key, value);
        else throw ConfigError("unknown setting '" + key + "'");
    }

    Hello CliConfig::hello() const {
        if (password) return Hello::with_password(user.value_or(Hello::kDefaultUser), *password, client_name, protocol);
        return Hello::no_auth(client_name, protocol);
    }

    ConnectionOptions CliConfig::connection_options() const {
        ConnectionOptions o;
        o.buffer_capacity = buffer_size;
        o.connect_timeout = std::chrono::milliseconds(timeout_ms);
        o.read_timeout = std::chrono::milliseconds(timeout_ms);
        o.write_timeout = std::chrono::milliseconds(timeout_ms);
        return o;
    }

    CliConfig parse_args(int argc, const char* const argv[]) {
        CliConfig cfg;
        std::vector<std::string> positional;

        for (int i = 1; i < argc; ++i) {
            std::string a = argv[i];
            auto next = [&]() -> std::string {
                if (i + 1 >= argc) throw ConfigError(a + " needs a value");
                return argv[++i];
            };

            if (a == "-h" || a == "--host") apply(cfg, "host", next());
            else if (a == "-p" || a == "--port") apply(cfg, "port", next());
            else if (a == "-a" || a == "--pass") apply(cfg, "password", next());
            else if (a == "--user") apply(cfg, "user", next());
            else if (a == "--name") apply(cfg, "name", next());
            else if (a == "-2") cfg.protocol = 2;
            else if (a == "-3") cfg.protocol = 3;
            else if (a == "--buffer-size") apply(cfg, "buffer_size", next());
            else if (a == "--timeout") apply(cfg, "timeout_ms", next());
            else if (a == "--log-level") apply(cfg, "log_level", next());
            else if (a == "--verbose" || a == "-v") cfg.log_level = Logger::Level::Debug;
            else if (a == "--quiet" || a == "-q") cfg.log_level = Logger::Level::Error;
            else if (a == "--no-docs") cfg.docs = false;
            else if (a == "--config" || a == "-c") load_config_file(next(), cfg);
            else if (a == "-?" || a == "--help") cfg.show_help = true;
            else if (!a.empty() && a[0] == '-' && a.size() > 1) throw ConfigError("unknown option " + a);
            else positional.push_back(a);
        }

        // positional form: host [port [password]]
        if (positional.size() > 3) throw ConfigError("too many arguments");
        if (positional.size() > 0) apply(cfg, "host", positional[0]);
        if (positional.size() > 1) apply(cfg, "port", positional[1]);
        if (positional.size() > 2) apply(cfg, "password", positional[2]);

        return cfg;
    }

    void load_config_file(const std::string& path, CliConfig& cfg) {
        std::ifstream file(path);
        if (!file.is_open()) throw ConfigError("cannot open config file " + path);

        std::string line;
        int lineno = 0;
        while (std::getline(file, line)) {
            ++lineno;
            line = trim(line);
            if (line.empty() || line[0] == '#') continue;

            std::size_t eq = line.find('=');
            if (eq == std::string::npos) {
                throw ConfigError(path + ":" + std::to_string(lineno) + ": expected key = value");
            }
            try {
                apply(cfg, lower(trim(line.substr(0, eq))), trim(line.substr(eq + 1)));
            }
            catch (const ConfigError& e) {
                throw ConfigError(path + ":" + std::to_string(lineno) + ": " + e.what());
            }
        }
    }

    const char* usage() {
        return
            "Usage: respx-cli [options] [host [port [password]]]\n"
            "  -h, --host <host>        server host (default 127.0.0.1)\n"
            "  -p, --port <port>        server port (default 6379)\n"
            "  -a, --pass <password>    authenticate with AUTH in HELLO\n"
            "      --user <name>        ACL user (default \"default\")\n"
            "      --name <name>        client name sent with SETNAME\n"
            "  -2 | -3                  RESP protocol version (default 3)\n"
            "      --buffer-size <n>    receive buffer bytes (default 4194304)\n"
            "      --timeout <ms>       connect/read/write timeout, 0 = none\n"
            "      --log-level <lvl>    debug|info|warn|error|off\n"
            "  -v, --verbose            same as --log-level debug\n"
            "  -q, --quiet              same as --log-level error\n"
            "      --no-docs            do not fetch COMMAND DOCS in the background\n"
            "  -c, --config <file>      key = value settings file\n"
            "  -?, --help               show this help\n";
    }

} // namespace respx
