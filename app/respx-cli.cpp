#include <respx/cli/command_docs.hpp>
#include <respx/net/connection.hpp>
#include <respx/proto/command_line.hpp>
#include <respx/util/config.hpp>
#include <respx/util/logger.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <string>

using namespace respx;

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

static void print_reply(const RespValue& v) {
    if (v.is_error()) std::cout << "(error) " << v.str() << "\n";
    else std::cout << render(v) << "\n";
}

static void print_help(const CommandDocs& docs, const std::vector<std::string>& args) {
    if (args.size() < 2) {
        std::cout << "help <command>   show the summary and arguments of a command\n"
                  << "quit | exit      leave\n";
        return;
    }
    if (auto doc = docs.lookup(args[1])) {
        std::cout << args[1] << " - " << format_hint(*doc) << "\n";
    }
    else if (!docs.ready()) {
        std::cout << "(docs still loading)\n";
    }
    else {
        std::cout << "(no documentation for " << args[1] << ")\n";
    }
}

int main(int argc, char** argv) {
    CliConfig cfg;
    try {
        cfg = parse_args(argc, argv);
    }
    catch (const ConfigError& e) {
        std::cerr << "respx-cli: " << e.what() << "\n" << usage();
        return 2;
    }
    if (cfg.show_help) {
        std::cout << usage();
        return 0;
    }
    Logger::set_level(cfg.log_level);

    Connection conn(cfg.connection_options());
    try {
        RespValue greeting = conn.connect(cfg.address, cfg.hello());
        std::cout << "Connected to " << cfg.address.to_string() << "\n";
        std::cout << render(greeting) << "\n";
    }
    catch (const HandshakeRejected& e) {
        std::cerr << "(error) " << e.server_text() << "\n";
        return 1;
    }
    catch (const Error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    // background docs use their own connection; never block the prompt
    CommandDocs docs;
    if (cfg.docs) {
        ConnectionOptions opts = cfg.connection_options();
        if (opts.read_timeout.count() == 0) {
            opts.connect_timeout = opts.read_timeout = opts.write_timeout = std::chrono::seconds(5);
        }
        docs.start(cfg.address, cfg.hello(), opts);
    }

    const std::string prompt = cfg.address.to_string() + "> ";
    for (;;) {
        std::cout << prompt << std::flush;
        std::string line;
        if (!std::getline(std::cin, line)) break;

        auto args = tokenize(line);
        if (args.empty()) continue;
        std::string cmd = lower(args[0]);
        if (cmd == "quit" || cmd == "exit") break;
        if (cmd == "help") {
            print_help(docs, args);
            continue;
        }

        try {
            print_reply(conn.send(command_from_args(args)));
        }
        catch (const Error& e) {
            // fatal for this connection; the caller decides whether to reconnect
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
        catch (const std::length_error& e) {
            std::cerr << "(error) command too large: " << e.what() << "\n";
        }
    }

    conn.close();
    return 0;
}
