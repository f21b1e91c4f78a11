#include <respx/cli/command_docs.hpp>
#include <respx/util/logger.hpp>
#include <algorithm>
#include <cctype>
#include <utility>

namespace respx {

    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::toupper(c); });
        return s;
    }

    using Pairs = std::vector<std::pair<const RespValue*, const RespValue*>>;

    // RESP3 sends a Map; RESP2 sends the same pairs flattened into an Array.
    static std::optional<Pairs> pairs_of(const RespValue& v) {
        if (!v.is(RespType::Map) && !(v.is(RespType::Array) && v.elements().size() % 2 == 0)) {
            return std::nullopt;
        }
        Pairs out;
        const auto& e = v.elements();
        for (std::size_t i = 0; i + 1 < e.size(); i += 2) out.emplace_back(&e[i], &e[i + 1]);
        return out;
    }

    static std::string text_of(const RespValue& v) {
        if (v.is(RespType::SimpleString) || v.is(RespType::BulkString)) return v.str();
        return {};
    }

    static std::optional<ArgDoc> parse_argument(const RespValue& arg) {
        auto kv = pairs_of(arg);
        if (!kv) return std::nullopt;

        ArgDoc doc;
        for (auto& [k, val] : *kv) {
            std::string key = text_of(*k);
            if (key == "name") doc.name = text_of(*val);
            else if (key == "type") doc.type = text_of(*val);
            else if (key == "optional" && val->is(RespType::Boolean)) doc.optional = val->boolean();
            else if (key == "flags" && (val->is(RespType::Array) || val->is(RespType::Set))) {
                for (auto& f : val->elements()) {
                    if (text_of(f) == "optional") doc.optional = true;
                }
            }
        }
        if (doc.name.empty()) return std::nullopt;
        return doc;
    }

    static CommandDoc parse_doc(const RespValue& body) {
        CommandDoc doc;
        auto kv = pairs_of(body);
        if (!kv) return doc;

        for (auto& [k, val] : *kv) {
            std::string key = text_of(*k);
            if (key == "summary") doc.summary = text_of(*val);
            else if (key == "arguments" && val->is(RespType::Array)) {
                for (auto& a : val->elements()) {
                    if (auto arg = parse_argument(a)) doc.arguments.push_back(std::move(*arg));
                }
            }
        }
        return doc;
    }

    DocTable parse_command_docs(const RespValue& reply) {
        DocTable table;
        auto kv = pairs_of(reply);
        if (!kv) return table;

        for (auto& [name, body] : *kv) {
            std::string cmd = text_of(*name);
            if (cmd.empty()) continue;
            table[upper(cmd)] = parse_doc(*body);
        }
        return table;
    }

    std::string format_hint(const CommandDoc& doc) {
        if (doc.arguments.empty()) return doc.summary;

        std::string args;
        for (auto& a : doc.arguments) {
            if (!args.empty()) args += ' ';
            args += a.optional ? "[" + a.name + "]" : "<" + a.name + ">";
        }
        return doc.summary + " - Arguments: " + args;
    }

    // ---------- CommandDocs
    CommandDocs::~CommandDocs() {
        if (worker_.joinable()) worker_.join();
    }

    void CommandDocs::start(Address addr, Hello hello, ConnectionOptions opts) {
        if (worker_.joinable()) return;
        worker_ = std::thread([this, addr = std::move(addr), hello = std::move(hello), opts] {
            fetch(addr, hello, opts);
            });
    }

    void CommandDocs::fetch(const Address& addr, const Hello& hello, const ConnectionOptions& opts) {
        try {
            Connection conn(opts);
            conn.connect(addr, hello);
            RespValue reply = conn.send("COMMAND DOCS");
            if (reply.is_error()) {
                RESPX_LOG_WARN("COMMAND DOCS rejected: " << reply.str());
            }
            else {
                DocTable table = parse_command_docs(reply);
                RESPX_LOG_DEBUG("loaded docs for " << table.size() << " commands");
                populate(std::move(table));
            }
        }
        catch (const std::exception& e) {
            // docs are optional; hints are simply unavailable
            RESPX_LOG_WARN("command docs unavailable: " << e.what());
        }
        ready_ = true;
    }

    void CommandDocs::populate(DocTable table) {
        std::lock_guard<std::mutex> lk(mu_);
        table_ = std::move(table);
    }

    std::optional<CommandDoc> CommandDocs::lookup(const std::string& command_name) const {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = table_.find(upper(command_name));
        if (it == table_.end()) return std::nullopt;
        return it->second;
    }

    std::size_t CommandDocs::size() const {
        std::lock_guard<std::mutex> lk(mu_);
        return table_.size();
    }

} // namespace respx
