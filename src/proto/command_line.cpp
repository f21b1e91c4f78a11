#include <respx/proto/command_line.hpp>

namespace respx {

    static inline bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
    }

    std::vector<std::string> tokenize(std::string_view line) {
        std::vector<std::string> out;
        std::size_t i = 0;
        while (i < line.size()) {
            while (i < line.size() && is_space(line[i])) ++i;
            std::size_t b = i;
            while (i < line.size() && !is_space(line[i])) ++i;
            if (i > b) out.emplace_back(line.substr(b, i - b));
        }
        return out;
    }

    RespValue command_from_args(const std::vector<std::string>& args) {
        std::vector<RespValue> items;
        items.reserve(args.size());
        for (auto& a : args) items.push_back(RespValue::bulk_string(a));
        return RespValue::array(std::move(items));
    }

    RespValue command_from_line(std::string_view line) {
        return command_from_args(tokenize(line));
    }

} // namespace respx
