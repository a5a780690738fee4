#include "store/ini_codec.hpp"
#include "store/text_lines.hpp"

namespace kvcache::store {

std::string IniCodec::encode(const Store& store) const {
    std::string out;
    for (const auto& [section, table] : store) {
        out += '[';
        out += section;
        out += "]\n";
        for (const auto& [key, value] : table) {
            out += key;
            out += " = ";
            out += encode_value(value);
            out += '\n';
        }
        out += '\n';
    }
    return out;
}

Store IniCodec::decode(std::string_view text, spdlog::logger& log) const {
    Store store;
    Table* current = nullptr;
    std::size_t raw_values = 0;

    for (auto line : split_lines(text)) {
        if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
            current = &store.get_or_create(std::string(line.substr(1, line.size() - 2)));
            continue;
        }

        auto eq = line.find('=');
        if (current == nullptr || eq == std::string_view::npos) {
            continue;
        }

        auto key = trim(line.substr(0, eq));
        auto raw = trim(line.substr(eq + 1));
        if (auto value = decode_value(raw)) {
            current->insert_or_assign(std::string(key), std::move(*value));
        } else {
            current->insert_or_assign(std::string(key), Value(std::string(raw)));
            ++raw_values;
        }
    }

    if (raw_values > 0) {
        log.debug("ini: kept {} non-JSON value(s) as plain strings", raw_values);
    }
    return store;
}

} // namespace kvcache::store
