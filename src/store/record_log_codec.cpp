#include "store/record_log_codec.hpp"
#include "store/text_lines.hpp"

namespace kvcache::store {

std::string RecordLogCodec::encode(const Store& store) const {
    std::string out;
    for (const auto& [table_name, table] : store) {
        for (const auto& [key, value] : table) {
            Value record = Value::array({table_name, key, value});
            out += encode_value(record);
            out += '\n';
        }
    }
    return out;
}

Store RecordLogCodec::decode(std::string_view text, spdlog::logger& log) const {
    Store store;
    std::size_t record_no = 0;

    for (auto line : split_lines(text)) {
        ++record_no;
        auto record = decode_value(line);
        if (!record) {
            log.warn("failed to parse cache record {}: not valid JSON", record_no);
            continue;
        }
        if (!record->is_array() || record->size() != 3 ||
            !(*record)[0].is_string() || !(*record)[1].is_string()) {
            log.warn("failed to parse cache record {}: expected [table, key, value]",
                     record_no);
            continue;
        }

        auto& table = store.get_or_create((*record)[0].get<std::string>());
        table.insert_or_assign((*record)[1].get<std::string>(),
                               std::move((*record)[2]));
    }
    return store;
}

} // namespace kvcache::store
