#include "common/value.hpp"

namespace kvcache {

std::string encode_value(const Value& value) {
    return value.dump(-1, ' ', false, Value::error_handler_t::replace);
}

std::optional<Value> decode_value(std::string_view text) {
    auto parsed = Value::parse(text.begin(), text.end(),
                               /*cb=*/nullptr, /*allow_exceptions=*/false);
    if (parsed.is_discarded()) {
        return std::nullopt;
    }
    return parsed;
}

} // namespace kvcache
