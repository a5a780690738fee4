#include "store/text_lines.hpp"

namespace kvcache::store {

namespace {

constexpr std::string_view kWhitespace = " \t\f\v\r\n";
constexpr std::string_view kUtf8Bom    = "\xEF\xBB\xBF";

} // anonymous namespace

std::string_view trim(std::string_view s) noexcept {
    auto first = s.find_first_not_of(kWhitespace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(kWhitespace);
    return s.substr(first, last - first + 1);
}

std::vector<std::string_view> split_lines(std::string_view text) {
    if (text.starts_with(kUtf8Bom)) {
        text.remove_prefix(kUtf8Bom.size());
    }

    std::vector<std::string_view> lines;
    while (!text.empty()) {
        auto eol = text.find_first_of("\r\n");
        auto line = trim(text.substr(0, eol));
        if (!line.empty()) {
            lines.push_back(line);
        }
        if (eol == std::string_view::npos) {
            break;
        }
        text.remove_prefix(eol + 1);
    }
    return lines;
}

} // namespace kvcache::store
