#pragma once

#include <string_view>
#include <vector>

namespace kvcache::store {

// Strips ASCII whitespace from both ends of `s`.
[[nodiscard]] std::string_view trim(std::string_view s) noexcept;

// Splits `text` on runs of CR/LF and trims every line.  A leading UTF-8
// byte-order mark is skipped and blank lines are dropped.
// The returned views point into `text`.
[[nodiscard]] std::vector<std::string_view> split_lines(std::string_view text);

} // namespace kvcache::store
