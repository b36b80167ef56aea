#pragma once
#include <cstddef>
#include <string_view>

namespace errorsmith {

inline constexpr std::size_t keyword_npos = static_cast<std::size_t>(-1);

// Offset of the first literal occurrence of `keyword` at or after `start` that
// is not inside a // or /* */ comment. Quoted strings and runes are NOT skipped:
// only call this where no literal can precede the keyword (e.g. between a
// closing brace and a following `else`).
// Returns keyword_npos when the buffer ends first or a block comment is unterminated.
std::size_t find_keyword(std::string_view src, std::size_t start, std::string_view keyword);

} // namespace errorsmith
