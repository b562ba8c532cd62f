#pragma once

#include <string>
#include <string_view>

namespace glyphscrub
{

// Strips leading/trailing ECMAScript whitespace and line terminators
[[nodiscard]] std::u32string_view trim_whitespace(std::u32string_view text);
[[nodiscard]] std::string trim_whitespace(std::string_view text);

// Final pass of every clean: 3+ consecutive newlines become 2, then the result is trimmed
[[nodiscard]] std::u32string finalize_text(std::u32string_view text);

} // namespace glyphscrub
