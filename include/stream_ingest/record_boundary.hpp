#pragma once
#include <cstddef>
#include <string_view>

namespace si {

inline constexpr char kRecordTerminator = '\n';

// Position one past the first terminator at or after `from`, or npos.
std::size_t record_end(std::string_view bytes, std::size_t from = 0) noexcept;

bool ends_with_terminator(std::string_view bytes) noexcept;

// Drops a single trailing '\r' (CRLF input).
std::string_view trim_cr(std::string_view line) noexcept;

}
