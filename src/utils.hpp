#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>
#include <string_view>

namespace fsm_regex {

// Throws invalid_input if `s` is not valid UTF-8.
auto to_unicode(std::string_view s) -> std::u32string;

// Printable form of a single code point for debug output.
auto printable(char32_t ch) -> std::string;

} // namespace fsm_regex

#endif // UTILS_HPP
