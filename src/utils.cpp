#include "utils.hpp"

#include "errors.hpp"

#include <fmt/core.h>
#include <utf8.h>

#include <cstdint>
#include <iterator>

namespace fsm_regex {

auto to_unicode(std::string_view s) -> std::u32string
{
    auto invalid = utf8::find_invalid(s.begin(), s.end());
    if (invalid != s.end()) {
        throw invalid_input(
            fmt::format("invalid UTF-8 at byte offset {}", std::distance(s.begin(), invalid)));
    }
    auto result = std::u32string{};
    utf8::utf8to32(s.begin(), s.end(), std::back_inserter(result));
    return result;
}

auto printable(char32_t ch) -> std::string
{
    if (ch >= 0x20 && ch < 0x7f) {
        return fmt::format("'{}'", static_cast<char>(ch));
    }
    return fmt::format("U+{:04X}", static_cast<std::uint32_t>(ch));
}

} // namespace fsm_regex
