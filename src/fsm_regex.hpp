#ifndef FSM_REGEX_HPP
#define FSM_REGEX_HPP

#include "errors.hpp"
#include "state_graph.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace fsm_regex {

class compiled_pattern
{
    std::string source;
    sm::graph g;

public:
    compiled_pattern(std::string source, sm::graph g);

    auto pattern() const -> std::string const& { return source; }
    auto graph() const -> sm::graph const& { return g; }

    // Whole-string match. Throws input_required for std::nullopt and
    // invalid_input if the input is not valid UTF-8.
    auto match(std::optional<std::string_view> input) const -> bool;
    auto match(char const* input) const -> bool;
};

// Throws invalid_pattern.
auto compile(std::string_view pattern, bool verbose = false) -> compiled_pattern;

} // namespace fsm_regex

#endif // FSM_REGEX_HPP
