#include "fsm_regex.hpp"

#include "compiler.hpp"
#include "matcher.hpp"
#include "utils.hpp"

#include <fmt/core.h>

#include <utility>

namespace fsm_regex {

compiled_pattern::compiled_pattern(std::string source, sm::graph g)
    : source(std::move(source))
    , g(std::move(g))
{}

auto compiled_pattern::match(std::optional<std::string_view> input) const -> bool
{
    if (!input.has_value()) {
        throw input_required("Input string is required");
    }
    return matches(g, to_unicode(*input));
}

auto compiled_pattern::match(char const* input) const -> bool
{
    if (input == nullptr) {
        return match(std::nullopt);
    }
    return match(std::string_view(input));
}

auto compile(std::string_view pattern, bool verbose) -> compiled_pattern
{
    auto g = build_graph(pattern);

    if (verbose) {
        fmt::print("Regex: {}\n", pattern);
        fmt::print("{}\n", print_graph(g));
    }

    return compiled_pattern(std::string(pattern), std::move(g));
}

} // namespace fsm_regex
