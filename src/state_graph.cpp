#include "state_graph.hpp"

#include "utils.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <type_traits>
#include <vector>

namespace fsm_regex {

auto sm::char_class::contains(char32_t ch) const -> bool
{
    bool in_class = std::any_of(ranges.begin(), ranges.end(), [ch](auto const& range) {
        return range.first <= ch && ch <= range.second;
    });
    if (!in_class) {
        in_class = singles.contains(ch);
    }
    return in_class != negated;
}

auto sm::graph::add_state(state_kind kind) -> stateid_t
{
    auto id = static_cast<stateid_t>(states.size());
    states.push_back(state{std::move(kind)});
    return id;
}

void sm::graph::add_edge(stateid_t from, stateid_t to)
{
    states.at(from).next.push_back(to);
}

void sm::graph::remove_edge(stateid_t from, stateid_t to)
{
    auto& next = states.at(from).next;
    next.erase(std::remove(next.begin(), next.end(), to), next.end());
}

auto sm::graph::successors(stateid_t s) const -> std::span<const stateid_t>
{
    auto const& next = states[s].next;
    return {next.data(), next.size()};
}

auto sm::graph::accepts(stateid_t s, char32_t ch) const -> bool
{
    return std::visit(
        [this, ch](auto&& node) -> bool {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, start> || std::is_same_v<T, termination>) {
                return false;
            } else if constexpr (std::is_same_v<T, wildcard>) {
                return true;
            } else if constexpr (std::is_same_v<T, literal>) {
                return node.symbol == ch;
            } else if constexpr (std::is_same_v<T, char_class>) {
                return node.contains(ch);
            } else if constexpr (std::is_same_v<T, repeat>) {
                return accepts(node.inner, ch);
            }
        },
        states[s].kind);
}

auto sm::graph::is_termination(stateid_t s) const -> bool
{
    return std::holds_alternative<termination>(states[s].kind);
}

auto sm::graph::is_zero_width(stateid_t s) const -> bool
{
    auto const* node = std::get_if<repeat>(&states[s].kind);
    return node != nullptr && node->minimum == 0;
}

auto parse_class_body(std::u32string_view body) -> sm::char_class
{
    auto result = sm::char_class{};

    if (!body.empty() && body.front() == U'^') {
        result.negated = true;
        body.remove_prefix(1);
    }

    std::size_t i = 0;
    while (i < body.size()) {
        if (i + 2 < body.size() && body[i + 1] == U'-') {
            // a reversed range is kept and simply matches nothing
            result.ranges.emplace_back(body[i], body[i + 2]);
            i += 3;
        } else {
            result.singles.insert(body[i]);
            i += 1;
        }
    }

    return result;
}

static auto print_kind(sm::graph const& g, sm::state_kind const& kind) -> std::string
{
    return std::visit(
        [&g](auto&& node) -> std::string {
            using T = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<T, sm::start>) {
                return "start";
            } else if constexpr (std::is_same_v<T, sm::termination>) {
                return "termination";
            } else if constexpr (std::is_same_v<T, sm::wildcard>) {
                return "wildcard";
            } else if constexpr (std::is_same_v<T, sm::literal>) {
                return fmt::format("literal({})", printable(node.symbol));
            } else if constexpr (std::is_same_v<T, sm::char_class>) {
                auto vec = std::vector<std::string>{};
                for (auto&& [min, max] : node.ranges) {
                    vec.push_back(fmt::format("{}-{}", printable(min), printable(max)));
                }
                for (char32_t ch : node.singles) {
                    vec.push_back(printable(ch));
                }
                return fmt::format("char_class(negated={}, elements=[{}])",
                                   node.negated,
                                   fmt::join(vec, ", "));
            } else if constexpr (std::is_same_v<T, sm::repeat>) {
                return fmt::format("repeat(min={}, inner={} {})",
                                   node.minimum,
                                   node.inner,
                                   print_kind(g, g.states.at(node.inner).kind));
            }
        },
        kind);
}

auto print_graph(sm::graph const& g) -> std::string
{
    auto lines = std::vector<std::string>{};
    lines.push_back(fmt::format("start_state={}, termination_state={}, num_states={}",
                                g.start_state,
                                g.termination_state,
                                g.num_states()));
    for (stateid_t s = 0; s < g.num_states(); ++s) {
        lines.push_back(fmt::format("State {} {} --> [{}]",
                                    s,
                                    print_kind(g, g.states[s].kind),
                                    fmt::join(g.successors(s), ", ")));
    }
    return fmt::format("{}", fmt::join(lines, "\n"));
}

} // namespace fsm_regex
