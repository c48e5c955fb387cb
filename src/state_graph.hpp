#ifndef STATE_GRAPH_HPP
#define STATE_GRAPH_HPP

#include "sizes.h"

#include <boost/container/small_vector.hpp>

#include <set>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace fsm_regex {
namespace sm {

struct start
{};
struct termination
{};
struct wildcard
{};
struct literal
{
    char32_t symbol;
};
struct char_class
{
    std::vector<std::pair<char32_t, char32_t>> ranges;
    std::set<char32_t> singles;
    bool negated = false;

    auto contains(char32_t ch) const -> bool;
};
// `*` (minimum = 0) or `+` (minimum = 1) applied to the state `inner`
struct repeat
{
    stateid_t inner;
    int minimum;
};

using state_kind = std::variant<start, termination, wildcard, literal, char_class, repeat>;

using edge_list = boost::container::small_vector<stateid_t, FSM_REGEX_INLINE_EDGES>;

struct state
{
    state_kind kind;
    edge_list next{};
};

struct graph
{
    // arena of states, addressed by index
    std::vector<state> states;
    stateid_t start_state = 0;
    stateid_t termination_state = 0;

    auto num_states() const -> std::size_t { return states.size(); }

    auto add_state(state_kind kind) -> stateid_t;
    void add_edge(stateid_t from, stateid_t to);
    // removes every edge from -> to
    void remove_edge(stateid_t from, stateid_t to);

    auto successors(stateid_t s) const -> std::span<const stateid_t>;
    auto accepts(stateid_t s, char32_t ch) const -> bool;

    auto is_termination(stateid_t s) const -> bool;
    // a `*` state, which may be passed without consuming input
    auto is_zero_width(stateid_t s) const -> bool;
};

} // namespace sm

// Parses the text between `[` and `]`.
auto parse_class_body(std::u32string_view body) -> sm::char_class;

auto print_graph(sm::graph const& g) -> std::string;

} // namespace fsm_regex

#endif // STATE_GRAPH_HPP
