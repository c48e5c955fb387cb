#include "matcher.hpp"

#include <queue>

namespace fsm_regex {

namespace { // static linkage

auto to_queue(state_set const& states) -> std::queue<stateid_t>
{
    auto queue = std::queue<stateid_t>{};
    for (auto s = states.find_first(); s != state_set::npos; s = states.find_next(s)) {
        queue.push(static_cast<stateid_t>(s));
    }
    return queue;
}

auto step(sm::graph const& g, state_set const& current, char32_t ch) -> state_set
{
    auto next = state_set(g.num_states());
    for (auto s = current.find_first(); s != state_set::npos; s = current.find_next(s)) {
        for (stateid_t t : g.successors(static_cast<stateid_t>(s))) {
            if (g.accepts(t, ch)) {
                next.set(t);
            }
        }
    }
    return next;
}

} // namespace

auto closure(sm::graph const& g, state_set const& states) -> state_set
{
    auto result = states;
    auto visited = state_set(g.num_states());
    auto queue = to_queue(states);

    while (!queue.empty()) {
        auto s = queue.front();
        queue.pop();

        if (visited.test(s)) {
            continue;
        }
        visited.set(s);

        // a `*` state can be skipped, so whatever follows it is reachable as well.
        // this also covers the self-loop of a `*` state.
        for (stateid_t t : g.successors(s)) {
            if (g.is_zero_width(t) && !visited.test(t)) {
                result.set(t);
                queue.push(t);
            }
        }
    }

    return result;
}

auto can_terminate(sm::graph const& g, state_set const& states) -> bool
{
    auto visited = state_set(g.num_states());
    auto queue = to_queue(states);

    while (!queue.empty()) {
        auto s = queue.front();
        queue.pop();

        if (visited.test(s)) {
            continue;
        }
        visited.set(s);

        auto next = g.successors(s);
        for (stateid_t t : next) {
            if (g.is_termination(t)) {
                return true;
            }
        }
        for (stateid_t t : next) {
            if (g.is_zero_width(t) && !visited.test(t)) {
                queue.push(t);
            }
        }
    }

    return false;
}

auto matches(sm::graph const& g, std::u32string_view input) -> bool
{
    auto initial = state_set(g.num_states());
    initial.set(g.start_state);
    auto current = closure(g, initial);

    for (char32_t ch : input) {
        auto next = step(g, current, ch);
        if (next.none()) {
            return false;
        }
        current = closure(g, next);
    }

    return can_terminate(g, current);
}

} // namespace fsm_regex
