#ifndef MATCHER_HPP
#define MATCHER_HPP

#include "state_graph.hpp"

#include <boost/dynamic_bitset.hpp>

#include <string_view>

namespace fsm_regex {

// set of active states, indexed by state id
using state_set = boost::dynamic_bitset<>;

// Extends `states` with every `*` state reachable without consuming input.
auto closure(sm::graph const& g, state_set const& states) -> state_set;

// Whether termination is reachable from `states` without consuming input.
auto can_terminate(sm::graph const& g, state_set const& states) -> bool;

// Runs all active states in lockstep over `input`; no backtracking.
auto matches(sm::graph const& g, std::u32string_view input) -> bool;

} // namespace fsm_regex

#endif // MATCHER_HPP
