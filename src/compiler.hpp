#ifndef COMPILER_HPP
#define COMPILER_HPP

#include "state_graph.hpp"

#include <string_view>

namespace fsm_regex {

// Builds the state graph for `pattern` in a single left-to-right pass.
// Throws invalid_pattern.
auto build_graph(std::string_view pattern) -> sm::graph;

} // namespace fsm_regex

#endif // COMPILER_HPP
