#pragma once

#include <cstddef>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace opencm_validation {

// node -> direct successors
using Arcs = std::map<std::string, std::set<std::string>>;

// Nodes in path order; the arc from the last node back to the first closes the cycle.
using Cycle = std::vector<std::string>;

// Three-colour depth-first search over every node (map order, so results are
// deterministic). A cycle is recorded whenever an arc re-enters a node on the
// current path. Stops as soon as max_cycles cycles have been recorded (at least one).
std::vector<Cycle> find_cycles(const Arcs& arcs, std::size_t max_cycles);

inline bool has_cycle(const Arcs& arcs) {
    return !find_cycles(arcs, 1).empty();
}

// "a -> b -> a"
std::string format_cycle(const Cycle& cycle);

} // namespace opencm_validation
