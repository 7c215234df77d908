#include <opencm_validation/graph_cycles.hpp>
#include <algorithm>
#include <unordered_map>

namespace opencm_validation {

namespace {

enum class Mark { Unvisited, OnPath, Done };

struct Frame {
    std::string node;
    std::set<std::string>::const_iterator next;
    std::set<std::string>::const_iterator end;
};

const std::set<std::string>& successors(const Arcs& arcs, const std::string& node) {
    static const std::set<std::string> none;
    auto it = arcs.find(node);
    return it != arcs.end() ? it->second : none;
}

} // namespace

std::vector<Cycle> find_cycles(const Arcs& arcs, std::size_t max_cycles) {
    std::vector<Cycle> cycles;
    std::unordered_map<std::string, Mark> marks;
    auto mark_of = [&](const std::string& node) {
        auto it = marks.find(node);
        return it != marks.end() ? it->second : Mark::Unvisited;
    };

    // Explicit stack: long chains must not exhaust the call stack.
    std::vector<Frame> stack;
    std::vector<std::string> path;

    auto enter = [&](const std::string& node) {
        const auto& succ = successors(arcs, node);
        marks[node] = Mark::OnPath;
        path.push_back(node);
        stack.push_back(Frame{ node, succ.begin(), succ.end() });
    };

    for (const auto& entry : arcs) {
        if (mark_of(entry.first) != Mark::Unvisited) continue;
        enter(entry.first);

        while (!stack.empty()) {
            Frame& frame = stack.back();
            if (frame.next == frame.end) {
                marks[frame.node] = Mark::Done;
                path.pop_back();
                stack.pop_back();
                continue;
            }

            const std::string succ = *frame.next;
            ++frame.next;

            const Mark mark = mark_of(succ);
            if (mark == Mark::OnPath) {
                auto start = std::find(path.begin(), path.end(), succ);
                cycles.emplace_back(start, path.end());
                if (cycles.size() >= max_cycles) return cycles;
            } else if (mark == Mark::Unvisited) {
                enter(succ);
            }
        }
    }
    return cycles;
}

std::string format_cycle(const Cycle& cycle) {
    if (cycle.empty()) return "";
    std::string out;
    for (const auto& node : cycle)
        out += node + " -> ";
    out += cycle.front();
    return out;
}

} // namespace opencm_validation
