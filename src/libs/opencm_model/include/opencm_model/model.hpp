#pragma once

#include <opencm_model/types.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace opencm_model {

// A structural causal model. Cross references (edge endpoints, equation targets,
// acyclicity) are not enforced here; run the validator before trusting a model
// that was not produced by the parser.
struct Model {
    std::string id;
    std::string name;
    std::string version{ format::defaults::model_version };
    std::string domain{ format::defaults::domain };
    std::string description;

    std::map<std::string, Variable> variables;
    std::vector<Edge> edges;
    std::map<std::string, Equation> equations;
    bool allow_cycles = false;

    std::vector<std::string> assumptions;
    std::optional<ValidationRequirements> validation;
    std::optional<Metadata> metadata;

    // Path the model was loaded from, provenance only.
    std::optional<std::string> origin;

    std::set<std::string> variable_names() const;
    std::size_t node_count() const { return variables.size(); }
    std::size_t edge_count() const { return edges.size(); }

    // "Name (domain): N vars, M edges"
    std::string summary() const;
};

} // namespace opencm_model
