#pragma once

#include <opencm_model/format_constants.hpp>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace opencm_model {

enum class VariableKind { Continuous, Discrete, Binary, Categorical };

// Unrecognized keeps the label text in the owning record (kind_label) so it can be written back.
enum class EdgeKind { Causes, Correlates, Mediates, Moderates, Inhibits, Unrecognized };

enum class EquationKind { Linear, Polynomial, Exponential, Logistic, Interaction, Synergy, Custom, Unrecognized };

std::string to_string(VariableKind kind);
std::string to_string(EdgeKind kind);
std::string to_string(EquationKind kind);

std::optional<VariableKind> variable_kind_from_string(const std::string& s);
EdgeKind edge_kind_from_string(const std::string& s);
EquationKind equation_kind_from_string(const std::string& s);

bool is_known_domain(const std::string& domain);

struct Variable {
    std::string name;
    VariableKind kind = VariableKind::Continuous;
    // (min, max), min < max once validated
    std::pair<double, double> domain{ format::defaults::domain_min, format::defaults::domain_max };
    std::string unit;
    std::string description;
    bool observed = format::defaults::observed;
    std::optional<double> default_value;
    // Only meaningful for VariableKind::Categorical.
    std::optional<std::vector<std::string>> categories;
};

struct Edge {
    std::string source;
    std::string target;
    EdgeKind kind = EdgeKind::Causes;
    std::string kind_label; // original text when kind == Unrecognized
    double strength = format::defaults::edge_strength;
    std::string description;
    double confidence = format::defaults::edge_confidence;
    bool is_learned = false;

    std::string kind_name() const;
};

using NoiseParams = std::map<std::string, double>;

NoiseParams default_noise_params();

struct Equation {
    std::string target;
    EquationKind kind = EquationKind::Linear;
    std::string kind_label; // original text when kind == Unrecognized
    // Stored verbatim, never evaluated.
    std::string expression;
    std::string noise_distribution{ format::defaults::noise_distribution };
    NoiseParams noise_params = default_noise_params();

    std::string kind_name() const;
    // Linear with the default noise model: representable as a bare expression string.
    bool is_simple() const;
};

struct ValidationRequirements {
    int min_data_points = format::defaults::min_data_points;
    std::vector<std::string> required_variables;
    std::vector<std::string> suggested_datasets;
};

struct Metadata {
    std::string author;
    std::string citation;
    std::string license{ format::defaults::license };
    std::vector<std::string> tags;
    std::string created_at;
    std::string updated_at;
    std::string source_url;
    std::string adaptation_notes;
};

} // namespace opencm_model
