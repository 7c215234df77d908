#include <opencm_model/model.hpp>
#include <array>

namespace opencm_model {

namespace {

constexpr std::array<VariableKind, 4> all_variable_kinds = {
    VariableKind::Continuous, VariableKind::Discrete, VariableKind::Binary, VariableKind::Categorical
};
constexpr std::array<EdgeKind, 5> all_edge_kinds = {
    EdgeKind::Causes, EdgeKind::Correlates, EdgeKind::Mediates, EdgeKind::Moderates, EdgeKind::Inhibits
};
constexpr std::array<EquationKind, 7> all_equation_kinds = {
    EquationKind::Linear, EquationKind::Polynomial, EquationKind::Exponential, EquationKind::Logistic,
    EquationKind::Interaction, EquationKind::Synergy, EquationKind::Custom
};

} // namespace

// Enum order matches the label order in format_constants.hpp.

std::string to_string(VariableKind kind) {
    return std::string(format::variable_kinds[static_cast<std::size_t>(kind)]);
}

std::string to_string(EdgeKind kind) {
    if (kind == EdgeKind::Unrecognized) return "unrecognized";
    return std::string(format::edge_kinds[static_cast<std::size_t>(kind)]);
}

std::string to_string(EquationKind kind) {
    if (kind == EquationKind::Unrecognized) return "unrecognized";
    return std::string(format::equation_kinds[static_cast<std::size_t>(kind)]);
}

std::optional<VariableKind> variable_kind_from_string(const std::string& s) {
    for (auto kind : all_variable_kinds)
        if (to_string(kind) == s) return kind;
    return std::nullopt;
}

EdgeKind edge_kind_from_string(const std::string& s) {
    for (auto kind : all_edge_kinds)
        if (to_string(kind) == s) return kind;
    return EdgeKind::Unrecognized;
}

EquationKind equation_kind_from_string(const std::string& s) {
    for (auto kind : all_equation_kinds)
        if (to_string(kind) == s) return kind;
    return EquationKind::Unrecognized;
}

bool is_known_domain(const std::string& domain) {
    return format::contains_label(format::domains, domain);
}

std::string Edge::kind_name() const {
    return kind == EdgeKind::Unrecognized ? kind_label : to_string(kind);
}

NoiseParams default_noise_params() {
    return { { "mean", format::defaults::noise_mean }, { "std", format::defaults::noise_std } };
}

std::string Equation::kind_name() const {
    return kind == EquationKind::Unrecognized ? kind_label : to_string(kind);
}

bool Equation::is_simple() const {
    return kind == EquationKind::Linear
        && noise_distribution == format::defaults::noise_distribution
        && noise_params == default_noise_params();
}

std::set<std::string> Model::variable_names() const {
    std::set<std::string> names;
    for (const auto& entry : variables)
        names.insert(entry.first);
    return names;
}

std::string Model::summary() const {
    return name + " (" + domain + "): " + std::to_string(node_count()) + " vars, "
        + std::to_string(edge_count()) + " edges";
}

} // namespace opencm_model
