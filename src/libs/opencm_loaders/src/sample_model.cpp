#include <opencm_loaders/sample_model.hpp>
#include <initializer_list>
#include <string>
#include <utility>

namespace opencm_loaders {

opencm_model::Model generate_sample_model() {
    using opencm_model::EdgeKind;
    using opencm_model::EquationKind;
    using opencm_model::VariableKind;

    opencm_model::Model out;
    out.id = "porter_five_forces";
    out.name = "Porter's Five Forces";
    out.version = "1.0.0";
    out.domain = "strategy";
    out.description = "Industry profitability as a function of the five competitive forces.";

    auto add_var = [&](const char* name, const char* unit, const char* description, double lo = 0.0, double hi = 1.0) {
        opencm_model::Variable v;
        v.name = name;
        v.kind = VariableKind::Continuous;
        v.domain = { lo, hi };
        v.unit = unit;
        v.description = description;
        out.variables.emplace(v.name, std::move(v));
    };
    auto add_edge = [&](const char* source, const char* target, EdgeKind kind, double strength, const char* description = "") {
        opencm_model::Edge e;
        e.source = source;
        e.target = target;
        e.kind = kind;
        e.strength = strength;
        e.description = description;
        out.edges.push_back(std::move(e));
    };
    auto add_equation = [&](const char* target, const char* expression,
        EquationKind kind = EquationKind::Linear,
        std::initializer_list<std::pair<const std::string, double>> noise = {})
    {
        opencm_model::Equation eq;
        eq.target = target;
        eq.kind = kind;
        eq.expression = expression;
        if (noise.size() > 0) eq.noise_params = noise;
        out.equations.emplace(eq.target, std::move(eq));
    };

    add_var("supplier_power", "index", "Bargaining power of suppliers");
    add_var("buyer_power", "index", "Bargaining power of buyers");
    add_var("threat_of_substitutes", "index", "Availability of substitute products");
    add_var("threat_of_new_entrants", "index", "Ease of entry into the industry");
    add_var("rivalry", "index", "Intensity of competitive rivalry");
    add_var("profitability", "%", "Average industry return on invested capital", -0.5, 0.5);

    add_edge("supplier_power", "rivalry", EdgeKind::Causes, 0.3);
    add_edge("buyer_power", "rivalry", EdgeKind::Causes, 0.35);
    add_edge("threat_of_substitutes", "rivalry", EdgeKind::Causes, 0.25);
    add_edge("threat_of_new_entrants", "rivalry", EdgeKind::Causes, 0.4, "New capacity intensifies competition");
    add_edge("supplier_power", "profitability", EdgeKind::Inhibits, -0.15);
    add_edge("buyer_power", "profitability", EdgeKind::Inhibits, -0.2);
    add_edge("threat_of_substitutes", "profitability", EdgeKind::Inhibits, -0.1);
    add_edge("threat_of_new_entrants", "profitability", EdgeKind::Inhibits, -0.1);
    add_edge("rivalry", "profitability", EdgeKind::Inhibits, -0.25);

    add_equation("rivalry",
        "0.3*supplier_power + 0.35*buyer_power + 0.25*threat_of_substitutes + 0.4*threat_of_new_entrants",
        EquationKind::Interaction, { { "mean", 0.0 }, { "std", 0.1 } });
    add_equation("profitability",
        "0.6 - 0.15*supplier_power - 0.20*buyer_power - 0.10*threat_of_substitutes"
        " - 0.10*threat_of_new_entrants - 0.25*rivalry");

    out.assumptions = {
        "Forces act on profitability within a single industry over a planning horizon of a few years",
        "Force intensities are measured on a common normalized index",
    };

    opencm_model::ValidationRequirements validation;
    validation.min_data_points = 30;
    validation.required_variables = { "profitability", "rivalry" };
    validation.suggested_datasets = { "compustat_industry_roic" };
    out.validation = validation;

    opencm_model::Metadata metadata;
    metadata.author = "OpenCM";
    metadata.citation = "Porter, M. E. (1979). How Competitive Forces Shape Strategy. Harvard Business Review.";
    metadata.tags = { "strategy", "industry_analysis" };
    metadata.created_at = "2026-01-01T00:00:00Z";
    out.metadata = metadata;

    return out;
}

} // namespace opencm_loaders
