#include <opencm_loaders/json_loader.hpp>
#include <opencm_loaders/errors.hpp>
#include <utility>
#include <vector>

namespace opencm_loaders {

namespace {

namespace format = opencm_model::format;
using nlohmann::json;

bool has_value(const json& obj, const char* key) {
    return obj.is_object() && obj.contains(key) && !obj[key].is_null();
}

template <typename T>
T value_or(const json& obj, const char* key, T fallback) {
    return has_value(obj, key) ? obj.at(key).get<T>() : std::move(fallback);
}

std::string string_or(const json& obj, const char* key, std::string_view fallback = {}) {
    return value_or<std::string>(obj, key, std::string(fallback));
}

const json& section(const json& raw, const char* key) {
    static const json empty = json::object();
    return has_value(raw, key) ? raw.at(key) : empty;
}

opencm_model::Variable parse_variable(const std::string& name, const json& v) {
    opencm_model::Variable var;
    var.name = name;

    const std::string type = string_or(v, "type", format::variable_kinds[0]);
    const auto kind = opencm_model::variable_kind_from_string(type);
    if (!kind)
        throw MalformedInputError("Variable '" + name + "' has invalid type '" + type + "'");
    var.kind = *kind;

    if (has_value(v, "domain")) {
        const json& domain = v.at("domain");
        if (!domain.is_array() || domain.size() != 2)
            throw MalformedInputError("Variable '" + name + "' domain must be [min, max], got: " + domain.dump());
        var.domain = { domain.at(0).get<double>(), domain.at(1).get<double>() };
    }

    var.unit = string_or(v, "unit");
    var.description = string_or(v, "description");
    var.observed = value_or(v, "observed", format::defaults::observed);
    if (has_value(v, "default_value"))
        var.default_value = v.at("default_value").get<double>();
    if (has_value(v, "categories"))
        var.categories = v.at("categories").get<std::vector<std::string>>();
    return var;
}

opencm_model::Edge parse_edge(const json& e) {
    opencm_model::Edge edge;
    edge.source = e.at("source").get<std::string>();
    edge.target = e.at("target").get<std::string>();
    const std::string type = string_or(e, "type", format::edge_kinds[0]);
    edge.kind = opencm_model::edge_kind_from_string(type);
    if (edge.kind == opencm_model::EdgeKind::Unrecognized)
        edge.kind_label = type;
    edge.strength = value_or(e, "strength", format::defaults::edge_strength);
    edge.description = string_or(e, "description");
    edge.confidence = value_or(e, "confidence", format::defaults::edge_confidence);
    edge.is_learned = value_or(e, "is_learned", false);
    return edge;
}

// Accepts both the bare expression form and the full record form.
opencm_model::Equation parse_equation(const std::string& target, const json& eq) {
    opencm_model::Equation equation;
    equation.target = target;
    if (eq.is_string()) {
        equation.expression = eq.get<std::string>();
        return equation;
    }
    if (!eq.is_object())
        throw MalformedInputError("Equation for '" + target + "' must be an expression string or an object, got: " + eq.dump());

    const std::string type = string_or(eq, "type", format::equation_kinds[0]);
    equation.kind = opencm_model::equation_kind_from_string(type);
    if (equation.kind == opencm_model::EquationKind::Unrecognized)
        equation.kind_label = type;
    equation.expression = string_or(eq, "expression");
    equation.noise_distribution = string_or(eq, "noise_distribution", format::defaults::noise_distribution);
    equation.noise_params = value_or(eq, "noise_params", opencm_model::default_noise_params());
    return equation;
}

opencm_model::ValidationRequirements parse_validation(const json& v) {
    opencm_model::ValidationRequirements out;
    out.min_data_points = value_or(v, "min_data_points", format::defaults::min_data_points);
    out.required_variables = value_or(v, "required_variables", std::vector<std::string>{});
    out.suggested_datasets = value_or(v, "suggested_datasets", std::vector<std::string>{});
    return out;
}

opencm_model::Metadata parse_metadata(const json& m) {
    opencm_model::Metadata out;
    out.author = string_or(m, "author");
    out.citation = string_or(m, "citation");
    out.license = string_or(m, "license", format::defaults::license);
    out.tags = value_or(m, "tags", std::vector<std::string>{});
    out.created_at = string_or(m, "created_at");
    out.updated_at = string_or(m, "updated_at");
    out.source_url = string_or(m, "source_url");
    out.adaptation_notes = string_or(m, "adaptation_notes");
    return out;
}

opencm_model::Model parse_document(const json& raw, std::optional<std::string> origin) {
    opencm_model::Model model;
    const json& m = section(raw, "model");
    model.id = string_or(m, "id", "unknown");
    model.name = string_or(m, "name", "Unknown Model");
    model.version = string_or(m, "version", format::defaults::model_version);
    model.domain = string_or(m, "domain", format::defaults::domain);
    model.description = string_or(m, "description");
    model.allow_cycles = value_or(m, "allow_cycles", false);

    for (const auto& item : section(raw, "variables").items())
        model.variables.emplace(item.key(), parse_variable(item.key(), item.value()));

    if (has_value(raw, "edges")) {
        for (const auto& e : raw.at("edges"))
            model.edges.push_back(parse_edge(e));
    }

    for (const auto& item : section(raw, "structural_equations").items())
        model.equations.emplace(item.key(), parse_equation(item.key(), item.value()));

    model.assumptions = value_or(raw, "assumptions", std::vector<std::string>{});

    // An empty validation section carries no requirements.
    const json& validation = section(raw, "validation");
    if (!validation.empty())
        model.validation = parse_validation(validation);
    // No metadata section means no metadata: defaults are not invented, so a
    // document without one also round-trips without one.
    if (has_value(raw, "metadata"))
        model.metadata = parse_metadata(raw.at("metadata"));

    model.origin = std::move(origin);
    return model;
}

} // namespace

opencm_model::Model parse_model(const json& raw, std::optional<std::string> origin) {
    try {
        return parse_document(raw, std::move(origin));
    } catch (const json::type_error& e) {
        throw MalformedInputError(std::string("OpenCM field has the wrong type: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw MalformedInputError(std::string("OpenCM field is missing: ") + e.what());
    }
}

} // namespace opencm_loaders
