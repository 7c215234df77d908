#include <opencm_validation/validator.hpp>
#include <opencm_validation/graph_cycles.hpp>
#include <opencm_logging/logger.hpp>
#include <opencm_model/format_constants.hpp>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <optional>
#include <regex>
#include <set>
#include <utility>

namespace opencm_validation {

namespace {

namespace format = opencm_model::format;
using nlohmann::json;

// Per-call accumulator; lives on the stack of validate().
struct Diagnostics {
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    void error(std::string message) { errors.push_back(std::move(message)); }
    void warning(std::string message) { warnings.push_back(std::move(message)); }
};

enum class Shape { String, Boolean, Number, Integer, StringList };

const char* shape_name(Shape shape) {
    switch (shape) {
    case Shape::String: return "a string";
    case Shape::Boolean: return "a boolean";
    case Shape::Number: return "a number";
    case Shape::Integer: return "an integer";
    case Shape::StringList: return "a list of strings";
    }
    return "";
}

bool has_shape(const json& value, Shape shape) {
    switch (shape) {
    case Shape::String: return value.is_string();
    case Shape::Boolean: return value.is_boolean();
    case Shape::Number: return value.is_number();
    case Shape::Integer: return value.is_number_integer();
    case Shape::StringList:
        if (!value.is_array()) return false;
        for (const auto& item : value)
            if (!item.is_string()) return false;
        return true;
    }
    return false;
}

// null is treated the same as an absent field.
bool has_value(const json& obj, const char* key) {
    return obj.contains(key) && !obj[key].is_null();
}

// Strings as-is, anything else as compact JSON.
std::string describe(const json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

void check_shapes(const json& obj, const std::string& where,
    std::initializer_list<std::pair<const char*, Shape>> fields, Diagnostics& diag)
{
    for (const auto& [key, shape] : fields) {
        if (!has_value(obj, key)) continue;
        if (!has_shape(obj[key], shape))
            diag.error(where + " field '" + key + "' must be " + shape_name(shape) + ", got: " + obj[key].dump());
    }
}

bool check_required_fields(const json& raw, Diagnostics& diag) {
    for (const char* field : { "opencm_version", "model", "variables", "edges" }) {
        if (!raw.contains(field))
            diag.error(std::string("Missing required field: '") + field + "'");
    }

    if (raw.contains("opencm_version")) {
        const json& version = raw["opencm_version"];
        if (!version.is_string() || version.get<std::string>() != format::version)
            diag.warning("Model uses OpenCM version " + describe(version) + ", current is " + std::string(format::version));
    }
    return diag.errors.empty();
}

void check_model_section(const json& model, Diagnostics& diag) {
    if (!model.is_object()) {
        diag.error("'model' must be an object, got: " + model.dump());
        return;
    }

    for (const char* field : { "id", "name" }) {
        if (!model.contains(field))
            diag.error(std::string("Missing required model field: 'model.") + field + "'");
    }

    if (model.contains("id")) {
        static const std::regex id_pattern{ std::string(format::model_id_pattern) };
        const json& id = model["id"];
        if (!id.is_string() || !std::regex_match(id.get<std::string>(), id_pattern))
            diag.error("model.id must be lowercase alphanumeric with underscores, got: '" + describe(id) + "'");
    }

    if (has_value(model, "domain")) {
        const json& domain = model["domain"];
        if (!domain.is_string())
            diag.error("model field 'domain' must be a string, got: " + domain.dump());
        else if (!format::contains_label(format::domains, domain.get<std::string>()))
            diag.warning("Unknown domain '" + domain.get<std::string>() + "' (valid: " + format::join_labels(format::domains) + ")");
    }

    check_shapes(model, "model", {
        { "name", Shape::String },
        { "version", Shape::String },
        { "description", Shape::String },
        { "allow_cycles", Shape::Boolean },
    }, diag);
}

void check_variable(const std::string& name, const json& def, Diagnostics& diag) {
    if (has_value(def, "type")) {
        const json& type = def["type"];
        if (!type.is_string() || !format::contains_label(format::variable_kinds, type.get<std::string>()))
            diag.error("Variable '" + name + "' has invalid type '" + describe(type)
                + "' (valid: " + format::join_labels(format::variable_kinds) + ")");
    }

    if (has_value(def, "domain")) {
        const json& domain = def["domain"];
        if (!domain.is_array() || domain.size() != 2 || !domain[0].is_number() || !domain[1].is_number()) {
            diag.error("Variable '" + name + "' domain must be [min, max], got: " + domain.dump());
        } else if (domain[0].get<double>() >= domain[1].get<double>()) {
            diag.error("Variable '" + name + "' domain min (" + domain[0].dump()
                + ") must be < max (" + domain[1].dump() + ")");
        }
    }

    check_shapes(def, "Variable '" + name + "'", {
        { "unit", Shape::String },
        { "description", Shape::String },
        { "observed", Shape::Boolean },
        { "default_value", Shape::Number },
        { "categories", Shape::StringList },
    }, diag);
}

std::set<std::string> check_variables(const json& variables, Diagnostics& diag) {
    std::set<std::string> names;
    if (!variables.is_object()) {
        diag.error("'variables' must be an object mapping names to definitions, got: " + variables.dump());
        return names;
    }
    if (variables.empty()) {
        diag.error("Model must have at least one variable");
        return names;
    }

    for (const auto& item : variables.items()) {
        const std::string& name = item.key();
        const json& def = item.value();
        names.insert(name);
        if (!def.is_object()) {
            diag.error("Variable '" + name + "' must be an object, got: " + def.dump());
            continue;
        }
        check_variable(name, def, diag);
    }
    return names;
}

// Returns the endpoint name if it is a usable string.
std::optional<std::string> check_endpoint(const json& edge, const char* key, const std::string& where,
    const std::set<std::string>& variable_names, Diagnostics& diag)
{
    if (!has_value(edge, key) || (edge[key].is_string() && edge[key].get<std::string>().empty())) {
        diag.error(where + " missing '" + key + "'");
        return std::nullopt;
    }
    if (!edge[key].is_string()) {
        diag.error(where + " " + key + " must be a string, got: " + edge[key].dump());
        return std::nullopt;
    }
    std::string name = edge[key].get<std::string>();
    if (variable_names.count(name) == 0)
        diag.error(where + " " + key + " '" + name + "' not in variables");
    return name;
}

void check_edges(const json& edges, const std::set<std::string>& variable_names, Diagnostics& diag) {
    if (!edges.is_array()) {
        diag.error("'edges' must be a list, got: " + edges.dump());
        return;
    }

    std::size_t index = 0;
    for (const auto& edge : edges) {
        const std::string where = "Edge " + std::to_string(index++);
        if (!edge.is_object()) {
            diag.error(where + " must be an object, got: " + edge.dump());
            continue;
        }

        const auto source = check_endpoint(edge, "source", where, variable_names, diag);
        const auto target = check_endpoint(edge, "target", where, variable_names, diag);
        // Self-loops are rejected even when the model allows cycles.
        if (source && target && *source == *target)
            diag.error(where + " is a self-loop (" + *source + " -> " + *target + ")");

        if (has_value(edge, "type")) {
            const json& type = edge["type"];
            if (!type.is_string())
                diag.error(where + " field 'type' must be a string, got: " + type.dump());
            else if (!format::contains_label(format::edge_kinds, type.get<std::string>()))
                diag.warning(where + " has unknown type '" + type.get<std::string>()
                    + "' (valid: " + format::join_labels(format::edge_kinds) + ")");
        }

        if (has_value(edge, "strength")) {
            const json& strength = edge["strength"];
            if (!strength.is_number()
                || strength.get<double>() < format::defaults::min_strength
                || strength.get<double>() > format::defaults::max_strength)
                diag.error(where + " strength must be in [-1, 1], got: " + strength.dump());
        }

        // confidence is not range checked.
        check_shapes(edge, where, {
            { "description", Shape::String },
            { "confidence", Shape::Number },
            { "is_learned", Shape::Boolean },
        }, diag);
    }
}

void check_equation_record(const std::string& target, const json& equation, Diagnostics& diag) {
    const std::string where = "Equation for '" + target + "'";
    if (has_value(equation, "type")) {
        const json& type = equation["type"];
        if (!type.is_string())
            diag.error(where + " field 'type' must be a string, got: " + type.dump());
        else if (!format::contains_label(format::equation_kinds, type.get<std::string>()))
            diag.warning(where + " has unknown type '" + type.get<std::string>()
                + "' (valid: " + format::join_labels(format::equation_kinds) + ")");
    }

    check_shapes(equation, where, {
        { "expression", Shape::String },
        { "noise_distribution", Shape::String },
    }, diag);

    if (has_value(equation, "noise_params")) {
        const json& params = equation["noise_params"];
        bool numeric = params.is_object();
        if (numeric) {
            for (const auto& item : params.items())
                numeric = numeric && item.value().is_number();
        }
        if (!numeric)
            diag.error(where + " noise_params must map names to numbers, got: " + params.dump());
    }
}

// Expression text is stored, not interpreted: references inside it are not checked.
void check_equations(const json& equations, const std::set<std::string>& variable_names, Diagnostics& diag) {
    if (!equations.is_object()) {
        diag.error("'structural_equations' must be an object, got: " + equations.dump());
        return;
    }

    for (const auto& item : equations.items()) {
        const std::string& target = item.key();
        const json& equation = item.value();
        if (variable_names.count(target) == 0)
            diag.error("Equation target '" + target + "' not in variables");

        if (equation.is_string()) continue;
        if (equation.is_object())
            check_equation_record(target, equation, diag);
        else
            diag.error("Equation for '" + target + "' must be an expression string or an object, got: " + equation.dump());
    }
}

Arcs build_arcs(const json& edges) {
    Arcs arcs;
    if (!edges.is_array()) return arcs;
    for (const auto& edge : edges) {
        if (!edge.is_object()) continue;
        if (!has_value(edge, "source") || !edge["source"].is_string()) continue;
        if (!has_value(edge, "target") || !edge["target"].is_string()) continue;
        const auto source = edge["source"].get<std::string>();
        const auto target = edge["target"].get<std::string>();
        if (source.empty() || target.empty()) continue;
        arcs[source].insert(target);
        arcs.try_emplace(target);
    }
    return arcs;
}

void check_acyclicity(const json& edges, Diagnostics& diag) {
    const auto cycles = find_cycles(build_arcs(edges), format::max_reported_cycles);
    if (cycles.empty()) return;

    std::string message = "Graph contains cycles: ";
    for (std::size_t i = 0; i < cycles.size(); ++i) {
        if (i > 0) message += ", ";
        message += "[" + format_cycle(cycles[i]) + "]";
    }
    diag.error(std::move(message));
}

void check_assumptions(const json& raw, Diagnostics& diag) {
    if (!has_value(raw, "assumptions")) {
        diag.warning("No assumptions listed: models should be transparent about their assumptions");
        return;
    }
    const json& assumptions = raw["assumptions"];
    if (!has_shape(assumptions, Shape::StringList))
        diag.error("'assumptions' must be a list of strings, got: " + assumptions.dump());
    else if (assumptions.empty())
        diag.warning("No assumptions listed: models should be transparent about their assumptions");
}

// Counts are stored as int.
bool fits_count(const json& value) {
    constexpr auto limit = std::numeric_limits<int>::max();
    if (value.is_number_unsigned())
        return value.get<std::uint64_t>() <= static_cast<std::uint64_t>(limit);
    const auto n = value.get<std::int64_t>();
    return n >= 0 && n <= limit;
}

void check_context_sections(const json& raw, Diagnostics& diag) {
    if (has_value(raw, "validation")) {
        const json& validation = raw["validation"];
        if (!validation.is_object()) {
            diag.error("'validation' must be an object, got: " + validation.dump());
        } else {
            check_shapes(validation, "validation", {
                { "min_data_points", Shape::Integer },
                { "required_variables", Shape::StringList },
                { "suggested_datasets", Shape::StringList },
            }, diag);
            if (has_value(validation, "min_data_points") && validation["min_data_points"].is_number_integer()
                && !fits_count(validation["min_data_points"]))
                diag.error("validation field 'min_data_points' must be in [0, "
                    + std::to_string(std::numeric_limits<int>::max()) + "], got: "
                    + validation["min_data_points"].dump());
        }
    }

    if (has_value(raw, "metadata")) {
        const json& metadata = raw["metadata"];
        if (!metadata.is_object()) {
            diag.error("'metadata' must be an object, got: " + metadata.dump());
        } else {
            check_shapes(metadata, "metadata", {
                { "author", Shape::String },
                { "citation", Shape::String },
                { "license", Shape::String },
                { "tags", Shape::StringList },
                { "created_at", Shape::String },
                { "updated_at", Shape::String },
                { "source_url", Shape::String },
                { "adaptation_notes", Shape::String },
            }, diag);
        }
    }
}

bool cycles_allowed(const json& model) {
    return model.is_object() && model.contains("allow_cycles")
        && model["allow_cycles"].is_boolean() && model["allow_cycles"].get<bool>();
}

ValidationResult finish(Diagnostics&& diag) {
    ValidationResult result;
    result.ok = diag.errors.empty();
    result.errors = std::move(diag.errors);
    result.warnings = std::move(diag.warnings);
    opencm_logging::logger()->debug("Validation complete: {} errors, {} warnings",
        result.errors.size(), result.warnings.size());
    return result;
}

} // namespace

ValidationResult validate(const json& raw) {
    Diagnostics diag;
    if (!raw.is_object()) {
        diag.error("OpenCM document must be a JSON object, got: " + raw.dump());
        return finish(std::move(diag));
    }

    // Nothing below is safe to inspect without the top-level structure.
    if (!check_required_fields(raw, diag))
        return finish(std::move(diag));

    const json& model = raw["model"];
    check_model_section(model, diag);

    const auto variable_names = check_variables(raw["variables"], diag);

    const json& edges = raw["edges"];
    check_edges(edges, variable_names, diag);

    if (has_value(raw, "structural_equations")) {
        const json& equations = raw["structural_equations"];
        if (!equations.is_object() || !equations.empty())
            check_equations(equations, variable_names, diag);
    }

    if (!cycles_allowed(model))
        check_acyclicity(edges, diag);
    else
        diag.warning("Cyclic graph allowed: downstream evaluation must use an iterative (fixed-point) solver");

    check_assumptions(raw, diag);
    check_context_sections(raw, diag);

    return finish(std::move(diag));
}

} // namespace opencm_validation
