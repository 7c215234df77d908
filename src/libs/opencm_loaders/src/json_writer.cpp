#include <opencm_loaders/json_writer.hpp>
#include <opencm_loaders/errors.hpp>
#include <opencm_logging/logger.hpp>
#include <filesystem>
#include <fstream>

namespace opencm_loaders {

namespace {

namespace format = opencm_model::format;
using nlohmann::json;

const int indent = 2;

json variable_to_json(const opencm_model::Variable& v) {
    json out = {
        { "type", opencm_model::to_string(v.kind) },
        { "domain", { v.domain.first, v.domain.second } },
        { "unit", v.unit },
        { "observed", v.observed },
    };
    if (!v.description.empty()) out["description"] = v.description;
    if (v.default_value) out["default_value"] = *v.default_value;
    if (v.categories && !v.categories->empty()) out["categories"] = *v.categories;
    return out;
}

json edge_to_json(const opencm_model::Edge& e) {
    json out = {
        { "source", e.source },
        { "target", e.target },
        { "type", e.kind_name() },
        { "strength", e.strength },
    };
    if (!e.description.empty()) out["description"] = e.description;
    if (e.confidence != format::defaults::edge_confidence) out["confidence"] = e.confidence;
    // Presence alone means true.
    if (e.is_learned) out["is_learned"] = true;
    return out;
}

json equation_to_json(const opencm_model::Equation& eq) {
    if (eq.is_simple()) return eq.expression;
    return {
        { "type", eq.kind_name() },
        { "expression", eq.expression },
        { "noise_distribution", eq.noise_distribution },
        { "noise_params", eq.noise_params },
    };
}

json metadata_to_json(const opencm_model::Metadata& m) {
    json out = {
        { "author", m.author },
        { "citation", m.citation },
        { "license", m.license },
        { "tags", m.tags },
    };
    if (!m.created_at.empty()) out["created_at"] = m.created_at;
    if (!m.updated_at.empty()) out["updated_at"] = m.updated_at;
    if (!m.source_url.empty()) out["source_url"] = m.source_url;
    if (!m.adaptation_notes.empty()) out["adaptation_notes"] = m.adaptation_notes;
    return out;
}

} // namespace

json serialize_model(const opencm_model::Model& model) {
    json out;
    out["opencm_version"] = std::string(format::version);

    json& m = out["model"];
    m["id"] = model.id;
    m["name"] = model.name;
    m["version"] = model.version;
    m["domain"] = model.domain;
    m["description"] = model.description;
    if (model.allow_cycles) m["allow_cycles"] = true;

    json& variables = out["variables"] = json::object();
    for (const auto& [name, v] : model.variables)
        variables[name] = variable_to_json(v);

    json& edges = out["edges"] = json::array();
    for (const auto& e : model.edges)
        edges.push_back(edge_to_json(e));

    json& equations = out["structural_equations"] = json::object();
    for (const auto& [target, eq] : model.equations)
        equations[target] = equation_to_json(eq);

    out["assumptions"] = model.assumptions;

    if (model.validation) {
        out["validation"] = {
            { "min_data_points", model.validation->min_data_points },
            { "required_variables", model.validation->required_variables },
            { "suggested_datasets", model.validation->suggested_datasets },
        };
    }
    if (model.metadata)
        out["metadata"] = metadata_to_json(*model.metadata);

    return out;
}

void write_model_json(const opencm_model::Model& model, std::ostream& out) {
    out << serialize_model(model).dump(indent) << '\n';
}

std::string save_model_file(const opencm_model::Model& model, const std::string& path) {
    const std::filesystem::path target(path);
    try {
        if (target.has_parent_path())
            std::filesystem::create_directories(target.parent_path());
    } catch (const std::filesystem::filesystem_error& e) {
        throw IoError("Cannot create directory for " + path + ": " + e.what());
    }

    std::ofstream f(target);
    if (!f)
        throw IoError("Cannot open " + path + " for writing");
    write_model_json(model, f);
    f.close();
    if (!f)
        throw IoError("Failed writing OpenCM file: " + path);

    opencm_logging::logger()->info("[OpenCM] Saved model '{}' to {}", model.id, target.string());
    return std::filesystem::absolute(target).string();
}

} // namespace opencm_loaders
