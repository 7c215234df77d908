#pragma once

#include <opencm_model/model.hpp>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace opencm_loaders {

// Inverse of parse_model(). Defaults are omitted where the format allows it:
// empty descriptions, absent default values and categories, confidence 1.0,
// is_learned false. Simple equations (linear, normal noise, default parameters)
// are written as bare expression strings.
nlohmann::json serialize_model(const opencm_model::Model& model);

// Indented JSON text.
void write_model_json(const opencm_model::Model& model, std::ostream& out);

// Creates missing parent directories. Returns the absolute path written.
// Throws IoError.
std::string save_model_file(const opencm_model::Model& model, const std::string& path);

} // namespace opencm_loaders
