#pragma once

#include <opencm_model/model.hpp>
#include <opencm_validation/validator.hpp>
#include <nlohmann/json.hpp>
#include <istream>
#include <optional>
#include <string>

namespace opencm_loaders {

// Builds a Model from a document that already passed validation, filling defaults
// for every absent optional field. Throws MalformedInputError on shape mismatches.
opencm_model::Model parse_model(const nlohmann::json& raw, std::optional<std::string> origin = std::nullopt);

// Reads JSON text. Throws FileNotFoundError, IoError or MalformedInputError.
nlohmann::json read_json_file(const std::string& path);

// Read, validate, parse. Throws ModelValidationError with the complete error list;
// warnings go to the log.
opencm_model::Model load_model_from_json(std::istream& in, std::optional<std::string> origin = std::nullopt);
opencm_model::Model load_model_file(const std::string& path);

// Read and validate only.
opencm_validation::ValidationResult validate_model_file(const std::string& path);

} // namespace opencm_loaders
