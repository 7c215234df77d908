#include <opencm_loaders/json_loader.hpp>
#include <opencm_loaders/errors.hpp>
#include <opencm_logging/logger.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace opencm_loaders {

namespace {

nlohmann::json read_json(std::istream& in, const std::string& source) {
    try {
        return nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw MalformedInputError("OpenCM file " + source + " is not valid JSON: " + e.what());
    }
}

opencm_model::Model load_validated(const nlohmann::json& raw, std::optional<std::string> origin,
    const std::string& source)
{
    auto result = opencm_validation::validate(raw);
    if (!result.ok)
        throw ModelValidationError(source, std::move(result.errors));

    auto log = opencm_logging::logger();
    for (const auto& w : result.warnings)
        log->warn("[OpenCM] {}: {}", source, w);

    return parse_model(raw, std::move(origin));
}

} // namespace

nlohmann::json read_json_file(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw FileNotFoundError(path);

    std::ifstream f(path);
    if (!f)
        throw IoError("Cannot read OpenCM file: " + path);
    return read_json(f, path);
}

opencm_model::Model load_model_from_json(std::istream& in, std::optional<std::string> origin) {
    const std::string source = origin.value_or("<stream>");
    const nlohmann::json raw = read_json(in, source);
    return load_validated(raw, std::move(origin), source);
}

opencm_model::Model load_model_file(const std::string& path) {
    const nlohmann::json raw = read_json_file(path);
    return load_validated(raw, path, path);
}

opencm_validation::ValidationResult validate_model_file(const std::string& path) {
    return opencm_validation::validate(read_json_file(path));
}

} // namespace opencm_loaders
