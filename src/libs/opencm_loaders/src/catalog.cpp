#include <opencm_loaders/catalog.hpp>
#include <opencm_loaders/errors.hpp>
#include <opencm_loaders/json_loader.hpp>
#include <opencm_logging/logger.hpp>
#include <opencm_model/format_constants.hpp>
#include <algorithm>
#include <filesystem>
#include <system_error>

namespace opencm_loaders {

namespace {

bool is_model_file(const std::filesystem::directory_entry& entry) {
    std::error_code ec;
    return entry.is_regular_file(ec)
        && entry.path().filename().string().ends_with(opencm_model::format::file_extension);
}

CatalogEntry describe_file(const std::string& path) {
    CatalogEntry entry;
    entry.path = path;
    try {
        const nlohmann::json raw = read_json_file(path);
        const auto result = opencm_validation::validate(raw);
        entry.error_count = result.errors.size();
        entry.warning_count = result.warnings.size();
        if (!result.ok) {
            entry.first_error = result.errors.front();
            return entry;
        }

        const auto model = parse_model(raw, path);
        entry.valid = true;
        entry.model_id = model.id;
        entry.name = model.name;
        entry.domain = model.domain;
        entry.description = model.description;
        entry.variable_count = model.node_count();
        entry.edge_count = model.edge_count();
    } catch (const LoadError& e) {
        opencm_logging::logger()->warn("[OpenCM] Skipping {}: {}", path, e.what());
        entry.error_count = 1;
        entry.first_error = e.what();
    }
    return entry;
}

} // namespace

std::vector<CatalogEntry> scan_model_directory(const std::string& directory) {
    std::error_code ec;
    if (!std::filesystem::is_directory(directory, ec))
        throw FileNotFoundError(directory);

    std::vector<std::string> paths;
    std::filesystem::directory_iterator it(directory, ec);
    for (; !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
        if (is_model_file(*it))
            paths.push_back(it->path().string());
    }
    if (ec)
        throw IoError("Cannot list " + directory + ": " + ec.message());
    std::sort(paths.begin(), paths.end());

    std::vector<CatalogEntry> out;
    out.reserve(paths.size());
    for (const auto& p : paths)
        out.push_back(describe_file(p));

    opencm_logging::logger()->debug("[OpenCM] Catalog of {}: {} model files", directory, out.size());
    return out;
}

} // namespace opencm_loaders
