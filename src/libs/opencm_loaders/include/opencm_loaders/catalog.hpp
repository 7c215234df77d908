#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace opencm_loaders {

struct CatalogEntry {
    std::string path;
    bool valid = false;
    std::string model_id;
    std::string name;
    std::string domain;
    std::string description;
    std::size_t variable_count = 0;
    std::size_t edge_count = 0;
    std::size_t error_count = 0;
    std::size_t warning_count = 0;
    std::string first_error; // empty when valid
};

// One entry per *.opencm.json file directly inside `directory`, sorted by file name.
// Files that cannot be read or parsed are listed as invalid. Throws FileNotFoundError
// if `directory` is not a directory.
std::vector<CatalogEntry> scan_model_directory(const std::string& directory);

} // namespace opencm_loaders
