#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace opencm_model {

// Shared constants of the OpenCM interchange format (used by validator, parser and serializer).

namespace format {

constexpr std::string_view version = "1.0";
constexpr std::string_view file_extension = ".opencm.json";

// model.id must match ^[a-z][a-z0-9_]*$
constexpr std::string_view model_id_pattern = "^[a-z][a-z0-9_]*$";

constexpr std::array<std::string_view, 4> variable_kinds = {
    "continuous", "discrete", "binary", "categorical"
};
constexpr std::array<std::string_view, 5> edge_kinds = {
    "causes", "correlates", "mediates", "moderates", "inhibits"
};
constexpr std::array<std::string_view, 7> equation_kinds = {
    "linear", "polynomial", "exponential", "logistic", "interaction", "synergy", "custom"
};
// Advisory only: unknown domains are tolerated with a warning.
constexpr std::array<std::string_view, 11> domains = {
    "strategy", "marketing", "finance", "operations", "organization",
    "technology", "economics", "psychology", "healthcare", "supply_chain",
    "general"
};

namespace defaults {

constexpr std::string_view model_version = "1.0.0";
constexpr std::string_view domain = "general";

constexpr double domain_min = 0.0;
constexpr double domain_max = 1.0;
constexpr bool observed = true;

constexpr double edge_strength = 0.5;
constexpr double edge_confidence = 1.0;
constexpr double min_strength = -1.0;
constexpr double max_strength = 1.0;

constexpr std::string_view noise_distribution = "normal";
constexpr double noise_mean = 0.0;
constexpr double noise_std = 0.05;

constexpr int min_data_points = 20;
constexpr std::string_view license = "CC0-1.0-Universal";

} // namespace defaults

// Cycle enumeration stops after this many examples.
constexpr std::size_t max_reported_cycles = 3;

template <std::size_t N>
bool contains_label(const std::array<std::string_view, N>& labels, std::string_view label) {
    return std::find(labels.begin(), labels.end(), label) != labels.end();
}

// Label list for diagnostics, e.g. "{continuous, discrete, binary, categorical}".
template <std::size_t N>
std::string join_labels(const std::array<std::string_view, N>& labels) {
    std::string out = "{";
    for (std::size_t i = 0; i < N; ++i) {
        if (i > 0) out += ", ";
        out += labels[i];
    }
    out += "}";
    return out;
}

} // namespace format
} // namespace opencm_model
