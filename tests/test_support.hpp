#pragma once

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <string>
#include <system_error>
#include <utility>

namespace opencm_test {

// The smallest valid document: two variables, one edge, no assumptions.
inline nlohmann::json minimal_document() {
    return nlohmann::json::parse(R"({
        "opencm_version": "1.0",
        "model": {"id": "m1", "name": "M"},
        "variables": {"a": {}, "b": {}},
        "edges": [{"source": "a", "target": "b", "strength": 0.7}]
    })");
}

// Document over `variables` with one causes-edge per (source, target) pair.
inline nlohmann::json graph_document(std::initializer_list<const char*> variables,
    std::initializer_list<std::pair<const char*, const char*>> edges,
    bool allow_cycles = false)
{
    nlohmann::json doc;
    doc["opencm_version"] = "1.0";
    doc["model"] = { { "id", "graph" }, { "name", "Graph" } };
    if (allow_cycles) doc["model"]["allow_cycles"] = true;
    doc["variables"] = nlohmann::json::object();
    for (const char* v : variables)
        doc["variables"][v] = nlohmann::json::object();
    doc["edges"] = nlohmann::json::array();
    for (const auto& [s, t] : edges)
        doc["edges"].push_back({ { "source", s }, { "target", t }, { "strength", 0.5 } });
    doc["assumptions"] = { "test graph" };
    return doc;
}

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string leaf = "opencm_test";
        if (info) leaf += std::string("_") + info->test_suite_name() + "_" + info->name();
        path_ = std::filesystem::temp_directory_path() / leaf;
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::string file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content) const {
        const std::string p = file(name);
        std::ofstream f(p);
        f << content;
        return p;
    }

private:
    std::filesystem::path path_;
};

} // namespace opencm_test
