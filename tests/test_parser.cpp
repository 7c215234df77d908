#include <gtest/gtest.h>
#include <opencm_loaders/errors.hpp>
#include <opencm_loaders/json_loader.hpp>
#include "test_support.hpp"

using namespace opencm_loaders;
using namespace opencm_model;
using nlohmann::json;
using opencm_test::minimal_document;

TEST(ParserTest, MinimalDocumentGetsDefaults) {
    Model m = parse_model(minimal_document());

    EXPECT_EQ(m.id, "m1");
    EXPECT_EQ(m.name, "M");
    EXPECT_EQ(m.version, "1.0.0");
    EXPECT_EQ(m.domain, "general");
    EXPECT_TRUE(m.description.empty());
    EXPECT_FALSE(m.allow_cycles);
    EXPECT_TRUE(m.assumptions.empty());
    EXPECT_TRUE(m.equations.empty());
    EXPECT_FALSE(m.validation.has_value());
    EXPECT_FALSE(m.metadata.has_value());
    EXPECT_FALSE(m.origin.has_value());

    ASSERT_EQ(m.variables.size(), 2u);
    for (const char* name : { "a", "b" }) {
        const Variable& v = m.variables.at(name);
        EXPECT_EQ(v.name, name);
        EXPECT_EQ(v.kind, VariableKind::Continuous);
        EXPECT_DOUBLE_EQ(v.domain.first, 0.0);
        EXPECT_DOUBLE_EQ(v.domain.second, 1.0);
        EXPECT_TRUE(v.observed);
        EXPECT_TRUE(v.unit.empty());
    }

    ASSERT_EQ(m.edges.size(), 1u);
    const Edge& e = m.edges[0];
    EXPECT_EQ(e.source, "a");
    EXPECT_EQ(e.target, "b");
    EXPECT_EQ(e.kind, EdgeKind::Causes);
    EXPECT_DOUBLE_EQ(e.strength, 0.7);
    EXPECT_DOUBLE_EQ(e.confidence, 1.0);
    EXPECT_FALSE(e.is_learned);
}

TEST(ParserTest, EveryDeclaredFieldIsAdopted) {
    json doc = json::parse(R"json({
        "opencm_version": "1.0",
        "model": {"id": "pricing", "name": "Pricing", "version": "2.1.0", "domain": "marketing",
                  "description": "Price elasticity", "allow_cycles": true},
        "variables": {
            "price": {"type": "continuous", "domain": [0, 100], "unit": "$", "description": "List price",
                      "observed": true, "default_value": 20},
            "segment": {"type": "categorical", "categories": ["smb", "enterprise"], "observed": false}
        },
        "edges": [{"source": "price", "target": "segment", "type": "moderates", "strength": -0.4,
                   "description": "Price sorts customers", "confidence": 0.6, "is_learned": true}],
        "structural_equations": {
            "segment": {"type": "logistic", "expression": "1/(1+exp(-price))",
                        "noise_distribution": "bernoulli", "noise_params": {"p": 0.1}}
        },
        "assumptions": ["Stable demand"],
        "validation": {"min_data_points": 50, "required_variables": ["price"], "suggested_datasets": ["sales_q1"]},
        "metadata": {"author": "Ana", "tags": ["pricing"], "source_url": "https://example.org/m",
                     "created_at": "2026-01-02"}
    })json");

    Model m = parse_model(doc, std::string("models/pricing.opencm.json"));

    EXPECT_EQ(m.version, "2.1.0");
    EXPECT_EQ(m.domain, "marketing");
    EXPECT_EQ(m.description, "Price elasticity");
    EXPECT_TRUE(m.allow_cycles);
    EXPECT_EQ(m.origin, std::optional<std::string>("models/pricing.opencm.json"));

    const Variable& price = m.variables.at("price");
    EXPECT_DOUBLE_EQ(price.domain.second, 100.0);
    EXPECT_EQ(price.unit, "$");
    ASSERT_TRUE(price.default_value.has_value());
    EXPECT_DOUBLE_EQ(*price.default_value, 20.0);

    const Variable& segment = m.variables.at("segment");
    EXPECT_EQ(segment.kind, VariableKind::Categorical);
    EXPECT_FALSE(segment.observed);
    ASSERT_TRUE(segment.categories.has_value());
    EXPECT_EQ(*segment.categories, (std::vector<std::string>{ "smb", "enterprise" }));

    const Edge& e = m.edges.at(0);
    EXPECT_EQ(e.kind, EdgeKind::Moderates);
    EXPECT_DOUBLE_EQ(e.strength, -0.4);
    EXPECT_DOUBLE_EQ(e.confidence, 0.6);
    EXPECT_TRUE(e.is_learned);
    EXPECT_EQ(e.description, "Price sorts customers");

    const Equation& eq = m.equations.at("segment");
    EXPECT_EQ(eq.target, "segment");
    EXPECT_EQ(eq.kind, EquationKind::Logistic);
    EXPECT_EQ(eq.noise_distribution, "bernoulli");
    EXPECT_EQ(eq.noise_params, (NoiseParams{ { "p", 0.1 } }));

    ASSERT_TRUE(m.validation.has_value());
    EXPECT_EQ(m.validation->min_data_points, 50);
    EXPECT_EQ(m.validation->suggested_datasets, (std::vector<std::string>{ "sales_q1" }));

    ASSERT_TRUE(m.metadata.has_value());
    EXPECT_EQ(m.metadata->author, "Ana");
    EXPECT_EQ(m.metadata->license, "CC0-1.0-Universal");
    EXPECT_EQ(m.metadata->source_url, "https://example.org/m");
    EXPECT_EQ(m.metadata->created_at, "2026-01-02");
}

TEST(ParserTest, BareStringEquationIsLinearWithDefaultNoise) {
    json doc = minimal_document();
    doc["structural_equations"] = { { "b", "0.7*a" } };
    const Model m = parse_model(doc);
    const Equation& eq = m.equations.at("b");
    EXPECT_EQ(eq.kind, EquationKind::Linear);
    EXPECT_EQ(eq.expression, "0.7*a");
    EXPECT_EQ(eq.noise_distribution, "normal");
    EXPECT_EQ(eq.noise_params, default_noise_params());
    EXPECT_TRUE(eq.is_simple());
}

TEST(ParserTest, PartialEquationRecordDefaultsTheRest) {
    json doc = minimal_document();
    doc["structural_equations"]["b"] = { { "type", "polynomial" } };
    const Model m = parse_model(doc);
    const Equation& eq = m.equations.at("b");
    EXPECT_EQ(eq.kind, EquationKind::Polynomial);
    EXPECT_TRUE(eq.expression.empty());
    EXPECT_EQ(eq.noise_distribution, "normal");
    EXPECT_EQ(eq.noise_params, default_noise_params());
}

TEST(ParserTest, UnrecognizedKindsKeepTheirLabel) {
    json doc = minimal_document();
    doc["edges"][0]["type"] = "influences";
    doc["structural_equations"]["b"] = { { "type", "spline" }, { "expression", "a" } };
    Model m = parse_model(doc);
    EXPECT_EQ(m.edges[0].kind, EdgeKind::Unrecognized);
    EXPECT_EQ(m.edges[0].kind_name(), "influences");
    EXPECT_EQ(m.equations.at("b").kind, EquationKind::Unrecognized);
    EXPECT_EQ(m.equations.at("b").kind_name(), "spline");
}

TEST(ParserTest, EmptyValidationSectionIsAbsent) {
    json doc = minimal_document();
    doc["validation"] = json::object();
    doc["metadata"] = json::object();
    Model m = parse_model(doc);
    EXPECT_FALSE(m.validation.has_value());
    ASSERT_TRUE(m.metadata.has_value());
    EXPECT_EQ(m.metadata->license, "CC0-1.0-Universal");
}

TEST(ParserTest, NullFieldsAreTreatedAsAbsent) {
    json doc = minimal_document();
    doc["variables"]["a"]["domain"] = nullptr;
    doc["variables"]["a"]["default_value"] = nullptr;
    doc["edges"][0]["confidence"] = nullptr;
    Model m = parse_model(doc);
    EXPECT_DOUBLE_EQ(m.variables.at("a").domain.second, 1.0);
    EXPECT_FALSE(m.variables.at("a").default_value.has_value());
    EXPECT_DOUBLE_EQ(m.edges[0].confidence, 1.0);
}

TEST(ParserTest, WrongShapeIsMalformedInput) {
    json doc = minimal_document();
    doc["variables"]["a"]["unit"] = 5;
    EXPECT_THROW(parse_model(doc), MalformedInputError);

    json no_source = minimal_document();
    no_source["edges"][0].erase("source");
    EXPECT_THROW(parse_model(no_source), MalformedInputError);

    json bad_kind = minimal_document();
    bad_kind["variables"]["b"]["type"] = "fuzzy";
    EXPECT_THROW(parse_model(bad_kind), MalformedInputError);
}
