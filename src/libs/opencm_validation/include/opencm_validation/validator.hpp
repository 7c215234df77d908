#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace opencm_validation {

// Errors block parsing; warnings are advisory and never gate it.
struct ValidationResult {
    bool ok = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;

    bool has_warnings() const { return !warnings.empty(); }
};

// Checks an OpenCM document (already decoded from JSON text) against the format rules:
//   1. required top-level fields (stops here if any is missing), version mismatch warning
//   2. model identity: id/name present, id pattern, unknown domain warning
//   3. variables: non-empty, known kind, domain is [min, max] with min < max
//   4. edges: endpoints declared, no self-loops, strength in [-1, 1], unknown kind warning
//   5. structural equations: declared targets, unknown kind warning
//   6. acyclicity unless model.allow_cycles (then a solver warning)
//   7. empty assumptions warning
// plus shape checks on every optional field, so a clean result can be parsed safely.
// Never throws; every call returns a fresh result.
ValidationResult validate(const nlohmann::json& raw);

} // namespace opencm_validation
