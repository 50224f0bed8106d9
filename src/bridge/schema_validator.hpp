#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace bridge::schema {

// std::regex matching recurses per input character; longer strings are
// reported as violations instead of being matched against "pattern".
constexpr std::size_t kMaxPatternInputBytes = 2048;

// Structural problems that make `schema` unusable as a JSON Schema object.
// Empty when the schema is well formed.
std::vector<std::string> CheckSchema(const nlohmann::json& schema);

// Violations of `schema` by `instance`, each prefixed with a JSON pointer.
// Supports the draft 2020-12 validation keywords tool servers emit in practice;
// unknown keywords and "format" are ignored. "$ref" resolves local pointers.
std::vector<std::string> Validate(const nlohmann::json& instance, const nlohmann::json& schema);

// Throws SchemaValidationError listing every violation.
void ValidateOrThrow(const nlohmann::json& instance, const nlohmann::json& schema);

}  // namespace bridge::schema
