#include "bridge/schema_validator.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <regex>
#include <set>
#include <string_view>

#include "bridge/errors.hpp"

namespace bridge::schema {
namespace {

using nlohmann::json;

constexpr std::size_t kMaxViolations = 32;
constexpr int kMaxDepth = 64;
constexpr std::size_t kMaxCachedPatterns = 256;

// Patterns compiled once per process. Throws std::regex_error for a pattern
// std::regex cannot compile.
std::shared_ptr<const std::regex> CompiledPattern(const std::string& source) {
  static std::mutex cache_mutex;
  static std::map<std::string, std::shared_ptr<const std::regex>> cache;
  {
    std::lock_guard<std::mutex> lock(cache_mutex);
    if (const auto it = cache.find(source); it != cache.end()) {
      return it->second;
    }
  }
  auto compiled = std::make_shared<const std::regex>(source, std::regex::ECMAScript);
  std::lock_guard<std::mutex> lock(cache_mutex);
  if (cache.size() < kMaxCachedPatterns) {
    cache.emplace(source, compiled);
  }
  return compiled;
}

const std::set<std::string>& KnownTypes() {
  static const std::set<std::string> kTypes = {"object", "array",   "string", "number",
                                               "integer", "boolean", "null"};
  return kTypes;
}

std::string TypeOf(const json& value) {
  switch (value.type()) {
    case json::value_t::object:
      return "object";
    case json::value_t::array:
      return "array";
    case json::value_t::string:
      return "string";
    case json::value_t::boolean:
      return "boolean";
    case json::value_t::number_integer:
    case json::value_t::number_unsigned:
      return "integer";
    case json::value_t::number_float:
      return "number";
    default:
      return "null";
  }
}

bool MatchesType(const json& value, const std::string& type) {
  if (type == "integer") {
    if (value.is_number_integer()) {
      return true;
    }
    if (value.is_number_float()) {
      const double d = value.get<double>();
      return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
  }
  if (type == "number") {
    return value.is_number();
  }
  return TypeOf(value) == type;
}

std::size_t CodepointLength(const std::string& text) {
  std::size_t count = 0;
  for (unsigned char ch : text) {
    if ((ch & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

std::string ChildPointer(const std::string& parent, const std::string& token) {
  std::string escaped;
  for (char ch : token) {
    if (ch == '~') {
      escaped += "~0";
    } else if (ch == '/') {
      escaped += "~1";
    } else {
      escaped.push_back(ch);
    }
  }
  return parent + "/" + escaped;
}

std::string DisplayPointer(const std::string& pointer) { return pointer.empty() ? "/" : pointer; }

bool IsNonNegativeInteger(const json& value) {
  return (value.is_number_unsigned()) ||
         (value.is_number_integer() && value.get<std::int64_t>() >= 0);
}

class SchemaChecker {
 public:
  std::vector<std::string> Run(const json& schema) {
    if (!schema.is_object()) {
      problems_.push_back("input schema must be a JSON object");
      return problems_;
    }
    Check(schema, "", 0);
    return problems_;
  }

 private:
  void Problem(const std::string& where, const std::string& what) {
    problems_.push_back(DisplayPointer(where) + ": " + what);
  }

  void CheckSubschema(const json& schema, const std::string& where, int depth) {
    if (schema.is_boolean()) {
      return;
    }
    if (!schema.is_object()) {
      Problem(where, "subschema must be an object or boolean");
      return;
    }
    Check(schema, where, depth + 1);
  }

  void Check(const json& schema, const std::string& where, int depth) {
    if (depth > kMaxDepth) {
      Problem(where, "schema nesting is too deep");
      return;
    }

    if (const auto it = schema.find("type"); it != schema.end()) {
      if (it->is_string()) {
        if (KnownTypes().count(it->get<std::string>()) == 0) {
          Problem(where, "unknown type '" + it->get<std::string>() + "'");
        }
      } else if (it->is_array() && !it->empty()) {
        for (const auto& entry : *it) {
          if (!entry.is_string() || KnownTypes().count(entry.get<std::string>()) == 0) {
            Problem(where, "'type' array must hold known type names");
            break;
          }
        }
      } else {
        Problem(where, "'type' must be a string or a non-empty array");
      }
    }

    if (const auto it = schema.find("properties"); it != schema.end()) {
      if (!it->is_object()) {
        Problem(where, "'properties' must be an object");
      } else {
        for (const auto& [name, subschema] : it->items()) {
          CheckSubschema(subschema, ChildPointer(ChildPointer(where, "properties"), name), depth);
        }
      }
    }

    if (const auto it = schema.find("required"); it != schema.end()) {
      bool valid = it->is_array();
      if (valid) {
        for (const auto& entry : *it) {
          valid = valid && entry.is_string();
        }
      }
      if (!valid) {
        Problem(where, "'required' must be an array of strings");
      }
    }

    for (const char* keyword : {"additionalProperties", "items", "not", "contains",
                                "propertyNames"}) {
      if (const auto it = schema.find(keyword); it != schema.end()) {
        CheckSubschema(*it, ChildPointer(where, keyword), depth);
      }
    }

    for (const char* keyword : {"anyOf", "oneOf", "allOf", "prefixItems"}) {
      if (const auto it = schema.find(keyword); it != schema.end()) {
        if (!it->is_array() || it->empty()) {
          Problem(where, std::string{"'"} + keyword + "' must be a non-empty array");
          continue;
        }
        for (std::size_t i = 0; i < it->size(); ++i) {
          CheckSubschema(it->at(i), ChildPointer(ChildPointer(where, keyword), std::to_string(i)),
                         depth);
        }
      }
    }

    for (const char* keyword : {"$defs", "definitions"}) {
      if (const auto it = schema.find(keyword); it != schema.end()) {
        if (!it->is_object()) {
          Problem(where, std::string{"'"} + keyword + "' must be an object");
          continue;
        }
        for (const auto& [name, subschema] : it->items()) {
          CheckSubschema(subschema, ChildPointer(ChildPointer(where, keyword), name), depth);
        }
      }
    }

    if (const auto it = schema.find("enum"); it != schema.end() && !it->is_array()) {
      Problem(where, "'enum' must be an array");
    }

    for (const char* keyword : {"minimum", "maximum", "exclusiveMinimum", "exclusiveMaximum"}) {
      if (const auto it = schema.find(keyword); it != schema.end() && !it->is_number()) {
        Problem(where, std::string{"'"} + keyword + "' must be a number");
      }
    }
    if (const auto it = schema.find("multipleOf"); it != schema.end()) {
      if (!it->is_number() || it->get<double>() <= 0.0) {
        Problem(where, "'multipleOf' must be a positive number");
      }
    }

    for (const char* keyword : {"minLength", "maxLength", "minItems", "maxItems",
                                "minProperties", "maxProperties"}) {
      if (const auto it = schema.find(keyword); it != schema.end() && !IsNonNegativeInteger(*it)) {
        Problem(where, std::string{"'"} + keyword + "' must be a non-negative integer");
      }
    }

    if (const auto it = schema.find("pattern"); it != schema.end()) {
      if (!it->is_string()) {
        Problem(where, "'pattern' must be a string");
      } else {
        try {
          std::regex compiled(it->get<std::string>(), std::regex::ECMAScript);
        } catch (const std::regex_error& ex) {
          Problem(where, std::string{"'pattern' is not a valid regular expression: "} + ex.what());
        }
      }
    }

    if (const auto it = schema.find("$ref"); it != schema.end() && !it->is_string()) {
      Problem(where, "'$ref' must be a string");
    }
  }

  std::vector<std::string> problems_;
};

class InstanceValidator {
 public:
  explicit InstanceValidator(const json& root) : root_(root) {}

  std::vector<std::string> Run(const json& instance) {
    Validate(instance, root_, "", 0);
    return violations_;
  }

 private:
  bool Full() const { return violations_.size() >= kMaxViolations; }

  void Violation(const std::string& where, const std::string& what) {
    if (!Full()) {
      violations_.push_back(DisplayPointer(where) + ": " + what);
    }
  }

  bool Passes(const json& instance, const json& schema, int depth) {
    InstanceValidator nested(root_);
    nested.Validate(instance, schema, "", depth + 1);
    return nested.violations_.empty();
  }

  const json* ResolveRef(const std::string& ref) const {
    if (ref == "#") {
      return &root_;
    }
    if (ref.rfind("#/", 0) != 0) {
      return nullptr;
    }
    try {
      const json::json_pointer pointer(ref.substr(1));
      if (!root_.contains(pointer)) {
        return nullptr;
      }
      return &root_.at(pointer);
    } catch (const json::exception&) {
      return nullptr;
    }
  }

  void Validate(const json& instance, const json& schema, const std::string& where, int depth) {
    if (Full()) {
      return;
    }
    if (depth > kMaxDepth) {
      Violation(where, "schema recursion limit reached");
      return;
    }
    if (schema.is_boolean()) {
      if (!schema.get<bool>()) {
        Violation(where, "no value is allowed here");
      }
      return;
    }
    if (!schema.is_object()) {
      return;
    }

    if (const auto it = schema.find("$ref"); it != schema.end() && it->is_string()) {
      const json* target = ResolveRef(it->get<std::string>());
      if (target == nullptr) {
        Violation(where, "unresolvable $ref '" + it->get<std::string>() + "'");
      } else {
        Validate(instance, *target, where, depth + 1);
      }
    }

    if (!ValidateType(instance, schema, where)) {
      return;
    }

    if (const auto it = schema.find("enum"); it != schema.end() && it->is_array()) {
      bool found = false;
      for (const auto& candidate : *it) {
        found = found || candidate == instance;
      }
      if (!found) {
        Violation(where, "value is not one of " + it->dump());
      }
    }
    if (const auto it = schema.find("const"); it != schema.end() && *it != instance) {
      Violation(where, "value must equal " + it->dump());
    }

    if (instance.is_object()) {
      ValidateObject(instance, schema, where, depth);
    } else if (instance.is_array()) {
      ValidateArray(instance, schema, where, depth);
    } else if (instance.is_string()) {
      ValidateString(instance.get<std::string>(), schema, where);
    } else if (instance.is_number()) {
      ValidateNumber(instance.get<double>(), schema, where);
    }

    ValidateCombinators(instance, schema, where, depth);
  }

  bool ValidateType(const json& instance, const json& schema, const std::string& where) {
    const auto it = schema.find("type");
    if (it == schema.end()) {
      return true;
    }
    if (it->is_string()) {
      if (!MatchesType(instance, it->get<std::string>())) {
        Violation(where, "expected " + it->get<std::string>() + ", got " + TypeOf(instance));
        return false;
      }
      return true;
    }
    if (it->is_array()) {
      for (const auto& type : *it) {
        if (type.is_string() && MatchesType(instance, type.get<std::string>())) {
          return true;
        }
      }
      Violation(where, "expected one of " + it->dump() + ", got " + TypeOf(instance));
      return false;
    }
    return true;
  }

  void ValidateObject(const json& instance, const json& schema, const std::string& where,
                      int depth) {
    if (const auto it = schema.find("required"); it != schema.end() && it->is_array()) {
      for (const auto& name : *it) {
        if (name.is_string() && !instance.contains(name.get<std::string>())) {
          Violation(where, "missing required property '" + name.get<std::string>() + "'");
        }
      }
    }

    const auto properties = schema.find("properties");
    const bool has_properties = properties != schema.end() && properties->is_object();
    const auto additional = schema.find("additionalProperties");

    for (const auto& [name, value] : instance.items()) {
      const std::string child = ChildPointer(where, name);
      if (has_properties && properties->contains(name)) {
        Validate(value, properties->at(name), child, depth + 1);
        continue;
      }
      if (additional == schema.end()) {
        continue;
      }
      if (additional->is_boolean()) {
        if (!additional->get<bool>()) {
          Violation(where, "unexpected property '" + name + "'");
        }
      } else {
        Validate(value, *additional, child, depth + 1);
      }
    }

    if (const auto it = schema.find("propertyNames"); it != schema.end()) {
      for (const auto& [name, value] : instance.items()) {
        Validate(json(name), *it, ChildPointer(where, name), depth + 1);
      }
    }

    if (const auto it = schema.find("minProperties");
        it != schema.end() && IsNonNegativeInteger(*it) && instance.size() < it->get<std::size_t>()) {
      Violation(where, "expected at least " + it->dump() + " properties");
    }
    if (const auto it = schema.find("maxProperties");
        it != schema.end() && IsNonNegativeInteger(*it) && instance.size() > it->get<std::size_t>()) {
      Violation(where, "expected at most " + it->dump() + " properties");
    }
  }

  void ValidateArray(const json& instance, const json& schema, const std::string& where,
                     int depth) {
    std::size_t prefix = 0;
    if (const auto it = schema.find("prefixItems"); it != schema.end() && it->is_array()) {
      prefix = std::min(it->size(), instance.size());
      for (std::size_t i = 0; i < prefix; ++i) {
        Validate(instance.at(i), it->at(i), ChildPointer(where, std::to_string(i)), depth + 1);
      }
    }
    if (const auto it = schema.find("items"); it != schema.end()) {
      for (std::size_t i = prefix; i < instance.size(); ++i) {
        Validate(instance.at(i), *it, ChildPointer(where, std::to_string(i)), depth + 1);
      }
    }
    if (const auto it = schema.find("minItems");
        it != schema.end() && IsNonNegativeInteger(*it) && instance.size() < it->get<std::size_t>()) {
      Violation(where, "expected at least " + it->dump() + " items");
    }
    if (const auto it = schema.find("maxItems");
        it != schema.end() && IsNonNegativeInteger(*it) && instance.size() > it->get<std::size_t>()) {
      Violation(where, "expected at most " + it->dump() + " items");
    }
    if (const auto it = schema.find("uniqueItems");
        it != schema.end() && it->is_boolean() && it->get<bool>()) {
      for (std::size_t i = 0; i < instance.size(); ++i) {
        for (std::size_t j = i + 1; j < instance.size(); ++j) {
          if (instance.at(i) == instance.at(j)) {
            Violation(where, "items must be unique");
            return;
          }
        }
      }
    }
    if (const auto it = schema.find("contains"); it != schema.end()) {
      bool found = false;
      for (const auto& item : instance) {
        found = found || Passes(item, *it, depth);
      }
      if (!found) {
        Violation(where, "no item matches 'contains'");
      }
    }
  }

  void ValidateString(const std::string& value, const json& schema, const std::string& where) {
    const std::size_t length = CodepointLength(value);
    if (const auto it = schema.find("minLength");
        it != schema.end() && IsNonNegativeInteger(*it) && length < it->get<std::size_t>()) {
      Violation(where, "string shorter than " + it->dump() + " characters");
    }
    if (const auto it = schema.find("maxLength");
        it != schema.end() && IsNonNegativeInteger(*it) && length > it->get<std::size_t>()) {
      Violation(where, "string longer than " + it->dump() + " characters");
    }
    if (const auto it = schema.find("pattern"); it != schema.end() && it->is_string()) {
      if (value.size() > kMaxPatternInputBytes) {
        Violation(where, "string too long for pattern evaluation (more than " +
                             std::to_string(kMaxPatternInputBytes) + " bytes)");
        return;
      }
      try {
        if (!std::regex_search(value, *CompiledPattern(it->get<std::string>()))) {
          Violation(where, "string does not match pattern " + it->dump());
        }
      } catch (const std::regex_error&) {
        Violation(where, "pattern " + it->dump() + " cannot be evaluated");
      }
    }
  }

  void ValidateNumber(double value, const json& schema, const std::string& where) {
    if (const auto it = schema.find("minimum"); it != schema.end() && it->is_number() &&
                                                 value < it->get<double>()) {
      Violation(where, "value is below minimum " + it->dump());
    }
    if (const auto it = schema.find("maximum"); it != schema.end() && it->is_number() &&
                                                 value > it->get<double>()) {
      Violation(where, "value is above maximum " + it->dump());
    }
    if (const auto it = schema.find("exclusiveMinimum");
        it != schema.end() && it->is_number() && value <= it->get<double>()) {
      Violation(where, "value must be greater than " + it->dump());
    }
    if (const auto it = schema.find("exclusiveMaximum");
        it != schema.end() && it->is_number() && value >= it->get<double>()) {
      Violation(where, "value must be less than " + it->dump());
    }
    if (const auto it = schema.find("multipleOf"); it != schema.end() && it->is_number()) {
      const double divisor = it->get<double>();
      if (divisor > 0.0) {
        const double quotient = value / divisor;
        if (std::fabs(quotient - std::round(quotient)) > 1e-9) {
          Violation(where, "value is not a multiple of " + it->dump());
        }
      }
    }
  }

  void ValidateCombinators(const json& instance, const json& schema, const std::string& where,
                           int depth) {
    if (const auto it = schema.find("allOf"); it != schema.end() && it->is_array()) {
      for (const auto& subschema : *it) {
        Validate(instance, subschema, where, depth + 1);
      }
    }
    if (const auto it = schema.find("anyOf"); it != schema.end() && it->is_array()) {
      bool any = false;
      for (const auto& subschema : *it) {
        any = any || Passes(instance, subschema, depth);
      }
      if (!any) {
        Violation(where, "value matches none of 'anyOf'");
      }
    }
    if (const auto it = schema.find("oneOf"); it != schema.end() && it->is_array()) {
      std::size_t matches = 0;
      for (const auto& subschema : *it) {
        matches += Passes(instance, subschema, depth) ? 1 : 0;
      }
      if (matches != 1) {
        Violation(where, "value matches " + std::to_string(matches) +
                             " schemas of 'oneOf', expected exactly one");
      }
    }
    if (const auto it = schema.find("not"); it != schema.end() && Passes(instance, *it, depth)) {
      Violation(where, "value must not match 'not' schema");
    }
  }

  const json& root_;
  std::vector<std::string> violations_;
};

}  // namespace

std::vector<std::string> CheckSchema(const json& schema) { return SchemaChecker().Run(schema); }

std::vector<std::string> Validate(const json& instance, const json& schema) {
  return InstanceValidator(schema).Run(instance);
}

void ValidateOrThrow(const json& instance, const json& schema) {
  auto violations = Validate(instance, schema);
  if (!violations.empty()) {
    throw SchemaValidationError(std::move(violations));
  }
}

}  // namespace bridge::schema
