#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "bridge/errors.hpp"
#include "bridge/openapi.hpp"
#include "bridge/schema_validator.hpp"
#include "bridge/tool_descriptor.hpp"
#include "nlohmann/json.hpp"

namespace {

using nlohmann::json;

void Assert(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

bool Contains(const std::vector<std::string>& values, const std::string& needle) {
  for (const auto& value : values) {
    if (value.find(needle) != std::string::npos) {
      return true;
    }
  }
  return false;
}

const json kEchoSchema = {{"type", "object"},
                          {"properties", {{"text", {{"type", "string"}, {"minLength", 1}}}}},
                          {"required", {"text"}},
                          {"additionalProperties", false}};

void TestValidatorAcceptsAndRejects() {
  using bridge::schema::Validate;

  Assert(Validate({{"text", "hi"}}, kEchoSchema).empty(), "Valid body should pass");

  auto violations = Validate(json::object(), kEchoSchema);
  Assert(violations.size() == 1 && Contains(violations, "missing required property 'text'"),
         "Missing property should be reported");

  violations = Validate({{"text", 5}}, kEchoSchema);
  Assert(Contains(violations, "/text: expected string, got integer"),
         "Type mismatch should carry a JSON pointer");

  violations = Validate({{"text", "hi"}, {"extra", true}}, kEchoSchema);
  Assert(Contains(violations, "unexpected property 'extra'"),
         "additionalProperties false should reject extra members");

  violations = Validate({{"text", ""}}, kEchoSchema);
  Assert(Contains(violations, "shorter than 1"), "minLength should be enforced");
}

void TestValidatorKeywords() {
  using bridge::schema::Validate;

  const json numbers = {{"type", "object"},
                        {"properties",
                         {{"count", {{"type", "integer"}, {"minimum", 0}, {"maximum", 10}}},
                          {"step", {{"type", "number"}, {"multipleOf", 0.5}}},
                          {"mode", {{"enum", {"fast", "slow"}}}}}}};
  Assert(Validate({{"count", 3}, {"step", 1.5}, {"mode", "fast"}}, numbers).empty(),
         "Numbers within bounds should pass");
  Assert(Validate({{"count", 2.0}}, numbers).empty(), "Integral floats count as integers");
  Assert(!Validate({{"count", 11}}, numbers).empty(), "maximum should be enforced");
  Assert(!Validate({{"count", 1.5}}, numbers).empty(), "Fractions are not integers");
  Assert(!Validate({{"step", 0.3}}, numbers).empty(), "multipleOf should be enforced");
  Assert(!Validate({{"mode", "medium"}}, numbers).empty(), "enum should be enforced");

  const json arrays = {{"type", "array"},
                       {"items", {{"type", "string"}}},
                       {"minItems", 1},
                       {"uniqueItems", true}};
  Assert(Validate(json::array({"a", "b"}), arrays).empty(), "Unique strings should pass");
  Assert(!Validate(json::array(), arrays).empty(), "minItems should be enforced");
  Assert(!Validate(json::array({"a", "a"}), arrays).empty(), "uniqueItems should be enforced");
  Assert(Contains(Validate(json::array({"a", 1}), arrays), "/1: expected string"),
         "Item violations should point at the index");

  const json combinators = {
      {"oneOf", {{{"type", "string"}}, {{"type", "integer"}}}},
      {"not", {{"const", "forbidden"}}},
  };
  Assert(Validate("ok", combinators).empty(), "oneOf with one match should pass");
  Assert(!Validate(true, combinators).empty(), "oneOf with no match should fail");
  Assert(!Validate("forbidden", combinators).empty(), "not should be enforced");

  const json pattern = {{"type", "string"}, {"pattern", "^[a-z]+$"}};
  Assert(Validate("abc", pattern).empty(), "Matching pattern should pass");
  Assert(!Validate("ABC", pattern).empty(), "Pattern mismatch should fail");

  const json with_refs = {
      {"$defs", {{"point", {{"type", "object"}, {"required", {"x", "y"}}}}}},
      {"type", "object"},
      {"properties", {{"origin", {{"$ref", "#/$defs/point"}}}}},
  };
  Assert(Validate({{"origin", {{"x", 1}, {"y", 2}}}}, with_refs).empty(),
         "Local $ref should resolve");
  Assert(Contains(Validate({{"origin", {{"x", 1}}}}, with_refs), "missing required property 'y'"),
         "Local $ref should be validated");
}

void TestPatternOnLongStrings() {
  using bridge::schema::kMaxPatternInputBytes;
  using bridge::schema::Validate;

  const json schema = {{"type", "object"},
                       {"properties", {{"text", {{"type", "string"}, {"pattern", "^[a-z]+$"}}}}}};

  // HTTP workers run validation on their own threads, not on main's stack.
  std::vector<std::string> huge;
  std::vector<std::string> at_limit;
  std::vector<std::string> mismatch;
  std::thread worker([&] {
    huge = Validate({{"text", std::string(100000, 'a')}}, schema);
    at_limit = Validate({{"text", std::string(kMaxPatternInputBytes, 'a')}}, schema);
    mismatch = Validate({{"text", std::string(kMaxPatternInputBytes - 1, 'a') + "A"}}, schema);
  });
  worker.join();

  Assert(huge.size() == 1, "An overlong string yields exactly one violation");
  Assert(Contains(huge, "/text: string too long for pattern evaluation"),
         "Overlong strings are rejected without running the pattern");
  Assert(at_limit.empty(), "Strings up to the limit are matched normally");
  Assert(Contains(mismatch, "does not match pattern"), "Patterns still reject bad input");
  Assert(Validate({{"text", "abc"}}, schema).empty(), "Compiled patterns are reused");
}

void TestValidateOrThrow() {
  bool threw = false;
  try {
    bridge::schema::ValidateOrThrow(json::object(), kEchoSchema);
  } catch (const bridge::SchemaValidationError& ex) {
    threw = ex.kind() == bridge::ErrorKind::kSchemaValidation && ex.violations().size() == 1;
  }
  Assert(threw, "ValidateOrThrow should raise SchemaValidationError");
}

void TestCheckSchema() {
  using bridge::schema::CheckSchema;

  Assert(CheckSchema(kEchoSchema).empty(), "Well-formed schema should pass the check");
  Assert(CheckSchema({{"type", "object"}}).empty(), "Minimal object schema is valid");
  Assert(!CheckSchema("object").empty(), "Non-object schema must be rejected");
  Assert(Contains(CheckSchema({{"type", "obj"}}), "unknown type 'obj'"),
         "Unknown type names must be rejected");
  Assert(!CheckSchema({{"properties", {{"a", 5}}}}).empty(),
         "Non-schema property values must be rejected");
  Assert(!CheckSchema({{"required", "a"}}).empty(), "'required' must be an array");
  Assert(!CheckSchema({{"type", "string"}, {"pattern", "("}}).empty(),
         "Invalid regular expressions must be rejected");
  Assert(!CheckSchema({{"minLength", -1}}).empty(), "Negative lengths must be rejected");
}

void TestSanitizeToolName() {
  using bridge::openapi::SanitizeToolName;

  Assert(SanitizeToolName("get_time") == "get_time", "Safe names stay unchanged");
  Assert(SanitizeToolName("files.read-v2") == "files.read-v2", "Dots and dashes are safe");
  Assert(SanitizeToolName("search web") == "search_web", "Spaces become underscores");
  Assert(SanitizeToolName("a/b?c") == "a_b_c", "Path characters become underscores");
  Assert(SanitizeToolName("..").empty(), "Dot segments are rejected");
  Assert(SanitizeToolName("///").empty(), "Names without safe characters are rejected");
  Assert(SanitizeToolName("").empty(), "Empty names are rejected");
}

void TestSummaryFromName() {
  using bridge::openapi::SummaryFromName;

  Assert(SummaryFromName("get_current_time") == "Get Current Time", "Underscores split words");
  Assert(SummaryFromName("fetchURL") == "Fetchurl", "Title casing lowers inner letters");
  Assert(SummaryFromName("v2_api") == "V2 Api", "Digits end a word");
}

bridge::ToolList SampleTools() {
  auto echo = std::make_shared<bridge::ToolDescriptor>();
  echo->name = "echo";
  echo->description = "Returns its input";
  echo->input_schema = kEchoSchema;
  echo->output_schema = json{{"type", "object"}, {"properties", {{"text", {{"type", "string"}}}}}};
  echo->route_segment = "echo";

  auto search = std::make_shared<bridge::ToolDescriptor>();
  search->name = "web search";
  search->input_schema = {{"type", "object"}};
  search->annotations = json{{"readOnlyHint", true}};
  search->route_segment = "web_search";

  return {echo, search};
}

void TestOpenApiDocument() {
  bridge::ServerInfo server;
  server.name = "weather";
  server.version = "2.1.0";
  server.protocol_version = "2025-03-26";

  const auto tools = SampleTools();
  const json document = bridge::openapi::BuildOpenApiDocument(server, tools);

  Assert(document.at("openapi") == "3.1.0", "Document should be OpenAPI 3.1");
  Assert(document.at("info").at("title") == "weather", "Title comes from serverInfo");
  Assert(document.at("info").at("description") == "Weather MCP OpenAPI Proxy",
         "Description names the server");
  Assert(document.at("info").at("version") == "2.1.0", "Version comes from serverInfo");
  Assert(document.at("paths").size() == 2, "One path per tool");

  const json& echo = document.at("paths").at("/echo").at("post");
  Assert(echo.at("requestBody").at("content").at("application/json").at("schema") == kEchoSchema,
         "Request schema must be the input schema verbatim");
  Assert(echo.at("responses").at("200").at("content").at("application/json").at("schema") ==
             *tools[0]->output_schema,
         "200 schema must be the output schema");
  Assert(echo.at("responses").at("422").at("content").at("application/json").at("schema").at(
             "$ref") == "#/components/schemas/ErrorEnvelope",
         "Error responses reference the envelope");
  Assert(echo.at("summary") == "Echo", "Summary derives from the name");
  Assert(echo.at("operationId") == "echo", "operationId is the path segment");

  const json& search = document.at("paths").at("/web_search").at("post");
  Assert(search.at("x-mcp-tool-name") == "web search", "Original name is kept");
  Assert(search.at("x-mcp-annotations").at("readOnlyHint") == true, "Annotations pass through");
  Assert(search.at("responses").at("200").at("content").at("application/json").at("schema") ==
             json({{"type", "object"}, {"additionalProperties", true}}),
         "Tools without output schema get an open object");

  Assert(document.at("components").at("schemas").contains("ErrorEnvelope"),
         "Envelope schema must be published");
  Assert(document == bridge::openapi::BuildOpenApiDocument(server, tools),
         "Translation must be deterministic");

  const json anonymous = bridge::openapi::BuildOpenApiDocument(bridge::ServerInfo{}, {});
  Assert(anonymous.at("info").at("title") == "MCP OpenAPI Proxy", "Fallback title");
  Assert(anonymous.at("info").at("version") == "1.0", "Fallback version");
  Assert(anonymous.at("paths").empty(), "Empty catalog has no paths");
}

void RunTests() {
  TestValidatorAcceptsAndRejects();
  TestValidatorKeywords();
  TestPatternOnLongStrings();
  TestValidateOrThrow();
  TestCheckSchema();
  TestSanitizeToolName();
  TestSummaryFromName();
  TestOpenApiDocument();
}

}  // namespace

int main() {
  try {
    RunTests();
  } catch (const std::exception& ex) {
    std::cerr << "Schema test failure: " << ex.what() << std::endl;
    return 1;
  }
  return 0;
}
