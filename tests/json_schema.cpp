#include <cassert>
#include "mcptools/util/json_schema.hpp"

int main() {
  using namespace mcptools;
  Json schema = {
    {"type","object"},
    {"required", Json::array({"a","op"})},
    {"properties", {
      {"a", Json{{"type","integer"}}},
      {"op", Json{{"type","string"},{"enum", Json::array({"add","sub"})}}}
    }}
  };
  Json good{{"a",2},{"op","add"}};
  util::schema::validate(schema, good);

  bool failed = false;
  try { util::schema::validate(schema, Json{{"a","x"},{"op","add"}}); } catch (const ValidationError&) { failed = true; }
  assert(failed);

  failed = false;
  try { util::schema::validate(schema, Json{{"a",1}}); } catch (const ValidationError& e) {
    failed = std::string(e.what()) == "missing required: op";
  }
  assert(failed);

  failed = false;
  try { util::schema::validate(schema, Json{{"a",1},{"op","mul"}}); } catch (const ValidationError& e) {
    failed = std::string(e.what()).find("mul") != std::string::npos;
  }
  assert(failed);

  failed = false;
  try { util::schema::validate(schema, Json::array()); } catch (const ValidationError&) { failed = true; }
  assert(failed);
  return 0;
}
