#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include "mcptools/exceptions.hpp"
#include "mcptools/logging.hpp"
#include "mcptools/settings.hpp"

// Cross-platform setenv wrapper
static void set_env(const char* name, const char* value) {
#ifdef _WIN32
  _putenv_s(name, value);
#else
  setenv(name, value, 1);
#endif
}

int main() {
  using namespace mcptools;

  // Defaults
  Settings d;
  assert(d.log_level == "INFO");
  assert(d.tool_timeout_ms == 0);
  assert(!d.strict_input_validation);

  // JSON parse
  auto s = Settings::from_json(
      Json{{"log_level", "debug"}, {"tool_timeout_ms", 250}, {"strict_input_validation", true}});
  assert(s.log_level == "DEBUG");
  assert(s.tool_timeout_ms == 250);
  assert(s.strict_input_validation);

  bool threw = false;
  try { Settings::from_json(Json{{"tool_timeout_ms", "soon"}}); } catch (const ValidationError&) { threw = true; }
  assert(threw);

  threw = false;
  try { Settings::from_json(Json{{"tool_timeout_ms", -5}}); } catch (const ValidationError&) { threw = true; }
  assert(threw);

  // Env parse (set locally)
  set_env("MCPTOOLS_LOG_LEVEL", "warn");
  set_env("MCPTOOLS_TOOL_TIMEOUT_MS", "1500");
  set_env("MCPTOOLS_STRICT_INPUT_VALIDATION", "1");
  auto e = Settings::from_env();
  assert(e.log_level == "WARN"); // uppercased
  assert(e.tool_timeout_ms == 1500);
  assert(e.strict_input_validation);

  set_env("MCPTOOLS_TOOL_TIMEOUT_MS", "12abc");
  threw = false;
  try { Settings::from_env(); } catch (const ValidationError&) { threw = true; }
  assert(threw);
  set_env("MCPTOOLS_TOOL_TIMEOUT_MS", "0");

  // File parse
  const char* path = "mcptools_settings_test.json";
  {
    std::ofstream out(path);
    out << R"({"log_level":"error","tool_timeout_ms":10})";
  }
  auto f = Settings::from_file(path);
  assert(f.log_level == "ERROR");
  assert(f.tool_timeout_ms == 10);
  {
    std::ofstream out(path);
    out << "{broken";
  }
  threw = false;
  try { Settings::from_file(path); } catch (const ValidationError&) { threw = true; }
  assert(threw);
  std::remove(path);

  threw = false;
  try { Settings::from_file("does/not/exist/settings.json"); } catch (const ValidationError&) { threw = true; }
  assert(threw);

  // Log level names
  assert(logging::level_from_string("DEBUG") == spdlog::level::debug);
  assert(logging::level_from_string("Warning") == spdlog::level::warn);
  assert(logging::level_from_string("off") == spdlog::level::off);
  assert(logging::level_from_string("chatty") == spdlog::level::info);
  return 0;
}
