#pragma once
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>
#include "mcptools/tools/tool.hpp"
#include "mcptools/exceptions.hpp"

namespace mcptools::tools {

// Static tool registry. Filled once at startup, then only read; listing follows
// registration order.
class ToolManager {
 public:
  void register_tool(const Tool& t) {
    if (tools_.count(t.name())) throw ValidationError("duplicate tool name: " + t.name());
    order_.push_back(t.name());
    tools_[t.name()] = t;
  }

  bool has(const std::string& name) const { return tools_.count(name) != 0; }
  size_t size() const { return order_.size(); }

  const Tool& get(const std::string& name) const {
    auto it = tools_.find(name);
    if (it == tools_.end()) throw NotFoundError("tool not found: " + name);
    return it->second;
  }

  ToolResult invoke(const std::string& name, const Json& input) const {
    return get(name).invoke(input);
  }

  std::vector<std::string> list_names() const { return order_; }

  Json list_descriptors() const {
    Json out = Json::array();
    for (auto const& name : order_) out.push_back(tools_.at(name).descriptor());
    return out;
  }

  const Json& input_schema_for(const std::string& name) const { return get(name).input_schema(); }

  void apply_timeout(std::chrono::milliseconds timeout) {
    for (auto& kv : tools_) kv.second.set_timeout(timeout);
  }

 private:
  std::unordered_map<std::string, Tool> tools_;
  std::vector<std::string> order_;
};

} // namespace mcptools::tools
