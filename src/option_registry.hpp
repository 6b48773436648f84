#pragma once
/*
 * OptionRegistry
 *
 * Purpose: register and dispatch named options (rc file lines, --flags).
 * Design: map name → setter(value, err); the setter validates and stores.
 */
#include <functional>
#include <map>
#include <string>
#include <vector>

class OptionRegistry {
public:
  using Setter = std::function<bool(const std::string& value, std::string& err)>;
  void register_option(const std::string& name, Setter s) { map_[name] = std::move(s); }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  bool apply(const std::string& name, const std::string& value, std::string& err) const {
    auto it = map_.find(name);
    if (it == map_.end()) { err = "unknown option: " + name; return false; }
    return it->second(value, err);
  }
  std::vector<std::string> names() const {
    std::vector<std::string> out;
    for (const auto& kv : map_) out.push_back(kv.first);
    return out;
  }
private:
  std::map<std::string, Setter> map_;
};
