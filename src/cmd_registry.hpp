#pragma once
/*
 * CommandRegistry
 *
 * Purpose: register and dispatch Ex commands.
 * Design: map name → handler (args vector); Editor parses and routes.
 * Aliases share one handler (":wq" / ":x", ":undo" / ":u").
 * A handler returns false when the command ran but failed.
 */
#include <string>
#include <unordered_map>
#include <functional>
#include <initializer_list>
#include <vector>

class CommandRegistry {
public:
  using Handler = std::function<bool(const std::vector<std::string>&)>;
  void register_command(const std::string& name, Handler h) { map_[name] = std::move(h); }
  void register_command(std::initializer_list<std::string> names, const Handler& h) {
    for (const auto& n : names) map_[n] = h;
  }
  bool has(const std::string& name) const { return map_.count(name) != 0; }
  /* false when `name` is unknown; `ok` receives the handler's result */
  bool execute(const std::string& name, const std::vector<std::string>& args, bool& ok) const {
    auto it = map_.find(name);
    if (it == map_.end()) return false;
    ok = it->second(args);
    return true;
  }
private:
  std::unordered_map<std::string, Handler> map_;
};
