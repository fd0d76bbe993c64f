#include "editor.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <filesystem>
#include <glog/logging.h>

static std::string trim(const std::string& s) {
  auto isspace_fn = [](unsigned char c){ return std::isspace(c) != 0; };
  size_t i = 0; while (i < s.size() && isspace_fn((unsigned char)s[i])) i++;
  size_t j = s.size(); while (j > i && isspace_fn((unsigned char)s[j-1])) j--;
  return s.substr(i, j - i);
}

static bool all_digits(const std::string& s) {
  return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c){ return std::isdigit(c) != 0; });
}

void Editor::register_commands() {
  registry_.register_command("w", [this](const std::vector<std::string>& args){
    if (!args.empty()) return write_to(std::filesystem::path(args[0]));
    return write_to(doc_.file_path);
  });
  registry_.register_command("q", [this](const std::vector<std::string>&){
    if (doc_.modified) { message_ = "No write since last change (add ! to override)"; return false; }
    should_quit_ = true;
    return true;
  });
  registry_.register_command("q!", [this](const std::vector<std::string>&){ should_quit_ = true; return true; });
  registry_.register_command({"wq", "x"}, [this](const std::vector<std::string>& args){
    std::optional<std::filesystem::path> target = doc_.file_path;
    if (!args.empty()) target = std::filesystem::path(args[0]);
    // :x on an unchanged buffer only quits
    if (!doc_.modified && target && doc_.file_path == target) { should_quit_ = true; return true; }
    if (!write_to(target)) return false;
    should_quit_ = true;
    return true;
  });
  registry_.register_command({"e", "e!"}, [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "e: use :e <path>"; return false; }
    if (doc_.modified && !registry_force_) {
      message_ = "No write since last change (add ! to override)";
      return false;
    }
    return open(std::filesystem::path(args[0]));
  });
  registry_.register_command({"undo", "u"}, [this](const std::vector<std::string>&){ return undo(1); });
  registry_.register_command({"redo", "red"}, [this](const std::vector<std::string>&){ return redo(1); });
  registry_.register_command({"set", "se"}, [this](const std::vector<std::string>& args){
    if (args.empty()) { message_ = "set: use :set tabwidth=N|expandtab|autoindent|number|color"; return false; }
    bool ok = true;
    for (const auto& a : args) ok = set_option(a) && ok;
    return ok;
  });
}

bool Editor::set_option(const std::string& arg) {
  std::string name = arg, value;
  size_t eq = arg.find('=');
  if (eq != std::string::npos) { name = arg.substr(0, eq); value = arg.substr(eq + 1); }
  if (name == "tabwidth" || name == "tw" || name == "tabstop" || name == "ts") {
    if (!all_digits(value) || value.size() > 3) { message_ = "set tabwidth: width must be a number"; return false; }
    int w = std::stoi(value);
    if (w < 1) { message_ = "set tabwidth: width must be >= 1"; return false; }
    opts_.tab_width = w;
    message_ = "tabwidth=" + value;
    return true;
  }
  bool on = true;
  if (name.size() > 2 && name.compare(0, 2, "no") == 0) {
    on = false;
    name = name.substr(2);
  }
  if (!value.empty()) { message_ = "set " + name + ": takes no value"; return false; }
  if (name == "expandtab" || name == "et") opts_.expand_tab = on;
  else if (name == "autoindent" || name == "ai") opts_.auto_indent = on;
  else if (name == "number" || name == "nu") opts_.show_line_numbers = on;
  else if (name == "color") opts_.enable_color = on;
  else { message_ = "Unknown option: " + arg; return false; }
  message_ = (on ? "" : "no") + name;
  return true;
}

bool Editor::execute_command(const std::string& raw) {
  bool ok = run_command(raw);
  // :undo, :e! and friends edit without a key press
  sync_highlight();
  return ok;
}

bool Editor::run_command(const std::string& raw) {
  std::string line = trim(raw);
  if (!line.empty() && line[0] == ':') line = trim(line.substr(1));
  if (line.empty()) return true;
  if (all_digits(line)) {
    int n = line.size() > 9 ? doc_.buf.line_count() : std::stoi(line);
    move_to_line(std::max(1, n) - 1);
    return true;
  }
  std::istringstream iss(line);
  std::string name;
  iss >> name;
  std::vector<std::string> args;
  for (std::string a; iss >> a;) args.push_back(a);

  registry_force_ = name.size() > 1 && name.back() == '!';
  bool ok = false;
  bool found = registry_.execute(name, args, ok);
  registry_force_ = false;
  if (!found) {
    message_ = "Not an editor command: " + line;
    VLOG(1) << "unknown command: " << line;
    return false;
  }
  return ok;
}

bool Editor::write_to(const std::optional<std::filesystem::path>& path) {
  if (!path) { message_ = "No file name"; return false; }
  std::string msg;
  if (!doc_.buf.write_file(*path, msg)) { message_ = msg; return false; }
  if (!doc_.file_path) {
    doc_.file_path = *path;
    highlighter_.set_language(language_for_path(doc_.file_path));
  }
  if (doc_.file_path == path) doc_.modified = false;
  message_ = "\"" + path->string() + "\" " + std::to_string(doc_.buf.line_count()) + "L, " +
             std::to_string(doc_.buf.size()) + "B written";
  return true;
}

void Editor::reset_document() {
  doc_.um.clear();
  doc_.modified = false;
  cursors_ = CursorSet();
  input_.reset();
  mode_ = Mode::Normal;
  highlighter_.set_language(language_for_path(doc_.file_path));
  sync_highlight();
}

bool Editor::open(const std::filesystem::path& path) {
  std::string msg;
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    if (!doc_.buf.load_file(path, msg)) { message_ = msg; return false; }
  } else {
    doc_.buf.init_from_text("");
    msg = "new file: " + path.string();
    LOG(INFO) << msg;
  }
  doc_.file_path = path;
  reset_document();
  message_ = msg;
  return true;
}

void Editor::load_rc() {
  const char* home = std::getenv("HOME");
  if (!home) return;
  load_rc(std::filesystem::path(home) / ".glyphrc");
}

void Editor::load_rc(const std::filesystem::path& p) {
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::ifstream in(p);
  if (!in) { message_ = "can not open " + p.string(); LOG(WARNING) << message_; return; }
  int lineno = 0;
  for (std::string s; std::getline(in, s);) {
    ++lineno;
    s = trim(s);
    if (s.empty()) continue;
    if (s[0] == '#' || s[0] == '"') continue;
    if (!execute_command(s)) LOG(WARNING) << p.string() << ":" << lineno << ": " << message_;
  }
  LOG(INFO) << "loaded " << p.string();
}
